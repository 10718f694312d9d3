#pragma once
#include <string>
#include <memory>
#include <atomic>
#include <optional>
#include <nlohmann/json.hpp>

#include "agent/AnswerSynthesizer.hpp"
#include "core/RunState.hpp"
#include "memory/SimilarityCache.hpp"
#include "retrieval/GraphRetriever.hpp"
#include "retrieval/WebRetriever.hpp"

namespace hybrid_agent {

using json = nlohmann::json;

enum class ErrorCode { NONE, INVALID_REQUEST, PROCESSING_ERROR, INTERNAL_ERROR };

inline std::string error_code_to_string(ErrorCode c) {
    switch (c) {
        case ErrorCode::NONE: return "";
        case ErrorCode::INVALID_REQUEST: return "INVALID_REQUEST";
        case ErrorCode::PROCESSING_ERROR: return "PROCESSING_ERROR";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

struct QueryResponse {
    ErrorCode error = ErrorCode::NONE;
    std::string error_message;

    std::string query_id;
    std::string answer;
    json sources = json::array();
    json structured_output = json::object();
    json context = json::object();

    bool ok() const { return error == ErrorCode::NONE; }

    int http_status() const {
        if (ok()) return 200;
        return error == ErrorCode::INVALID_REQUEST ? 400 : 500;
    }

    static QueryResponse failure(ErrorCode code, std::string message) {
        QueryResponse r;
        r.error = code;
        r.error_message = std::move(message);
        return r;
    }

    json to_json() const {
        if (!ok()) {
            return {
                {"status", "error"},
                {"error", {{"code", error_code_to_string(error)}, {"message", error_message}}}
            };
        }
        json j = {
            {"status", "success"},
            {"response", {
                {"answer", answer},
                {"sources", sources},
                {"structured_output", structured_output}
            }}
        };
        if (context.is_object() && !context.empty()) j["context"] = context;
        return j;
    }
};

// Fixed retrieval state machine:
// route -> analyze -> search_graph -> search_internet -> generate -> format -> done
class WorkflowOrchestrator {
public:
    static constexpr int MAX_RESULTS_LIMIT = 50;

    // cache may be null (no semantic recall)
    WorkflowOrchestrator(std::shared_ptr<GraphRetriever> graph,
                         std::shared_ptr<WebRetriever> web,
                         std::shared_ptr<SimilarityCache> cache,
                         std::shared_ptr<AnswerSynthesizer> synthesizer);

    // Validates input, runs the machine, and converts unexpected faults to PROCESSING_ERROR
    QueryResponse process_query(const std::string& query,
                                const json& options = json::object(),
                                const json& context = json::object());

    // Drives `state` from route to done
    void run(RunState& state, const std::string& query_id = "");

    void execute_step(Step step, RunState& state);

    // Option-driven edge, ignoring the iteration guard
    static Step transition(Step current, const QueryOptions& options);

    // transition() plus the guard: a non-terminal step due at iterations >= MAX_ITERATIONS becomes GENERATE
    static Step next_step(Step current, const RunState& state);

    // Error message on invalid options, nullopt on success
    static std::optional<std::string> parse_options(const json& j, QueryOptions& out);

private:
    std::shared_ptr<GraphRetriever> graph_;
    std::shared_ptr<WebRetriever> web_;
    std::shared_ptr<SimilarityCache> cache_;
    std::shared_ptr<AnswerSynthesizer> synthesizer_;
    std::atomic<unsigned long long> query_counter_{0};

    void do_route(RunState& state);
    void do_analyze(RunState& state);
    void do_search_graph(RunState& state);
    void do_search_internet(RunState& state);
    void do_generate(RunState& state);
    void do_format(RunState& state);

    std::string next_query_id();
};

}
