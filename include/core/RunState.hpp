#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "core/Document.hpp"

namespace hybrid_agent {

constexpr int MAX_ITERATIONS = 5;

struct QueryOptions {
    bool use_graph = true;
    bool use_internet = true;
    int max_results = 5;

    nlohmann::json to_json() const {
        return {{"use_graph", use_graph}, {"use_internet", use_internet}, {"max_results", max_results}};
    }
};

enum class Step {
    ROUTE,
    ANALYZE,
    SEARCH_GRAPH,
    SEARCH_INTERNET,
    GENERATE,
    FORMAT,
    DONE
};

inline std::string step_to_string(Step s) {
    switch (s) {
        case Step::ROUTE: return "route_query";
        case Step::ANALYZE: return "analyze_query";
        case Step::SEARCH_GRAPH: return "search_graph";
        case Step::SEARCH_INTERNET: return "search_internet";
        case Step::GENERATE: return "generate_answer";
        case Step::FORMAT: return "format_answer";
        case Step::DONE: return "done";
    }
    return "done";
}

// Terminal steps do not count as orchestration cycles
inline bool is_terminal_step(Step s) {
    return s == Step::GENERATE || s == Step::FORMAT || s == Step::DONE;
}

struct QueryAnalysis {
    std::string intent = "information_request";
    std::string complexity = "medium";
    bool needs_facts = true;
    bool needs_current_info = false;
    std::vector<std::string> expected_sources = {"graph"};

    nlohmann::json to_json() const {
        return {
            {"intent", intent},
            {"complexity", complexity},
            {"needs_facts", needs_facts},
            {"needs_current_info", needs_current_info},
            {"expected_sources", expected_sources}
        };
    }
};

struct RoutePlan {
    bool graph_scheduled = false;
    bool internet_scheduled = false;

    std::vector<std::string> step_names() const {
        std::vector<std::string> steps = {"analyze_query"};
        if (graph_scheduled) steps.push_back("search_graph");
        if (internet_scheduled) steps.push_back("search_internet");
        steps.push_back("generate_answer");
        return steps;
    }
};

// Per-query accumulator. Owned by one process_query call, never shared.
struct RunState {
    const std::string query;
    const QueryOptions options;
    nlohmann::json context = nlohmann::json::object();

    std::vector<std::string> completed_steps;
    std::vector<Document> documents;
    std::vector<std::string> reasoning_trace;
    int iterations = 0;
    std::optional<Step> next_step;
    std::optional<std::string> last_error;

    QueryAnalysis analysis;
    RoutePlan route;
    size_t graph_count = 0;
    size_t internet_count = 0;
    size_t semantic_count = 0;

    bool should_continue = true;
    bool max_iterations_reached = false;

    // Terminal fields, written by the synthesizer / format step only
    std::string final_answer;
    std::vector<std::string> key_points;
    std::string summary;
    nlohmann::json sources = nlohmann::json::array();
    nlohmann::json structured_output = nlohmann::json::object();

    RunState(std::string q, QueryOptions opts)
        : query(std::move(q)), options(opts) {}
};

}
