#pragma once
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "Config.hpp"
#include "agent/AnswerSynthesizer.hpp"
#include "agent/WorkflowOrchestrator.hpp"
#include "graph/GraphClient.hpp"
#include "memory/SimilarityCache.hpp"
#include "retrieval/WebRetriever.hpp"

namespace hybrid_agent {

using json = nlohmann::json;

struct ServerComponents {
    std::shared_ptr<WorkflowOrchestrator> orchestrator;
    std::shared_ptr<GraphClient> graph_client;
    std::shared_ptr<WebRetriever> web;
    std::shared_ptr<AnswerSynthesizer> synthesizer;
    std::shared_ptr<SimilarityCache> cache;
    std::string llm_model;
};

// REST surface over the orchestrator. Handler bodies are plain methods so
// they can be exercised without opening a socket.
class AgentServer {
public:
    static constexpr const char* VERSION = "2.0.0";

    AgentServer(AppConfig config, ServerComponents components);

    // Blocks until stop()
    bool run();
    void stop();

    // --- Handlers (status code returned through `status`) ---
    json root_info() const;
    json health_info() const;
    json status_info() const;
    json tools_info() const;
    json handle_query(const std::string& body, int& status) const;

    bool authorized(const std::string& authorization_header) const;
    static bool parse_basic_auth(const std::string& header, std::string& user, std::string& pass);

    static json error_body(const std::string& code, const std::string& message);

private:
    AppConfig config_;
    ServerComponents components_;
    httplib::Server server_;
    std::chrono::steady_clock::time_point started_at_;

    void setup_routes();
    bool require_auth(const httplib::Request& req, httplib::Response& res) const;
};

}
