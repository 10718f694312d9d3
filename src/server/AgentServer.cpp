#include <algorithm>
#include <ctime>
#include <spdlog/spdlog.h>

#include "server/AgentServer.hpp"
#include "LogManager.hpp"
#include "utils/TextUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace hybrid_agent {

namespace {

std::string utc_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf = utc_tm(now);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

void send_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

}

AgentServer::AgentServer(AppConfig config, ServerComponents components)
    : config_(std::move(config)),
      components_(std::move(components)),
      started_at_(std::chrono::steady_clock::now()) {
    if (!components_.orchestrator) throw std::invalid_argument("AgentServer requires an orchestrator");
    setup_routes();
}

json AgentServer::error_body(const std::string& code, const std::string& message) {
    return {{"status", "error"}, {"error", {{"code", code}, {"message", message}}}};
}

// --- AUTH ---

bool AgentServer::parse_basic_auth(const std::string& header, std::string& user, std::string& pass) {
    const std::string prefix = "Basic ";
    if (header.size() <= prefix.size() || header.compare(0, prefix.size(), prefix) != 0) return false;

    std::string decoded;
    if (!base64_decode(trim(header.substr(prefix.size())), decoded)) return false;

    size_t colon = decoded.find(':');
    if (colon == std::string::npos) return false;
    user = decoded.substr(0, colon);
    pass = decoded.substr(colon + 1);
    return true;
}

bool AgentServer::authorized(const std::string& authorization_header) const {
    std::string user, pass;
    if (!parse_basic_auth(authorization_header, user, pass)) return false;
    // Evaluate both comparisons regardless of the first result
    bool user_ok = constant_time_equals(user, config_.api_username);
    bool pass_ok = constant_time_equals(pass, config_.api_password);
    if (!(user_ok && pass_ok)) {
        spdlog::warn("🔒 Failed authentication attempt for user: {}", user);
        return false;
    }
    return true;
}

bool AgentServer::require_auth(const httplib::Request& req, httplib::Response& res) const {
    if (authorized(req.get_header_value("Authorization"))) return true;
    res.set_header("WWW-Authenticate", "Basic");
    send_json(res, 401, error_body("AUTH_FAILED", "Invalid credentials provided."));
    return false;
}

// --- HANDLERS ---

json AgentServer::root_info() const {
    bool graph_up = components_.graph_client && components_.graph_client->connected();
    bool llm_up = components_.synthesizer && components_.synthesizer->generator_available();
    bool search_up = components_.web && components_.web->available();

    return {
        {"message", "🚀 Hybrid retrieval agent API is running"},
        {"status", "active"},
        {"version", VERSION},
        {"services", {
            {"neo4j", graph_up ? "connected" : "fallback_mode"},
            {"workflow", "initialized"},
            {"llm", llm_up ? "available" : "fallback_mode"},
            {"search", search_up ? "available" : "mock_mode"},
            {"authentication", "enabled"}
        }},
        {"endpoints", {
            {"health", "/health"},
            {"status", "/status"},
            {"tools", "/tools"},
            {"agent_query", "/api/v1/agent/query"}
        }}
    };
}

json AgentServer::health_info() const {
    json graph_health = components_.graph_client
        ? components_.graph_client->health()
        : json{{"status", "disconnected"}, {"message", "Graph client not configured"}};
    bool llm_up = components_.synthesizer && components_.synthesizer->generator_available();

    json health = {
        {"status", "healthy"},
        {"service", "hybrid_agent"},
        {"version", VERSION},
        {"timestamp", utc_timestamp()},
        {"components", {
            {"api", "healthy"},
            {"authentication", "healthy"},
            {"neo4j", graph_health.value("status", "unknown")},
            {"workflow", "initialized"},
            {"llm", llm_up ? "available" : "fallback"},
            {"similarity_cache", components_.cache ? "ready" : "disabled"}
        }},
        {"details", {
            {"neo4j_message", graph_health.value("message", "Unknown")},
            {"neo4j_version", graph_health.value("version", "unknown")},
            {"cache_documents", components_.cache ? components_.cache->size() : 0}
        }}
    };

    auto missing = missing_configuration(config_);
    if (!missing.empty()) {
        health["config_warnings"] = missing;
        health["status"] = "degraded";
        if (!llm_up && std::find(missing.begin(), missing.end(), "GEMINI_API_KEY") != missing.end()) {
            health["components"]["llm"] = "unavailable";
        }
    }

    spdlog::info("🩺 Health status: {}", health["status"].get<std::string>());
    return health;
}

json AgentServer::status_info() const {
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_).count();
    bool graph_up = components_.graph_client && components_.graph_client->connected();
    bool llm_up = components_.synthesizer && components_.synthesizer->generator_available();
    bool search_up = components_.web && components_.web->available();
    auto& logs = LogManager::instance();

    return {
        {"system", {
            {"version", VERSION},
            {"uptime_seconds", uptime},
            {"config_source", config_.source_path.empty() ? "defaults" : config_.source_path}
        }},
        {"services", {
            {"neo4j", {
                {"connected", graph_up},
                {"uri", config_.neo4j_uri},
                {"database", config_.neo4j_database}
            }},
            {"llm", {
                {"available", llm_up},
                {"model", components_.llm_model},
                {"provider", "Google Generative AI"}
            }},
            {"tools", {
                {"graph_search", graph_up ? "available" : "fallback"},
                {"internet_search", search_up ? "available" : "config_required"},
                {"semantic_search", components_.cache ? "available" : "disabled"}
            }}
        }},
        {"metrics", {
            {"total_queries", logs.total_queries()},
            {"average_response_time_ms", logs.average_response_ms()},
            {"cache_documents", components_.cache ? components_.cache->size() : 0},
            {"cache_dimension", components_.cache ? components_.cache->dimension() : 0}
        }},
        {"recent_queries", logs.get_logs_json()},
        {"recent_steps", logs.get_traces_json()}
    };
}

json AgentServer::tools_info() const {
    bool graph_up = components_.graph_client && components_.graph_client->connected();
    bool search_up = components_.web && components_.web->available();

    json tools = json::array({
        {{"name", "search_knowledge_graph"},
         {"description", "Search the knowledge graph for concepts and their relationships"},
         {"available", true},
         {"mode", graph_up ? "live" : "fallback"}},
        {{"name", "get_related_concepts"},
         {"description", "Get concepts one relationship away from a named concept"},
         {"available", graph_up},
         {"mode", graph_up ? "live" : "unavailable"}},
        {{"name", "search_internet"},
         {"description", "Search the web for current information"},
         {"available", true},
         {"mode", search_up ? "live" : "mock"}},
        {{"name", "search_news"},
         {"description", "Search recent news articles"},
         {"available", true},
         {"mode", search_up ? "live" : "mock"}},
        {{"name", "semantic_search"},
         {"description", "Search previously fetched documents by embedding similarity"},
         {"available", components_.cache != nullptr},
         {"mode", components_.cache ? "live" : "disabled"}}
    });

    return {{"status", "success"}, {"tools", tools}, {"count", tools.size()}};
}

json AgentServer::handle_query(const std::string& body, int& status) const {
    json request = json::parse(scrub_json_string(body), nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        spdlog::error("❌ JSON Error. Body length: {}", body.length());
        status = 400;
        return error_body("INVALID_REQUEST", "Request body must be a JSON object");
    }

    auto q = request.find("query");
    if (q == request.end() || !q->is_string()) {
        status = 400;
        return error_body("INVALID_REQUEST", "Field 'query' is required and must be a string");
    }

    json options = request.value("options", json::object());
    json context = request.value("context", json::object());
    if (context.is_null()) context = json::object();
    if (!context.is_object()) {
        status = 400;
        return error_body("INVALID_REQUEST", "Field 'context' must be an object");
    }

    try {
        spdlog::info("🎯 Agent query: {}", utf8_truncate(q->get<std::string>(), 100));
        auto response = components_.orchestrator->process_query(q->get<std::string>(), options, context);
        status = response.http_status();
        return response.to_json();
    } catch (const std::exception& e) {
        spdlog::error("💥 Endpoint error: {}", e.what());
        status = 500;
        return error_body("INTERNAL_ERROR", "Internal server error occurred while processing your request.");
    }
}

// --- ROUTES ---

void AgentServer::setup_routes() {
    server_.set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Authorization, Content-Type"}
    });

    server_.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        send_json(res, 500, error_body("INTERNAL_ERROR", "An unexpected error occurred"));
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            spdlog::error("💥 Unhandled exception on {} {}: {}", req.method, req.path, e.what());
        }
    });

    server_.Get("/", [this](const httplib::Request&, httplib::Response& res) {
        send_json(res, 200, root_info());
    });

    server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        send_json(res, 200, health_info());
    });

    server_.Get("/status", [this](const httplib::Request& req, httplib::Response& res) {
        if (!require_auth(req, res)) return;
        send_json(res, 200, status_info());
    });

    server_.Get("/tools", [this](const httplib::Request& req, httplib::Response& res) {
        if (!require_auth(req, res)) return;
        send_json(res, 200, tools_info());
    });

    server_.Post("/api/v1/agent/query", [this](const httplib::Request& req, httplib::Response& res) {
        if (!require_auth(req, res)) return;
        int status = 200;
        json body = handle_query(req.body, status);
        send_json(res, status, body);
    });
}

bool AgentServer::run() {
    spdlog::info("🚀 REST server listening on {}:{}", config_.host, config_.port);
    bool ok = server_.listen(config_.host, config_.port);
    if (!ok) spdlog::error("❌ Failed to bind {}:{}", config_.host, config_.port);
    return ok;
}

void AgentServer::stop() {
    server_.stop();
}

}
