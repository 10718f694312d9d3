#include "Config.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace hybrid_agent {

using json = nlohmann::json;

namespace {

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t b = item.find_first_not_of(" \t");
        size_t e = item.find_last_not_of(" \t");
        if (b != std::string::npos) out.push_back(item.substr(b, e - b + 1));
    }
    return out;
}

}

void apply_config_json(AppConfig& c, const json& j) {
    if (!j.is_object()) return;

    if (j.contains("server")) {
        const auto& s = j["server"];
        c.host = s.value("host", c.host);
        c.port = s.value("port", c.port);
    }
    if (j.contains("auth")) {
        const auto& a = j["auth"];
        c.api_username = a.value("username", c.api_username);
        c.api_password = a.value("password", c.api_password);
    }
    if (j.contains("neo4j")) {
        const auto& n = j["neo4j"];
        c.neo4j_uri = n.value("uri", c.neo4j_uri);
        c.neo4j_database = n.value("database", c.neo4j_database);
        c.neo4j_username = n.value("username", c.neo4j_username);
        c.neo4j_password = n.value("password", c.neo4j_password);
        c.graph_connect_timeout_ms = n.value("connect_timeout_ms", c.graph_connect_timeout_ms);
    }
    if (j.contains("tavily")) {
        c.tavily_api_key = j["tavily"].value("api_key", c.tavily_api_key);
    }
    if (j.contains("gemini")) {
        const auto& g = j["gemini"];
        if (g.contains("keys") && g["keys"].is_array()) {
            c.gemini_keys = g["keys"].get<std::vector<std::string>>();
        }
        if (g.contains("models") && g["models"].is_array() && !g["models"].empty()) {
            c.gemini_models = g["models"].get<std::vector<std::string>>();
        }
        c.embedding_model = g.value("embedding_model", c.embedding_model);
    }
    if (j.contains("embedding")) {
        const auto& e = j["embedding"];
        c.embedding_provider = e.value("provider", c.embedding_provider);
        c.embedding_dimension = e.value("dimension", c.embedding_dimension);
    }
    if (j.contains("cache")) {
        const auto& ca = j["cache"];
        c.cache_path = ca.value("path", c.cache_path);
        c.cache_persist_every = ca.value("persist_every", c.cache_persist_every);
    }
    c.request_timeout_ms = j.value("request_timeout_ms", c.request_timeout_ms);
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        c.log_file = l.value("file", c.log_file);
        c.log_level = l.value("level", c.log_level);
        c.query_log_path = l.value("query_log", c.query_log_path);
    }
}

void apply_env_overrides(AppConfig& c) {
    if (auto v = env("API_USER")) c.api_username = v;
    if (auto v = env("API_PASS")) c.api_password = v;
    if (auto v = env("NEO4J_URI")) c.neo4j_uri = v;
    if (auto v = env("NEO4J_USER")) c.neo4j_username = v;
    if (auto v = env("NEO4J_PASSWORD")) c.neo4j_password = v;
    if (auto v = env("NEO4J_DATABASE")) c.neo4j_database = v;
    if (auto v = env("TAVILY_API_KEY")) c.tavily_api_key = v;
    if (auto v = env("GEMINI_API_KEY")) c.gemini_keys = split_csv(v);
    if (auto v = env("HYBRID_AGENT_CACHE_PATH")) c.cache_path = v;
    if (auto v = env("HYBRID_AGENT_LOG_LEVEL")) c.log_level = v;
    if (auto v = env("HYBRID_AGENT_PORT")) {
        try {
            c.port = std::stoi(v);
        } catch (const std::exception&) {
            spdlog::warn("⚠️ Ignoring invalid HYBRID_AGENT_PORT '{}'", v);
        }
    }
}

AppConfig load_config() {
    AppConfig config;

    std::vector<std::string> search_paths = {"config.json", "../config.json", "build/config.json"};
    if (auto explicit_path = env("HYBRID_AGENT_CONFIG")) search_paths = {explicit_path};

    std::ifstream f;
    std::string found;
    for (const auto& path : search_paths) {
        f.open(path);
        if (f.is_open()) { found = path; break; }
        f.clear();
    }

    if (found.empty()) {
        spdlog::warn("⚠️ config.json not found. Using defaults + environment.");
    } else {
        try {
            auto j = json::parse(f);
            apply_config_json(config, j);
            config.source_path = found;
            spdlog::info("🛰️ Configuration loaded from {}", found);
        } catch (const std::exception& e) {
            spdlog::error("💥 Failed to parse {}: {}. Using defaults.", found, e.what());
            config = AppConfig{};
        }
    }

    apply_env_overrides(config);
    return config;
}

std::vector<std::string> missing_configuration(const AppConfig& config) {
    std::vector<std::string> missing;
    if (config.tavily_api_key.empty()) missing.push_back("TAVILY_API_KEY");
    if (config.gemini_keys.empty()) missing.push_back("GEMINI_API_KEY");
    if (config.neo4j_password.empty() || config.neo4j_password == "your_neo4j_password_here") {
        missing.push_back("NEO4J_PASSWORD");
    }
    return missing;
}

}
