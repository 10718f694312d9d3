#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hybrid_agent {

struct AppConfig {
    std::string host = "0.0.0.0";
    int port = 8000;

    std::string api_username = "agent";
    std::string api_password = "secret";

    std::string neo4j_uri = "http://localhost:7474";
    std::string neo4j_database = "neo4j";
    std::string neo4j_username = "neo4j";
    std::string neo4j_password = "password";

    std::string tavily_api_key;

    std::vector<std::string> gemini_keys;
    std::vector<std::string> gemini_models = {"gemini-2.5-flash"};
    std::string embedding_model = "text-embedding-004";

    std::string embedding_provider = "auto"; // auto | gemini | hashing
    int embedding_dimension = 384;           // hashing provider only

    std::string cache_path = "vector_store/similarity_cache.bin";
    int cache_persist_every = 5;

    int request_timeout_ms = 30000;
    int graph_connect_timeout_ms = 10000;

    std::string log_file = "logs/agent.log";
    std::string log_level = "info";
    std::string query_log_path = "data/logs.json";

    std::string source_path; // file the values came from, empty for defaults
};

// Applies the recognised keys of `j` on top of `config`
void apply_config_json(AppConfig& config, const nlohmann::json& j);

// Environment overrides (API_USER, NEO4J_URI, TAVILY_API_KEY, ...)
void apply_env_overrides(AppConfig& config);

// Search paths -> file -> environment. Never throws.
AppConfig load_config();

// Names of expected-but-absent settings, for startup warnings and /health
std::vector<std::string> missing_configuration(const AppConfig& config);

}
