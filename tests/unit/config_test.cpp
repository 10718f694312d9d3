#include <catch2/catch_test_macros.hpp>

#include <algorithm>

#include "Config.hpp"
#include "Logging.hpp"
#include "KeyManager.hpp"

using namespace hybrid_agent;

namespace {

bool has(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

TEST_CASE("Config JSON overlays defaults", "[config]") {
    AppConfig config;

    SECTION("Nested sections") {
        nlohmann::json j = {
            {"server", {{"port", 9000}}},
            {"auth", {{"username", "ops"}, {"password", "hunter2"}}},
            {"neo4j", {{"uri", "http://graph:7474"}, {"connect_timeout_ms", 2500}}},
            {"tavily", {{"api_key", "tvly-123"}}},
            {"gemini", {{"keys", {"k1", "k2"}}, {"models", {"gemini-pro"}}}},
            {"embedding", {{"provider", "hashing"}, {"dimension", 256}}},
            {"cache", {{"path", "/tmp/c.bin"}, {"persist_every", 10}}},
            {"request_timeout_ms", 12000},
            {"logging", {{"level", "debug"}}}
        };
        apply_config_json(config, j);

        CHECK(config.port == 9000);
        CHECK(config.host == "0.0.0.0");
        CHECK(config.api_username == "ops");
        CHECK(config.api_password == "hunter2");
        CHECK(config.neo4j_uri == "http://graph:7474");
        CHECK(config.neo4j_database == "neo4j");
        CHECK(config.graph_connect_timeout_ms == 2500);
        CHECK(config.tavily_api_key == "tvly-123");
        CHECK(config.gemini_keys == std::vector<std::string>{"k1", "k2"});
        CHECK(config.gemini_models == std::vector<std::string>{"gemini-pro"});
        CHECK(config.embedding_provider == "hashing");
        CHECK(config.embedding_dimension == 256);
        CHECK(config.cache_path == "/tmp/c.bin");
        CHECK(config.cache_persist_every == 10);
        CHECK(config.request_timeout_ms == 12000);
        CHECK(config.log_level == "debug");
        CHECK(config.log_file == "logs/agent.log");
    }

    SECTION("Empty model list keeps the default model") {
        apply_config_json(config, {{"gemini", {{"models", nlohmann::json::array()}}}});
        CHECK(config.gemini_models == std::vector<std::string>{"gemini-2.5-flash"});
    }

    SECTION("Non-object input is ignored") {
        apply_config_json(config, nlohmann::json::array({1, 2}));
        CHECK(config.port == 8000);
    }
}

TEST_CASE("Missing configuration report", "[config]") {
    AppConfig config;
    config.neo4j_password = "";

    auto missing = missing_configuration(config);
    CHECK(has(missing, "TAVILY_API_KEY"));
    CHECK(has(missing, "GEMINI_API_KEY"));
    CHECK(has(missing, "NEO4J_PASSWORD"));

    config.tavily_api_key = "t";
    config.gemini_keys = {"g"};
    config.neo4j_password = "real";
    CHECK(missing_configuration(config).empty());

    config.neo4j_password = "your_neo4j_password_here";
    CHECK(missing_configuration(config) == std::vector<std::string>{"NEO4J_PASSWORD"});
}

TEST_CASE("Key pool rotation", "[config][keys]") {
    SECTION("Empty pool") {
        KeyManager keys({}, {});
        CHECK_FALSE(keys.has_keys());
        CHECK(keys.get_current_key().empty());
        CHECK(keys.get_current_model().empty());
        keys.report_rate_limit();
    }

    SECTION("Blank keys are dropped, default model supplied") {
        KeyManager keys({"a", "", "b"}, {});
        CHECK(keys.get_total_keys() == 2);
        CHECK(keys.get_current_model() == "gemini-2.5-flash");
    }

    SECTION("Rate limits decommission keys, then revive the pool") {
        KeyManager keys({"k0", "k1"}, {"m0", "m1"});
        CHECK(keys.get_current_key() == "k0");

        for (int i = 0; i < 5; ++i) keys.report_rate_limit();
        CHECK(keys.get_active_key_count() == 1);
        CHECK(keys.get_current_key() == "k1");

        keys.report_rate_limit();
        CHECK(keys.get_active_key_count() == 2);
    }

    SECTION("A failed attempt advances exactly one key") {
        KeyManager keys({"k0", "k1", "k2"}, {"m0"});
        keys.report_retryable_status(429);
        CHECK(keys.get_current_key() == "k1");
        keys.report_retryable_status(503);
        CHECK(keys.get_current_key() == "k2");
        CHECK(keys.get_active_key_count() == 3);
    }

    SECTION("Unknown model falls back to the next one and wraps") {
        KeyManager keys({"k0"}, {"m0", "m1"});
        CHECK(keys.get_total_models() == 2);
        CHECK(keys.fall_back_model());
        CHECK(keys.get_current_model() == "m1");
        CHECK(keys.fall_back_model());
        CHECK(keys.get_current_model() == "m0");
    }

    SECTION("A single model has nothing to fall back to") {
        KeyManager keys({"k0"}, {"m0"});
        CHECK_FALSE(keys.fall_back_model());
        CHECK(keys.get_current_model() == "m0");
    }
}

TEST_CASE("Log level names", "[config][logging]") {
    bool known = false;

    CHECK(parse_log_level("debug", known) == spdlog::level::debug);
    CHECK(known);
    CHECK(parse_log_level(" WARN ", known) == spdlog::level::warn);
    CHECK(known);
    CHECK(parse_log_level("off", known) == spdlog::level::off);
    CHECK(known);

    CHECK(parse_log_level("verbose", known) == spdlog::level::info);
    CHECK_FALSE(known);
    CHECK(parse_log_level("", known) == spdlog::level::info);
    CHECK_FALSE(known);
}
