#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

#include "graph/GraphClient.hpp"

namespace hybrid_agent {

Neo4jHttpClient::Neo4jHttpClient(std::string uri, std::string database,
                                 std::string username, std::string password,
                                 int connect_timeout_ms, int request_timeout_ms)
    : uri_(std::move(uri)),
      database_(std::move(database)),
      username_(std::move(username)),
      password_(std::move(password)),
      connect_timeout_ms_(connect_timeout_ms),
      request_timeout_ms_(request_timeout_ms) {
    while (!uri_.empty() && uri_.back() == '/') uri_.pop_back();
    check_connection();
}

std::string Neo4jHttpClient::commit_url() const {
    return uri_ + "/db/" + database_ + "/tx/commit";
}

void Neo4jHttpClient::check_connection() {
    try {
        auto rows = run("RETURN 1 AS test", json::object(), connect_timeout_ms_);
        if (!rows.empty() && rows[0].value("test", 0) == 1) {
            connected_ = true;
            spdlog::info("🕸️ Connected to Neo4j at {} (db: {})", uri_, database_);
        } else {
            connected_ = false;
            spdlog::warn("⚠️ Neo4j connection test returned no rows. Using fallback mode.");
        }
    } catch (const std::exception& e) {
        connected_ = false;
        spdlog::warn("⚠️ Neo4j not available: {} - Using fallback mode", e.what());
    }
}

std::vector<json> Neo4jHttpClient::run(const std::string& cypher, const json& params, int timeout_ms) {
    json payload = {
        {"statements", json::array({
            {{"statement", cypher}, {"parameters", params.is_object() ? params : json::object()}}
        })}
    };

    auto r = cpr::Post(cpr::Url{commit_url()},
                       cpr::Authentication{username_, password_, cpr::AuthMode::BASIC},
                       cpr::Body{payload.dump()},
                       cpr::Header{{"Content-Type", "application/json"}, {"Accept", "application/json"}},
                       cpr::ConnectTimeout{connect_timeout_ms_},
                       cpr::Timeout{timeout_ms});

    if (r.error.code != cpr::ErrorCode::OK) {
        throw GraphQueryError("transport error: " + r.error.message);
    }
    if (r.status_code < 200 || r.status_code >= 300) {
        throw GraphQueryError("HTTP " + std::to_string(r.status_code));
    }

    json body = json::parse(r.text, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw GraphQueryError("malformed response body");
    }

    const auto& errors = body.value("errors", json::array());
    if (!errors.empty()) {
        const auto& e = errors[0];
        throw GraphQueryError(e.value("code", "Neo.Unknown") + ": " + e.value("message", ""));
    }

    std::vector<json> rows;
    const auto& results = body.value("results", json::array());
    if (results.empty()) return rows;

    const auto& columns = results[0].value("columns", json::array());
    for (const auto& entry : results[0].value("data", json::array())) {
        const auto& values = entry.value("row", json::array());
        json row = json::object();
        for (size_t i = 0; i < columns.size() && i < values.size(); ++i) {
            row[columns[i].get<std::string>()] = values[i];
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<json> Neo4jHttpClient::execute(const std::string& cypher, const json& params) {
    if (!connected_.load()) return {};
    return run(cypher, params, request_timeout_ms_);
}

json Neo4jHttpClient::health() {
    if (!connected_.load()) {
        return {{"status", "disconnected"}, {"message", "Neo4j not available"}};
    }
    try {
        auto rows = run("CALL dbms.components() YIELD name, versions RETURN name, versions",
                        json::object(), request_timeout_ms_);
        std::string version = "unknown";
        if (!rows.empty() && rows[0].contains("versions") && rows[0]["versions"].is_array() &&
            !rows[0]["versions"].empty()) {
            version = rows[0]["versions"][0].get<std::string>();
        }
        return {{"status", "connected"}, {"message", "Neo4j is healthy"}, {"version", version}};
    } catch (const std::exception& e) {
        connected_ = false;
        spdlog::error("❌ Neo4j health check failed: {}", e.what());
        return {{"status", "error"}, {"message", std::string("Health check failed: ") + e.what()}};
    }
}

}
