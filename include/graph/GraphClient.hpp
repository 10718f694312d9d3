#pragma once
#include <atomic>
#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace hybrid_agent {

using json = nlohmann::json;

class GraphQueryError : public std::runtime_error {
public:
    explicit GraphQueryError(const std::string& msg) : std::runtime_error(msg) {}
};

// Parameterised Cypher access. Connectivity is checked once and cached.
class GraphClient {
public:
    virtual ~GraphClient() = default;

    virtual bool connected() const = 0;

    // Rows keyed by column name. Empty (no throw) when disconnected;
    // GraphQueryError when a connected backend fails the query.
    virtual std::vector<json> execute(const std::string& cypher, const json& params) = 0;

    // {status: connected|disconnected|error, message, version?}
    virtual json health() = 0;
};

// Neo4j over the HTTP transactional endpoint: POST {uri}/db/{database}/tx/commit
class Neo4jHttpClient : public GraphClient {
public:
    Neo4jHttpClient(std::string uri, std::string database,
                    std::string username, std::string password,
                    int connect_timeout_ms = 10000, int request_timeout_ms = 30000);

    bool connected() const override { return connected_.load(); }
    std::vector<json> execute(const std::string& cypher, const json& params) override;
    json health() override;

private:
    std::string uri_;
    std::string database_;
    std::string username_;
    std::string password_;
    int connect_timeout_ms_;
    int request_timeout_ms_;
    // Written by check_connection() and health(), read from request threads
    std::atomic<bool> connected_{false};

    std::string commit_url() const;
    std::vector<json> run(const std::string& cypher, const json& params, int timeout_ms);
    void check_connection();
};

}
