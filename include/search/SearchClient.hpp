#pragma once
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>

namespace hybrid_agent {

class SearchError : public std::runtime_error {
public:
    explicit SearchError(const std::string& msg) : std::runtime_error(msg) {}
};

struct SearchHit {
    std::string title;
    std::string content;
    std::string url;
    std::optional<double> score; // backend relevance, 0..100 scale when present
    std::string published_date;
};

struct SearchResponse {
    std::vector<SearchHit> results;
};

// Web search backend. A missing API key is a normal configuration state.
class SearchClient {
public:
    virtual ~SearchClient() = default;

    virtual bool available() const = 0;

    // Throws SearchError on transport or protocol failure
    virtual SearchResponse search(const std::string& query, int max_results, const std::string& depth) = 0;
};

// Tavily REST client: POST https://api.tavily.com/search
class TavilyClient : public SearchClient {
public:
    explicit TavilyClient(std::string api_key, int timeout_ms = 30000);

    bool available() const override { return !api_key_.empty(); }
    SearchResponse search(const std::string& query, int max_results, const std::string& depth) override;

private:
    std::string api_key_;
    int timeout_ms_;
    const std::string endpoint_ = "https://api.tavily.com/search";
};

}
