#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "search/SearchClient.hpp"

namespace hybrid_agent {

using json = nlohmann::json;

TavilyClient::TavilyClient(std::string api_key, int timeout_ms)
    : api_key_(std::move(api_key)), timeout_ms_(timeout_ms) {}

SearchResponse TavilyClient::search(const std::string& query, int max_results, const std::string& depth) {
    if (!available()) throw SearchError("Tavily API key not configured");

    json payload = {
        {"api_key", api_key_},
        {"query", query},
        {"max_results", max_results},
        {"search_depth", depth}
    };

    auto r = cpr::Post(cpr::Url{endpoint_},
                       cpr::Body{payload.dump()},
                       cpr::Header{{"Content-Type", "application/json"}},
                       cpr::Timeout{timeout_ms_});

    if (r.error.code != cpr::ErrorCode::OK) {
        throw SearchError("transport error: " + r.error.message);
    }
    if (r.status_code != 200) {
        throw SearchError("HTTP " + std::to_string(r.status_code) + ": " + r.text.substr(0, 200));
    }

    json body = json::parse(r.text, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw SearchError("malformed response body");
    }

    SearchResponse response;
    for (const auto& item : body.value("results", json::array())) {
        if (!item.is_object()) continue;
        SearchHit hit;
        hit.title = item.value("title", "No title");
        hit.content = item.value("content", "");
        hit.url = item.value("url", "");
        if (item.contains("score") && item["score"].is_number()) {
            hit.score = item["score"].get<double>();
        }
        if (item.contains("published_date") && item["published_date"].is_string()) {
            hit.published_date = item["published_date"].get<std::string>();
        }
        response.results.push_back(std::move(hit));
    }

    spdlog::debug("🌐 Tavily returned {} results ({} depth)", response.results.size(), depth);
    return response;
}

}
