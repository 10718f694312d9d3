#pragma once
#include <string>
#include <vector>
#include <memory>

#include "core/Document.hpp"
#include "memory/SimilarityCache.hpp"
#include "search/SearchClient.hpp"

namespace hybrid_agent {

// Live web and news search. Unavailable or failing backends yield mock documents.
// Every live hit is also remembered in the similarity cache.
class WebRetriever {
public:
    static constexpr double WEB_CONFIDENCE_CAP = 0.9;
    static constexpr double NEWS_CONFIDENCE_CAP = 0.85;
    static constexpr double DEFAULT_SCORE = 70.0;

    // cache may be null (no write-through)
    WebRetriever(std::shared_ptr<SearchClient> client, std::shared_ptr<SimilarityCache> cache);

    // A failing backend writes its error text to `error` (when given) before the mock fallback
    std::vector<Document> search(const std::string& query, int max_results, std::string* error = nullptr);
    std::vector<Document> search_news(const std::string& query, int max_results, std::string* error = nullptr);

    static std::vector<Document> mock_internet(const std::string& query, int max_results);
    static std::vector<Document> mock_news(const std::string& query, int max_results);

    bool available() const { return client_ && client_->available(); }

private:
    std::shared_ptr<SearchClient> client_;
    std::shared_ptr<SimilarityCache> cache_;

    std::vector<Document> run_live(const std::string& query, int max_results, const std::string& depth,
                                   DocumentKind kind, double confidence_cap);
};

}
