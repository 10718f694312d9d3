#include <algorithm>
#include <spdlog/spdlog.h>

#include "retrieval/WebRetriever.hpp"

namespace hybrid_agent {

namespace {

Document mock_document(DocumentKind kind, std::string title, std::string content,
                       std::string reference, double confidence, std::string date) {
    Document d;
    d.kind = kind;
    d.title = std::move(title);
    d.content = std::move(content);
    d.reference = std::move(reference);
    d.confidence = confidence;
    d.published_date = std::move(date);
    return d;
}

void truncate_to(std::vector<Document>& docs, int max_results) {
    size_t limit = max_results > 0 ? (size_t)max_results : 0;
    if (docs.size() > limit) docs.resize(limit);
}

}

WebRetriever::WebRetriever(std::shared_ptr<SearchClient> client, std::shared_ptr<SimilarityCache> cache)
    : client_(std::move(client)), cache_(std::move(cache)) {}

std::vector<Document> WebRetriever::mock_internet(const std::string& query, int max_results) {
    std::vector<Document> docs = {
        mock_document(DocumentKind::INTERNET,
                      "Research about " + query,
                      "This is mock content about " + query +
                          ". In a real implementation, this would be actual web search results from Tavily API.",
                      "https://example.com/mock-data", 0.75, "2024-01-01"),
        mock_document(DocumentKind::INTERNET,
                      "Latest developments in " + query,
                      "Mock summary of recent advancements in " + query +
                          ". This demonstrates the system structure when external APIs are not configured.",
                      "https://example.com/mock-news", 0.70, "2024-01-01")
    };
    truncate_to(docs, max_results);
    return docs;
}

std::vector<Document> WebRetriever::mock_news(const std::string& query, int max_results) {
    std::vector<Document> docs = {
        mock_document(DocumentKind::NEWS,
                      "Breaking: New developments in " + query,
                      "This is mock news content about " + query +
                          ". Real news would come from Tavily API news search.",
                      "https://example.com/mock-news", 0.80, "2024-01-15")
    };
    truncate_to(docs, max_results);
    return docs;
}

std::vector<Document> WebRetriever::run_live(const std::string& query, int max_results, const std::string& depth,
                                             DocumentKind kind, double confidence_cap) {
    auto response = client_->search(query, max_results, depth);

    std::vector<Document> results;
    results.reserve(response.results.size());
    for (const auto& hit : response.results) {
        Document d;
        d.kind = kind;
        d.title = hit.title;
        d.content = hit.content;
        d.reference = hit.url;
        d.confidence = std::clamp(hit.score.value_or(DEFAULT_SCORE) / 100.0, 0.0, confidence_cap);
        d.published_date = hit.published_date;
        if (cache_) cache_->insert(d);
        results.push_back(std::move(d));
    }
    return results;
}

std::vector<Document> WebRetriever::search(const std::string& query, int max_results, std::string* error) {
    if (!available()) {
        return mock_internet(query, max_results);
    }
    try {
        auto results = run_live(query, max_results, "advanced", DocumentKind::INTERNET, WEB_CONFIDENCE_CAP);
        spdlog::info("🌐 Found {} internet results for: {}", results.size(), query);
        return results;
    } catch (const std::exception& e) {
        spdlog::error("❌ Internet search failed: {}", e.what());
        if (error) *error = e.what();
        return mock_internet(query, max_results);
    }
}

std::vector<Document> WebRetriever::search_news(const std::string& query, int max_results, std::string* error) {
    if (!available()) {
        return mock_news(query, max_results);
    }
    try {
        auto results = run_live("news " + query + " 2024", max_results, "basic", DocumentKind::NEWS, NEWS_CONFIDENCE_CAP);
        spdlog::info("📰 Found {} news results for: {}", results.size(), query);
        return results;
    } catch (const std::exception& e) {
        spdlog::error("❌ News search failed: {}", e.what());
        if (error) *error = e.what();
        return mock_news(query, max_results);
    }
}

}
