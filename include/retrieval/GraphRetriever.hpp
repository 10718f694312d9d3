#pragma once
#include <string>
#include <vector>
#include <memory>
#include <utility>

#include "core/Document.hpp"
#include "graph/GraphClient.hpp"

namespace hybrid_agent {

// Concept search over the knowledge graph with a static fallback table.
class GraphRetriever {
public:
    static constexpr size_t MAX_RELATION_MENTIONS = 3;
    static constexpr double DEFAULT_CONFIDENCE = 0.8;
    static constexpr double DEFAULT_RELATED_CONFIDENCE = 0.7;

    explicit GraphRetriever(std::shared_ptr<GraphClient> client);

    // Never throws. Disconnected or failing backends yield fallback_search().
    // A failing backend also writes its error text to `error` when given.
    std::vector<Document> search(const std::string& query, int max_results, std::string* error = nullptr);

    // Never throws. Empty when disconnected or failing; there is no fallback here.
    std::vector<Document> get_related(const std::string& concept_name, int max_related);

    // Key-containment match, then any key word, then the AI bundle, then the whole table.
    static std::vector<Document> fallback_search(const std::string& query, int max_results);

    // Keyed table in its fixed iteration order
    static const std::vector<std::pair<std::string, Document>>& fallback_table();

    bool connected() const { return client_ && client_->connected(); }

private:
    std::shared_ptr<GraphClient> client_;

    static Document row_to_document(const json& row);
};

}
