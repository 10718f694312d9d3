#include <algorithm>
#include <spdlog/spdlog.h>

#include "retrieval/GraphRetriever.hpp"
#include "utils/TextUtils.hpp"

namespace hybrid_agent {

namespace {

const char* SEARCH_CYPHER = R"(
MATCH (n:Concept)
WHERE toLower(n.title) CONTAINS toLower($query)
   OR toLower(n.summary) CONTAINS toLower($query)
OPTIONAL MATCH (n)-[r]-(related:Concept)
WITH n, collect({relation: type(r), target: related.title}) as relationships
RETURN n.title as title, n.summary as summary, n.category as category,
       n.confidence as confidence, n.id as node_id, relationships
LIMIT $max_results
)";

const char* RELATED_CYPHER = R"(
MATCH (n:Concept {title: $concept_name})-[r]-(related:Concept)
RETURN related.title as title, related.summary as summary,
       type(r) as relationship, r.confidence as rel_confidence
LIMIT $max_related
)";

Document fallback_entry(const std::string& title, const std::string& content,
                        const std::string& id, double confidence) {
    Document d;
    d.kind = DocumentKind::GRAPH;
    d.title = title;
    d.content = content;
    d.reference = "graph:fallback:" + id;
    d.confidence = confidence;
    d.category = "technology";
    return d;
}

// Null-tolerant string/number access; Cypher returns null for missing properties
std::string str_or(const json& row, const char* key, const std::string& def) {
    auto it = row.find(key);
    if (it == row.end() || it->is_null()) return def;
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

double num_or(const json& row, const char* key, double def) {
    auto it = row.find(key);
    if (it == row.end() || !it->is_number()) return def;
    return it->get<double>();
}

}

GraphRetriever::GraphRetriever(std::shared_ptr<GraphClient> client)
    : client_(std::move(client)) {}

const std::vector<std::pair<std::string, Document>>& GraphRetriever::fallback_table() {
    static const std::vector<std::pair<std::string, Document>> table = {
        {"ai", fallback_entry(
            "Artificial Intelligence",
            "Field of computer science focused on creating intelligent machines that can learn, reason, and solve problems. Includes subfields like machine learning, natural language processing, and computer vision.",
            "ai001", 0.85)},
        {"machine learning", fallback_entry(
            "Machine Learning",
            "Subset of AI that uses statistical techniques to enable computers to learn and improve from experience without explicit programming. Common approaches include supervised learning, unsupervised learning, and reinforcement learning.",
            "ml001", 0.82)},
        {"deep learning", fallback_entry(
            "Deep Learning",
            "Type of machine learning using neural networks with multiple layers to model complex patterns in large amounts of data. Particularly effective for image recognition, speech recognition, and natural language processing.",
            "dl001", 0.80)},
        {"natural language processing", fallback_entry(
            "Natural Language Processing",
            "Branch of AI that helps computers understand, interpret, and manipulate human language. Applications include chatbots, translation, and sentiment analysis.",
            "nlp001", 0.78)},
        {"computer vision", fallback_entry(
            "Computer Vision",
            "Field of AI that enables computers to interpret and understand the visual world from digital images or videos. Used in facial recognition, autonomous vehicles, and medical imaging.",
            "cv001", 0.77)},
        {"neural networks", fallback_entry(
            "Neural Networks",
            "Computing systems inspired by biological neural networks. Consist of interconnected nodes (neurons) that process information and learn patterns.",
            "nn001", 0.79)}
    };
    return table;
}

std::vector<Document> GraphRetriever::fallback_search(const std::string& query, int max_results) {
    const auto& table = fallback_table();
    std::string q = to_lower(query);
    std::vector<Document> relevant;

    // 1. Whole key appears in the query
    for (const auto& [key, doc] : table) {
        if (q.find(key) != std::string::npos) relevant.push_back(doc);
    }

    // 2. Any word of the key appears in the query
    if (relevant.empty()) {
        for (const auto& [key, doc] : table) {
            for (const auto& word : split_words(key)) {
                if (q.find(word) != std::string::npos) {
                    relevant.push_back(doc);
                    break;
                }
            }
        }
    }

    // 3. Generic AI bundle
    if (relevant.empty() && contains_any(q, {"ai", "artificial", "intelligence", "machine", "learning"})) {
        relevant = {table[0].second, table[1].second, table[2].second};
    }

    // 4. Whole table
    if (relevant.empty()) {
        for (const auto& entry : table) relevant.push_back(entry.second);
    }

    size_t limit = max_results > 0 ? (size_t)max_results : 0;
    if (relevant.size() > limit) relevant.resize(limit);

    spdlog::info("🗂️ Using fallback graph data: {} results for: {}", relevant.size(), query);
    return relevant;
}

Document GraphRetriever::row_to_document(const json& row) {
    Document d;
    d.kind = DocumentKind::GRAPH;
    d.title = str_or(row, "title", "");
    d.content = str_or(row, "summary", "");
    d.reference = "graph:" + str_or(row, "node_id", "");
    d.confidence = std::clamp(num_or(row, "confidence", DEFAULT_CONFIDENCE), 0.0, 1.0);
    d.category = str_or(row, "category", "general");

    auto rels = row.find("relationships");
    if (rels != row.end() && rels->is_array()) {
        for (const auto& r : *rels) {
            // OPTIONAL MATCH with no neighbour collects {relation: null, target: null}
            if (!r.is_object() || r.value("relation", json()).is_null()) continue;
            d.relationships.push_back({str_or(r, "relation", ""), str_or(r, "target", "")});
        }
    }

    if (!d.relationships.empty()) {
        std::string mentions;
        size_t n = std::min(d.relationships.size(), MAX_RELATION_MENTIONS);
        for (size_t i = 0; i < n; ++i) {
            if (i > 0) mentions += ", ";
            mentions += d.relationships[i].target_title + " (" + d.relationships[i].relation_type + ")";
        }
        d.content += " Related to: " + mentions;
    }
    return d;
}

std::vector<Document> GraphRetriever::search(const std::string& query, int max_results, std::string* error) {
    if (!connected()) {
        return fallback_search(query, max_results);
    }

    try {
        auto rows = client_->execute(SEARCH_CYPHER, {{"query", query}, {"max_results", max_results}});

        std::vector<Document> results;
        results.reserve(rows.size());
        for (const auto& row : rows) results.push_back(row_to_document(row));

        spdlog::info("🕸️ Found {} graph results for: {}", results.size(), query);
        return results;
    } catch (const std::exception& e) {
        spdlog::error("❌ Graph search failed: {}", e.what());
        if (error) *error = e.what();
        return fallback_search(query, max_results);
    }
}

std::vector<Document> GraphRetriever::get_related(const std::string& concept_name, int max_related) {
    if (!connected()) return {};

    try {
        auto rows = client_->execute(RELATED_CYPHER, {{"concept_name", concept_name}, {"max_related", max_related}});

        std::vector<Document> results;
        for (const auto& row : rows) {
            Document d;
            d.kind = DocumentKind::GRAPH_RELATED;
            d.title = str_or(row, "title", "");
            d.content = str_or(row, "summary", "");
            d.reference = "graph:related:" + concept_name;
            d.confidence = std::clamp(num_or(row, "rel_confidence", DEFAULT_RELATED_CONFIDENCE), 0.0, 1.0);
            d.relationships.push_back({str_or(row, "relationship", ""), d.title});
            results.push_back(std::move(d));
        }
        return results;
    } catch (const std::exception& e) {
        spdlog::error("❌ Related concepts search failed: {}", e.what());
        return {};
    }
}

}
