#pragma once
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace hybrid_agent {

enum class DocumentKind {
    GRAPH,          // Concept node matched in the knowledge graph
    GRAPH_RELATED,  // One-hop neighbour of a concept
    INTERNET,       // Live web search hit
    NEWS,           // Live news search hit
    SEMANTIC        // Recalled from the similarity cache
};

inline std::string kind_to_string(DocumentKind k) {
    switch (k) {
        case DocumentKind::GRAPH: return "graph";
        case DocumentKind::GRAPH_RELATED: return "graph_related";
        case DocumentKind::INTERNET: return "internet";
        case DocumentKind::NEWS: return "news";
        case DocumentKind::SEMANTIC: return "semantic";
    }
    return "graph";
}

inline std::optional<DocumentKind> string_to_kind(const std::string& s) {
    if (s == "graph") return DocumentKind::GRAPH;
    if (s == "graph_related") return DocumentKind::GRAPH_RELATED;
    if (s == "internet") return DocumentKind::INTERNET;
    if (s == "news") return DocumentKind::NEWS;
    if (s == "semantic") return DocumentKind::SEMANTIC;
    return std::nullopt;
}

struct Relationship {
    std::string relation_type;
    std::string target_title;

    bool operator==(const Relationship& o) const {
        return relation_type == o.relation_type && target_title == o.target_title;
    }
};

struct Document {
    DocumentKind kind = DocumentKind::GRAPH;
    std::string title;
    std::string content;
    std::string reference;   // graph node id, URL, or cache slot
    double confidence = 0.0; // heuristic relevance in [0,1]

    std::optional<std::string> category;
    std::optional<std::string> published_date;
    std::vector<Relationship> relationships;

    bool operator==(const Document& o) const {
        return kind == o.kind && title == o.title && content == o.content &&
               reference == o.reference && confidence == o.confidence &&
               category == o.category && published_date == o.published_date &&
               relationships == o.relationships;
    }

    // Full form, used by the cache file
    nlohmann::json to_json() const {
        nlohmann::json rels = nlohmann::json::array();
        for (const auto& r : relationships) {
            rels.push_back({{"relation", r.relation_type}, {"target", r.target_title}});
        }
        nlohmann::json j = {
            {"type", kind_to_string(kind)},
            {"title", title},
            {"content", content},
            {"reference", reference},
            {"confidence", confidence},
            {"relationships", rels}
        };
        if (category) j["category"] = *category;
        if (published_date) j["published_date"] = *published_date;
        return j;
    }

    // Throws nlohmann::json::exception / std::invalid_argument on malformed input
    static Document from_json(const nlohmann::json& j) {
        Document d;
        auto kind = string_to_kind(j.at("type").get<std::string>());
        if (!kind) throw std::invalid_argument("unknown document type: " + j.at("type").get<std::string>());
        d.kind = *kind;
        d.title = j.at("title").get<std::string>();
        d.content = j.at("content").get<std::string>();
        d.reference = j.value("reference", "");
        d.confidence = j.value("confidence", 0.0);
        if (j.contains("category")) d.category = j["category"].get<std::string>();
        if (j.contains("published_date")) d.published_date = j["published_date"].get<std::string>();
        if (j.contains("relationships")) {
            for (const auto& r : j["relationships"]) {
                d.relationships.push_back({r.value("relation", ""), r.value("target", "")});
            }
        }
        return d;
    }

    // Source-list form returned to callers
    nlohmann::json to_source_json() const {
        return {
            {"title", title},
            {"reference", reference},
            {"type", kind_to_string(kind)},
            {"confidence", confidence}
        };
    }
};

}
