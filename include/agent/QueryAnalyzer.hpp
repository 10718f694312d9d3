#pragma once
#include <string>

#include "core/RunState.hpp"

namespace hybrid_agent {

// Keyword heuristics over the lower-cased query. No I/O.
class QueryAnalyzer {
public:
    static QueryAnalysis analyze(const std::string& query);

    static bool needs_graph_search(const std::string& query);

    // Recency keywords, or the current/next year as a standalone 4-digit token
    static bool needs_internet_search(const std::string& query);
    static bool needs_internet_search(const std::string& query, int current_year);

    static RoutePlan route(const std::string& query, const QueryOptions& options);
    static RoutePlan route(const std::string& query, const QueryOptions& options, int current_year);

    static int current_year();

    static bool has_year_token(const std::string& query, int year);
};

}
