#include <chrono>
#include <cctype>
#include <ctime>

#include "agent/QueryAnalyzer.hpp"
#include "utils/TextUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace hybrid_agent {

QueryAnalysis QueryAnalyzer::analyze(const std::string& query) {
    QueryAnalysis analysis;
    std::string q = to_lower(query);

    if (contains_any(q, {"what is", "define", "explain"})) {
        analysis.intent = "definition";
        analysis.needs_facts = true;
    } else if (contains_any(q, {"how to", "steps", "guide"})) {
        analysis.intent = "instructions";
    } else if (contains_any(q, {"compare", "difference", "vs"})) {
        analysis.intent = "comparison";
    }

    size_t words = split_words(query).size();
    if (words > 10 || contains_any(q, {"complex", "advanced", "detailed"})) {
        analysis.complexity = "high";
    } else if (words < 5) {
        analysis.complexity = "low";
    }

    if (contains_any(q, {"latest", "recent", "news", "update"})) {
        analysis.needs_current_info = true;
        analysis.expected_sources.push_back("internet");
    }
    return analysis;
}

bool QueryAnalyzer::needs_graph_search(const std::string& query) {
    return contains_any(to_lower(query), {
        "what is", "define", "explain", "concept", "theory",
        "relationship", "how does", "compare", "difference between"
    });
}

bool QueryAnalyzer::needs_internet_search(const std::string& query) {
    return needs_internet_search(query, current_year());
}

bool QueryAnalyzer::needs_internet_search(const std::string& query, int year) {
    std::string q = to_lower(query);
    if (contains_any(q, {
            "latest", "recent", "news", "update", "current",
            "today", "yesterday", "this week", "this month", "trending"})) {
        return true;
    }
    return has_year_token(q, year) || has_year_token(q, year + 1);
}

bool QueryAnalyzer::has_year_token(const std::string& query, int year) {
    const std::string wanted = std::to_string(year);
    size_t i = 0;
    while (i < query.size()) {
        if (!std::isdigit((unsigned char)query[i])) {
            i++;
            continue;
        }
        size_t start = i;
        while (i < query.size() && std::isdigit((unsigned char)query[i])) i++;
        // Whole digit run only: "120261" or "20265" is not a year
        if (i - start == 4 && query.compare(start, 4, wanted) == 0) return true;
    }
    return false;
}

RoutePlan QueryAnalyzer::route(const std::string& query, const QueryOptions& options) {
    return route(query, options, current_year());
}

RoutePlan QueryAnalyzer::route(const std::string& query, const QueryOptions& options, int year) {
    RoutePlan plan;
    plan.graph_scheduled = options.use_graph && needs_graph_search(query);
    plan.internet_scheduled = options.use_internet && needs_internet_search(query, year);
    return plan;
}

int QueryAnalyzer::current_year() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return local_tm(now).tm_year + 1900;
}

}
