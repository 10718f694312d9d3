#include <catch2/catch_test_macros.hpp>

#include "agent/QueryAnalyzer.hpp"

using namespace hybrid_agent;

TEST_CASE("Intent classification", "[analyzer]") {
    SECTION("Definition keywords win over later categories") {
        CHECK(QueryAnalyzer::analyze("What is a graph database?").intent == "definition");
        CHECK(QueryAnalyzer::analyze("Please EXPLAIN the difference").intent == "definition");
    }

    SECTION("Instructions") {
        CHECK(QueryAnalyzer::analyze("how to train a model").intent == "instructions");
        CHECK(QueryAnalyzer::analyze("setup guide for neo4j").intent == "instructions");
    }

    SECTION("Comparison") {
        CHECK(QueryAnalyzer::analyze("compare rust and c++").intent == "comparison");
        CHECK(QueryAnalyzer::analyze("cats vs dogs").intent == "comparison");
    }

    SECTION("Default") {
        auto a = QueryAnalyzer::analyze("tell me about transformers");
        CHECK(a.intent == "information_request");
        CHECK(a.needs_facts);
    }
}

TEST_CASE("Complexity classification", "[analyzer]") {
    CHECK(QueryAnalyzer::analyze("transformers").complexity == "low");
    CHECK(QueryAnalyzer::analyze("one two three four").complexity == "low");
    CHECK(QueryAnalyzer::analyze("one two three four five").complexity == "medium");
    CHECK(QueryAnalyzer::analyze("a detailed view").complexity == "high");
    CHECK(QueryAnalyzer::analyze("w1 w2 w3 w4 w5 w6 w7 w8 w9 w10 w11").complexity == "high");
    CHECK(QueryAnalyzer::analyze("w1 w2 w3 w4 w5 w6 w7 w8 w9 w10").complexity == "medium");
}

TEST_CASE("Current info detection extends expected sources", "[analyzer]") {
    auto plain = QueryAnalyzer::analyze("what is entropy");
    CHECK_FALSE(plain.needs_current_info);
    CHECK(plain.expected_sources == std::vector<std::string>{"graph"});

    auto recent = QueryAnalyzer::analyze("latest news on fusion");
    CHECK(recent.needs_current_info);
    CHECK(recent.expected_sources == std::vector<std::string>{"graph", "internet"});
}

TEST_CASE("Routing keywords", "[analyzer][router]") {
    SECTION("Graph keywords") {
        CHECK(QueryAnalyzer::needs_graph_search("What is a monad"));
        CHECK(QueryAnalyzer::needs_graph_search("the relationship of x and y"));
        CHECK(QueryAnalyzer::needs_graph_search("difference between tcp and udp"));
        CHECK_FALSE(QueryAnalyzer::needs_graph_search("weather in paris"));
    }

    SECTION("Internet keywords and year tokens") {
        CHECK(QueryAnalyzer::needs_internet_search("trending repos", 2026));
        CHECK(QueryAnalyzer::needs_internet_search("what happened this week", 2026));
        CHECK(QueryAnalyzer::needs_internet_search("elections 2026", 2026));
        CHECK(QueryAnalyzer::needs_internet_search("plans for 2027", 2026));
        CHECK_FALSE(QueryAnalyzer::needs_internet_search("history of 1999", 2026));
        CHECK_FALSE(QueryAnalyzer::needs_internet_search("what is entropy", 2026));
    }

    SECTION("Year must be a whole 4-digit token") {
        CHECK_FALSE(QueryAnalyzer::needs_internet_search("invoice 120261", 2026));
        CHECK_FALSE(QueryAnalyzer::needs_internet_search("order 20265", 2026));
        CHECK_FALSE(QueryAnalyzer::needs_internet_search("part 202627", 2026));
        CHECK(QueryAnalyzer::needs_internet_search("(2026)", 2026));
        CHECK(QueryAnalyzer::needs_internet_search("q3-2027 roadmap", 2026));
        CHECK(QueryAnalyzer::has_year_token("2026", 2026));
        CHECK_FALSE(QueryAnalyzer::has_year_token("", 2026));
    }

    SECTION("Route respects option flags independently") {
        QueryOptions opts;
        auto both = QueryAnalyzer::route("what is the latest llm", opts, 2026);
        CHECK(both.graph_scheduled);
        CHECK(both.internet_scheduled);
        CHECK(both.step_names() ==
              std::vector<std::string>{"analyze_query", "search_graph", "search_internet", "generate_answer"});

        opts.use_graph = false;
        auto web_only = QueryAnalyzer::route("what is the latest llm", opts, 2026);
        CHECK_FALSE(web_only.graph_scheduled);
        CHECK(web_only.internet_scheduled);

        auto neither = QueryAnalyzer::route("pizza toppings", QueryOptions{}, 2026);
        CHECK(neither.step_names() == std::vector<std::string>{"analyze_query", "generate_answer"});
    }
}
