#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <algorithm>

#include "agent/WorkflowOrchestrator.hpp"
#include "LogManager.hpp"
#include "../support/Fakes.hpp"

using namespace hybrid_agent;
using namespace hybrid_agent::testing;
using Catch::Matchers::WithinAbs;

namespace {

struct Harness {
    std::shared_ptr<FakeGraphClient> graph_client = std::make_shared<FakeGraphClient>();
    std::shared_ptr<FakeSearchClient> search_client = std::make_shared<FakeSearchClient>();
    std::shared_ptr<FakeTextGenerator> generator = std::make_shared<FakeTextGenerator>();
    std::shared_ptr<WorkflowOrchestrator> orchestrator;

    explicit Harness(bool with_generator = false, std::shared_ptr<SimilarityCache> cache = nullptr) {
        LogManager::instance().set_storage_path("");
        LogManager::instance().clear();
        generator->is_available = with_generator;
        orchestrator = std::make_shared<WorkflowOrchestrator>(
            std::make_shared<GraphRetriever>(graph_client),
            std::make_shared<WebRetriever>(search_client, cache),
            cache,
            std::make_shared<AnswerSynthesizer>(generator));
    }
};

} // namespace

TEST_CASE("Transition table", "[orchestrator][state]") {
    QueryOptions all;
    CHECK(WorkflowOrchestrator::transition(Step::ROUTE, all) == Step::ANALYZE);
    CHECK(WorkflowOrchestrator::transition(Step::ANALYZE, all) == Step::SEARCH_GRAPH);
    CHECK(WorkflowOrchestrator::transition(Step::SEARCH_GRAPH, all) == Step::SEARCH_INTERNET);
    CHECK(WorkflowOrchestrator::transition(Step::SEARCH_INTERNET, all) == Step::GENERATE);
    CHECK(WorkflowOrchestrator::transition(Step::GENERATE, all) == Step::FORMAT);
    CHECK(WorkflowOrchestrator::transition(Step::FORMAT, all) == Step::DONE);

    QueryOptions no_graph;
    no_graph.use_graph = false;
    CHECK(WorkflowOrchestrator::transition(Step::ANALYZE, no_graph) == Step::SEARCH_INTERNET);

    QueryOptions no_web;
    no_web.use_internet = false;
    CHECK(WorkflowOrchestrator::transition(Step::SEARCH_GRAPH, no_web) == Step::GENERATE);
}

TEST_CASE("Iteration guard forces answer generation", "[orchestrator][state]") {
    RunState state("q", QueryOptions{});

    state.iterations = MAX_ITERATIONS - 1;
    CHECK(WorkflowOrchestrator::next_step(Step::ANALYZE, state) == Step::SEARCH_GRAPH);

    state.iterations = MAX_ITERATIONS;
    CHECK(WorkflowOrchestrator::next_step(Step::ROUTE, state) == Step::GENERATE);
    CHECK(WorkflowOrchestrator::next_step(Step::ANALYZE, state) == Step::GENERATE);
    CHECK(WorkflowOrchestrator::next_step(Step::SEARCH_INTERNET, state) == Step::GENERATE);
    CHECK(WorkflowOrchestrator::next_step(Step::GENERATE, state) == Step::FORMAT);
    CHECK(WorkflowOrchestrator::next_step(Step::FORMAT, state) == Step::DONE);
}

TEST_CASE("Full run visits every step in order", "[orchestrator][state]") {
    Harness h;
    RunState state("What is the latest AI news?", QueryOptions{});

    h.orchestrator->run(state, "q-test");

    CHECK(state.completed_steps == std::vector<std::string>{
              "route_query", "analyze_query", "search_graph", "search_internet", "generate_answer", "format_answer"});
    CHECK(state.iterations <= MAX_ITERATIONS);
    CHECK_FALSE(state.max_iterations_reached);
    CHECK_FALSE(state.next_step.has_value());
    CHECK_FALSE(state.should_continue);
    CHECK(state.graph_count + state.internet_count + state.semantic_count == state.documents.size());
    CHECK(LogManager::instance().get_traces_json().size() >= 6);
}

TEST_CASE("Both sources disabled", "[orchestrator]") {
    Harness h(true);
    json options = {{"use_graph", false}, {"use_internet", false}};

    auto response = h.orchestrator->process_query("anything at all", options);

    REQUIRE(response.ok());
    CHECK(response.answer == "I couldn't find enough relevant information to answer your question.");
    CHECK(response.sources.empty());
    CHECK(response.structured_output["confidence"] == 0.0);
    CHECK(h.graph_client->calls == 0);
    CHECK(h.search_client->calls == 0);
    CHECK(h.generator->calls == 0);
}

TEST_CASE("Offline graph-only query end to end", "[orchestrator][e2e]") {
    Harness h;
    h.graph_client->is_connected = false;

    auto response = h.orchestrator->process_query("What is machine learning?", {{"use_internet", false}});

    REQUIRE(response.ok());
    CHECK(response.http_status() == 200);
    CHECK(response.answer ==
          "I found information about your query from 1 sources (1 from knowledge graph, 0 from web search). "
          "Configure LLM for detailed AI responses.");
    REQUIRE(response.sources.size() == 1);
    CHECK(response.sources[0]["title"] == "Machine Learning");
    CHECK(response.sources[0]["reference"] == "graph:fallback:ml001");
    CHECK(response.sources[0]["type"] == "graph");

    const auto& out = response.structured_output;
    CHECK_THAT(out["confidence"].get<double>(), WithinAbs(0.82, 1e-9));
    CHECK(out["summary"] == "Found 1 information sources");
    CHECK(out["steps_completed"] == json::array(
              {"route_query", "analyze_query", "search_graph", "generate_answer", "format_answer"}));
    CHECK(out["route"] == json::array({"analyze_query", "search_graph", "generate_answer"}));
    CHECK(out["reasoning"].size() == 4);
    CHECK(h.search_client->calls == 0);

    auto j = response.to_json();
    CHECK(j["status"] == "success");
    CHECK_FALSE(j.contains("context"));
    CHECK(j["response"]["answer"] == response.answer);
}

TEST_CASE("Live sources with a generator", "[orchestrator][e2e]") {
    Harness h(true);
    h.graph_client->rows = {{
        {"title", "Rust"}, {"summary", "Systems language."}, {"category", "lang"},
        {"confidence", 0.9}, {"node_id", "r1"}, {"relationships", json::array()}
    }};
    h.search_client->response.results = {make_hit("Rust 2024", "edition notes", "https://r.example", 80.0)};
    h.generator->reply = R"({"answer": "Rust is a language", "key_points": ["safe"], "summary": "Rust"})";

    auto response = h.orchestrator->process_query("  what is rust  ");

    REQUIRE(response.ok());
    CHECK(h.graph_client->last_params["query"] == "what is rust");
    CHECK(h.search_client->last_query == "what is rust");
    CHECK(response.answer == "Rust is a language");
    REQUIRE(response.sources.size() == 2);
    CHECK(response.sources[0]["type"] == "graph");
    CHECK(response.sources[1]["type"] == "internet");
    CHECK_THAT(response.structured_output["confidence"].get<double>(), WithinAbs(0.85, 1e-9));
    CHECK(response.structured_output["key_points"] == json::array({"safe"}));
}

TEST_CASE("Request validation", "[orchestrator][validation]") {
    Harness h;

    SECTION("Empty or blank query") {
        for (const char* q : {"", "   ", "\t\n"}) {
            auto response = h.orchestrator->process_query(q);
            CHECK(response.error == ErrorCode::INVALID_REQUEST);
            CHECK(response.error_message == "Query cannot be empty");
            CHECK(response.http_status() == 400);
        }
        CHECK(h.graph_client->calls == 0);
        CHECK(h.search_client->calls == 0);

        auto j = h.orchestrator->process_query("").to_json();
        CHECK(j["status"] == "error");
        CHECK(j["error"]["code"] == "INVALID_REQUEST");
    }

    SECTION("Bad options") {
        CHECK(h.orchestrator->process_query("q", {{"max_results", 0}}).error == ErrorCode::INVALID_REQUEST);
        CHECK(h.orchestrator->process_query("q", {{"max_results", 51}}).error == ErrorCode::INVALID_REQUEST);
        CHECK(h.orchestrator->process_query("q", {{"max_results", 2.5}}).error == ErrorCode::INVALID_REQUEST);
        CHECK(h.orchestrator->process_query("q", {{"use_graph", "yes"}}).error == ErrorCode::INVALID_REQUEST);
        CHECK(h.orchestrator->process_query("q", json::array()).error == ErrorCode::INVALID_REQUEST);
        CHECK(h.graph_client->calls == 0);
    }

    SECTION("Null options fall back to defaults") {
        QueryOptions opts;
        REQUIRE_FALSE(WorkflowOrchestrator::parse_options(
            {{"use_graph", nullptr}, {"max_results", 50}}, opts).has_value());
        CHECK(opts.use_graph);
        CHECK(opts.use_internet);
        CHECK(opts.max_results == 50);
    }

    SECTION("Every query is logged with an id") {
        auto bad = h.orchestrator->process_query("");
        auto good = h.orchestrator->process_query("what is ai", {{"use_internet", false}});
        CHECK(LogManager::instance().total_queries() == 2);
        CHECK(bad.query_id != good.query_id);
        CHECK(bad.query_id.rfind("q-", 0) == 0);

        auto logs = LogManager::instance().get_logs_json();
        REQUIRE(logs.size() == 2);
        CHECK(logs[0]["s"] == "success");
        CHECK(logs[1]["e"] == "INVALID_REQUEST");
    }
}

TEST_CASE("Context is echoed back", "[orchestrator]") {
    Harness h;
    json context = {{"session", "abc"}};

    auto response = h.orchestrator->process_query("what is ai", {{"use_internet", false}}, context);

    REQUIRE(response.ok());
    CHECK(response.to_json()["context"] == context);
}

TEST_CASE("Retriever faults are recorded, not raised", "[orchestrator]") {
    Harness h;
    h.search_client->throw_on_search = true;
    h.graph_client->throw_on_execute = true;

    SECTION("Run state carries the error and the trace names it") {
        RunState state("machine learning", QueryOptions{});
        h.orchestrator->run(state);

        CHECK(h.graph_client->calls == 1);
        CHECK(h.search_client->calls == 1);
        REQUIRE(state.last_error.has_value());
        CHECK(*state.last_error == "Internet search error: HTTP 502");

        const auto& trace = state.reasoning_trace;
        auto has_line = [&](const std::string& line) {
            return std::find(trace.begin(), trace.end(), line) != trace.end();
        };
        CHECK(has_line("Graph search error: Neo.ClientError.Statement.SyntaxError: boom"));
        CHECK(has_line("Using 1 fallback graph results"));
        CHECK(has_line("Internet search error: HTTP 502"));
        CHECK(has_line("Found 2 mock internet results and 0 semantic results"));
        CHECK_FALSE(has_line("Found 1 graph results"));

        // graph fell back to the table, web fell back to mock data
        CHECK(state.documents.size() == 3);
    }

    SECTION("The response still succeeds") {
        auto response = h.orchestrator->process_query("machine learning");
        REQUIRE(response.ok());
        CHECK(response.sources.size() == 3);
    }
}

TEST_CASE("Graph-only failure leaves the error in last_error", "[orchestrator]") {
    Harness h;
    h.graph_client->throw_on_execute = true;

    RunState state("machine learning", QueryOptions{});
    h.orchestrator->run(state);

    REQUIRE(state.last_error.has_value());
    CHECK(state.last_error->rfind("Graph search error: ", 0) == 0);
}

TEST_CASE("Semantic recall follows the web results at half the budget", "[orchestrator][cache]") {
    TempDir dir;
    auto cache = std::make_shared<SimilarityCache>(std::make_shared<HashingEmbedder>(64), dir.file("cache.bin"), 0);
    for (int i = 0; i < 4; ++i) {
        Document d;
        d.kind = DocumentKind::INTERNET;
        d.title = "Cached ownership note " + std::to_string(i);
        d.content = "rust ownership and borrowing, revision " + std::to_string(i);
        d.reference = "https://cache.example/" + std::to_string(i);
        d.confidence = 0.5;
        cache->insert(d);
    }

    Harness h(false, cache);
    h.search_client->response.results = {
        make_hit("Rust book", "ownership chapter", "https://a.example", 90.0),
        make_hit("Rust blog", "borrowing explained", "https://b.example", 60.0)
    };

    auto run_with = [&](int max_results) {
        QueryOptions opts;
        opts.use_graph = false;
        opts.max_results = max_results;
        RunState state("rust ownership", opts);
        h.orchestrator->run(state);
        return state;
    };

    SECTION("Web documents first, then semantic ones") {
        auto state = run_with(5);

        REQUIRE(state.documents.size() == 4);
        CHECK(state.internet_count == 2);
        CHECK(state.semantic_count == 2);
        CHECK(state.documents[0].kind == DocumentKind::INTERNET);
        CHECK(state.documents[0].title == "Rust book");
        CHECK(state.documents[1].kind == DocumentKind::INTERNET);
        CHECK(state.documents[2].kind == DocumentKind::SEMANTIC);
        CHECK(state.documents[3].kind == DocumentKind::SEMANTIC);
        CHECK(state.documents[2].confidence >= state.documents[3].confidence);
        CHECK_FALSE(state.last_error.has_value());

        // live hits were written through before recall
        CHECK(cache->size() == 6);
    }

    SECTION("Budget uses integer division") {
        auto three = run_with(3);
        CHECK(three.semantic_count == 1);

        auto one = run_with(1);
        CHECK(one.semantic_count == 0);
        CHECK(one.documents.size() == one.internet_count);
    }
}
