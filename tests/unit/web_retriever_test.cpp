#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "retrieval/WebRetriever.hpp"
#include "../support/Fakes.hpp"

using namespace hybrid_agent;
using namespace hybrid_agent::testing;
using Catch::Matchers::WithinAbs;

TEST_CASE("Mock data without credentials", "[web][mock]") {
    auto client = std::make_shared<FakeSearchClient>();
    client->is_available = false;
    WebRetriever retriever(client, nullptr);

    SECTION("search returns min(max_results, 2) templated documents") {
        auto docs = retriever.search("quantum computing", 5);
        REQUIRE(docs.size() == 2);
        CHECK(docs[0].title == "Research about quantum computing");
        CHECK(docs[0].content ==
              "This is mock content about quantum computing. In a real implementation, this would be actual web search results from Tavily API.");
        CHECK(docs[0].reference == "https://example.com/mock-data");
        CHECK(docs[0].confidence == 0.75);
        CHECK(docs[1].title == "Latest developments in quantum computing");
        CHECK(docs[1].confidence == 0.70);
        CHECK(docs[1].kind == DocumentKind::INTERNET);

        CHECK(retriever.search("quantum computing", 1).size() == 1);
        CHECK(client->calls == 0);
    }

    SECTION("search_news returns min(max_results, 1) document") {
        auto docs = retriever.search_news("quantum computing", 5);
        REQUIRE(docs.size() == 1);
        CHECK(docs[0].kind == DocumentKind::NEWS);
        CHECK(docs[0].title == "Breaking: New developments in quantum computing");
        CHECK(docs[0].confidence == 0.80);
        CHECK(docs[0].published_date == std::optional<std::string>("2024-01-15"));
    }
}

TEST_CASE("Live search maps hits and writes through to the cache", "[web]") {
    TempDir dir;
    auto cache = std::make_shared<SimilarityCache>(std::make_shared<HashingEmbedder>(64), dir.file("cache.bin"), 0);
    auto client = std::make_shared<FakeSearchClient>();
    client->response.results = {
        make_hit("High", "very relevant", "https://a.example", 95.0),
        make_hit("Low", "less relevant", "https://b.example", 40.0),
        make_hit("Unscored", "no score", "https://c.example", std::nullopt)
    };
    WebRetriever retriever(client, cache);

    SECTION("Web search") {
        auto docs = retriever.search("topic", 3);
        REQUIRE(docs.size() == 3);
        CHECK(client->last_depth == "advanced");
        CHECK(client->last_query == "topic");
        CHECK(client->last_max_results == 3);
        CHECK_THAT(docs[0].confidence, WithinAbs(0.9, 1e-9));
        CHECK_THAT(docs[1].confidence, WithinAbs(0.4, 1e-9));
        CHECK_THAT(docs[2].confidence, WithinAbs(0.7, 1e-9));
        CHECK(docs[0].reference == "https://a.example");
        CHECK(cache->size() == 3);
    }

    SECTION("News search rewrites the query and caps confidence lower") {
        auto docs = retriever.search_news("topic", 3);
        REQUIRE(docs.size() == 3);
        CHECK(client->last_query == "news topic 2024");
        CHECK(client->last_depth == "basic");
        CHECK_THAT(docs[0].confidence, WithinAbs(0.85, 1e-9));
        CHECK(docs[0].kind == DocumentKind::NEWS);
        CHECK(cache->size() == 3);
    }
}

TEST_CASE("Backend failure converts to mock data", "[web][mock]") {
    TempDir dir;
    auto cache = std::make_shared<SimilarityCache>(std::make_shared<HashingEmbedder>(64), dir.file("cache.bin"), 0);
    auto client = std::make_shared<FakeSearchClient>();
    client->throw_on_search = true;
    WebRetriever retriever(client, cache);

    std::string web_error;
    std::string news_error;
    auto web = retriever.search("rust", 5, &web_error);
    auto news = retriever.search_news("rust", 5, &news_error);

    CHECK(web_error == "HTTP 502");
    CHECK(news_error == "HTTP 502");
    CHECK(web.size() == 2);
    CHECK(web[0].reference == "https://example.com/mock-data");
    CHECK(news.size() == 1);
    CHECK(cache->size() == 0);
}

TEST_CASE("Out-of-range scores are clamped", "[web]") {
    auto client = std::make_shared<FakeSearchClient>();
    client->response.results = {
        make_hit("Negative", "bad score", "https://n.example", -30.0),
        make_hit("Huge", "bad score", "https://h.example", 250.0)
    };
    WebRetriever retriever(client, nullptr);

    auto web = retriever.search("topic", 2);
    REQUIRE(web.size() == 2);
    CHECK(web[0].confidence == 0.0);
    CHECK(web[1].confidence == 0.9);

    auto news = retriever.search_news("topic", 2);
    REQUIRE(news.size() == 2);
    CHECK(news[0].confidence == 0.0);
    CHECK(news[1].confidence == 0.85);
}
