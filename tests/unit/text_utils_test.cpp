#include <catch2/catch_test_macros.hpp>

#include "utils/TextUtils.hpp"
#include "utils/TimeUtils.hpp"

using namespace hybrid_agent;

TEST_CASE("Whitespace helpers", "[text]") {
    CHECK(trim("  a b \t\n") == "a b");
    CHECK(trim("   ").empty());
    CHECK(split_words("  machine   learning\tbasics ") == std::vector<std::string>{"machine", "learning", "basics"});
    CHECK(split_words("").empty());
    CHECK(to_lower("MiXeD 123") == "mixed 123");
}

TEST_CASE("UTF-8 aware truncation", "[text]") {
    const std::string s = "h\xC3\xA9llo \xE2\x82\xAC";  // "héllo €"
    CHECK(utf8_length(s) == 7);
    CHECK(utf8_truncate(s, 2) == "h\xC3\xA9");
    CHECK(utf8_truncate(s, 100) == s);
    CHECK(utf8_truncate(s, 0).empty());
    // A cut inside a truncated sequence drops the partial bytes
    CHECK(utf8_truncate("ab\xE2\x82", 5) == "ab");
}

TEST_CASE("Request scrubbing keeps text and UTF-8", "[text]") {
    CHECK(scrub_json_string("a\tb\nc\r") == "a\tb\nc\r");
    CHECK(scrub_json_string(std::string("x\x01y\x7Fz")) == "x y z");
    CHECK(scrub_json_string("caf\xC3\xA9") == "caf\xC3\xA9");
}

TEST_CASE("Credential helpers", "[text][auth]") {
    SECTION("Constant time comparison") {
        CHECK(constant_time_equals("secret", "secret"));
        CHECK_FALSE(constant_time_equals("secret", "secreT"));
        CHECK_FALSE(constant_time_equals("secret", "secret2"));
        CHECK_FALSE(constant_time_equals("", "x"));
        CHECK(constant_time_equals("", ""));
    }

    SECTION("Base64") {
        std::string out;
        REQUIRE(base64_decode("YWdlbnQ6c2VjcmV0", out));
        CHECK(out == "agent:secret");
        REQUIRE(base64_decode("YQ==", out));
        CHECK(out == "a");
        CHECK_FALSE(base64_decode("YQ=x", out));
        CHECK_FALSE(base64_decode("***", out));
    }
}

TEST_CASE("Keyword containment", "[text]") {
    CHECK(contains_any("what is the latest", {"recent", "latest"}));
    CHECK_FALSE(contains_any("history", {"recent", "latest"}));
}

TEST_CASE("Broken-down time", "[text][time]") {
    std::tm epoch = utc_tm(0);
    CHECK(epoch.tm_year == 70);
    CHECK(epoch.tm_mon == 0);
    CHECK(epoch.tm_mday == 1);
    CHECK(epoch.tm_hour == 0);

    std::tm leap = utc_tm(951782400);  // 2000-02-29T00:00:00Z
    CHECK(leap.tm_year + 1900 == 2000);
    CHECK(leap.tm_mon == 1);
    CHECK(leap.tm_mday == 29);

    std::time_t now = std::time(nullptr);
    int year = local_tm(now).tm_year + 1900;
    CHECK(year >= 2024);
}
