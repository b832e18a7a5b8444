// Unit tests for string parsing utilities
#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"
#include <limits>

using namespace echosrv::util;

TEST_CASE("SafeParseInt - valid inputs", "[util][string_parsing]") {
    SECTION("Parse valid positive integer") {
        auto result = SafeParseInt("42", 0, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("Parse valid negative integer") {
        auto result = SafeParseInt("-50", -100, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == -50);
    }

    SECTION("Parse at bounds") {
        REQUIRE(*SafeParseInt("0", 0, 100) == 0);
        REQUIRE(*SafeParseInt("100", 0, 100) == 100);
    }

    SECTION("Parse descriptor-sized values") {
        REQUIRE(*SafeParseInt("3", 0, std::numeric_limits<int>::max()) == 3);
        REQUIRE(*SafeParseInt("4096", 0, 4096) == 4096);
    }
}

TEST_CASE("SafeParseInt - invalid inputs", "[util][string_parsing]") {
    SECTION("Empty string") {
        REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
    }

    SECTION("Non-numeric string") {
        REQUIRE_FALSE(SafeParseInt("abc", 0, 100).has_value());
    }

    SECTION("Trailing characters") {
        REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
    }

    SECTION("Leading characters") {
        REQUIRE_FALSE(SafeParseInt("x42", 0, 100).has_value());
    }

    SECTION("Out of bounds") {
        REQUIRE_FALSE(SafeParseInt("-1", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
    }

    SECTION("Overflow") {
        REQUIRE_FALSE(SafeParseInt("999999999999999999999", 0, 100).has_value());
    }

    SECTION("Whitespace") {
        REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("42 ", 0, 100).has_value());
    }

    SECTION("Floating point") {
        REQUIRE_FALSE(SafeParseInt("42.5", 0, 100).has_value());
    }
}

TEST_CASE("SafeParsePort - valid inputs", "[util][string_parsing]") {
    SECTION("Port zero requests an ephemeral port") {
        auto result = SafeParsePort("0");
        REQUIRE(result.has_value());
        REQUIRE(*result == 0);
    }

    SECTION("Parse maximum valid port") {
        REQUIRE(*SafeParsePort("65535") == 65535);
    }

    SECTION("Parse common ports") {
        REQUIRE(*SafeParsePort("80") == 80);
        REQUIRE(*SafeParsePort("8080") == 8080);
    }
}

TEST_CASE("SafeParsePort - invalid inputs", "[util][string_parsing]") {
    REQUIRE_FALSE(SafeParsePort("-1").has_value());
    REQUIRE_FALSE(SafeParsePort("65536").has_value());
    REQUIRE_FALSE(SafeParsePort("").has_value());
    REQUIRE_FALSE(SafeParsePort("http").has_value());
    REQUIRE_FALSE(SafeParsePort("8080x").has_value());
}

TEST_CASE("SafeParseInt64 - range checks", "[util][string_parsing]") {
    SECTION("Large values within bounds") {
        auto result = SafeParseInt64("86400000", 0, 86400000);
        REQUIRE(result.has_value());
        REQUIRE(*result == 86400000);
    }

    SECTION("Full int64 range") {
        auto max = std::numeric_limits<int64_t>::max();
        auto result = SafeParseInt64("9223372036854775807", 0, max);
        REQUIRE(result.has_value());
        REQUIRE(*result == max);
    }

    SECTION("Rejects values past the bound") {
        REQUIRE_FALSE(SafeParseInt64("86400001", 0, 86400000).has_value());
        REQUIRE_FALSE(SafeParseInt64("9223372036854775808", 0,
                                     std::numeric_limits<int64_t>::max()).has_value());
    }
}

TEST_CASE("SplitString - field handling", "[util][string_parsing]") {
    SECTION("Empty input yields no fields") {
        REQUIRE(SplitString("", ':').empty());
    }

    SECTION("Single field") {
        auto parts = SplitString("tcp-echo", ':');
        REQUIRE(parts.size() == 1);
        REQUIRE(parts[0] == "tcp-echo");
    }

    SECTION("Multiple fields") {
        auto parts = SplitString("tcp-echo:udp-echo:admin", ':');
        REQUIRE(parts.size() == 3);
        CHECK(parts[0] == "tcp-echo");
        CHECK(parts[1] == "udp-echo");
        CHECK(parts[2] == "admin");
    }

    SECTION("Empty fields are kept in position") {
        auto parts = SplitString("a::c:", ':');
        REQUIRE(parts.size() == 4);
        CHECK(parts[0] == "a");
        CHECK(parts[1].empty());
        CHECK(parts[2] == "c");
        CHECK(parts[3].empty());
    }
}
