// Unit tests for string parsing utilities
#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"
#include <limits>

using namespace lorasim::util;

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
        REQUIRE(SafeParseInt("0", 0, 100) == 0);
        REQUIRE(SafeParseInt("100", 0, 100) == 100);
    }
}

TEST_CASE("SafeParseInt - invalid inputs", "[util][string_parsing]") {
    REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("abc", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("99999999999999999999", 0, 100).has_value());
}

TEST_CASE("SafeParseInt64 - range", "[util][string_parsing]") {
    REQUIRE(SafeParseInt64("4294967295", 0, std::numeric_limits<uint32_t>::max()) ==
            4294967295LL);
    REQUIRE_FALSE(SafeParseInt64("4294967296", 0, std::numeric_limits<uint32_t>::max()));
    REQUIRE_FALSE(SafeParseInt64("-1", 0, 10));
}

TEST_CASE("SafeParseDouble", "[util][string_parsing]") {
    SECTION("Valid values") {
        REQUIRE(SafeParseDouble("1.5", 0.0, 10.0) == 1.5);
        REQUIRE(SafeParseDouble("0", 0.0, 10.0) == 0.0);
        REQUIRE(SafeParseDouble("2", 0.0, 10.0) == 2.0);
        REQUIRE(SafeParseDouble("1e-3", 0.0, 10.0) == 0.001);
    }

    SECTION("Out of range") {
        REQUIRE_FALSE(SafeParseDouble("-0.1", 0.0, 10.0));
        REQUIRE_FALSE(SafeParseDouble("10.5", 0.0, 10.0));
    }

    SECTION("Not finite") {
        REQUIRE_FALSE(SafeParseDouble("nan", -1e9, 1e9));
        REQUIRE_FALSE(SafeParseDouble("inf", -1e9, 1e9));
        REQUIRE_FALSE(SafeParseDouble("-inf", -1e9, 1e9));
    }

    SECTION("Garbage") {
        REQUIRE_FALSE(SafeParseDouble("", 0.0, 10.0));
        REQUIRE_FALSE(SafeParseDouble("1.5s", 0.0, 10.0));
        REQUIRE_FALSE(SafeParseDouble(" 1.5", 0.0, 10.0));
        REQUIRE_FALSE(SafeParseDouble("abc", 0.0, 10.0));
    }
}

TEST_CASE("IsValidHex", "[util][string_parsing]") {
    REQUIRE(IsValidHex("DEAD"));
    REQUIRE(IsValidHex("deadBEEF0123"));
    REQUIRE_FALSE(IsValidHex(""));
    REQUIRE_FALSE(IsValidHex("DEADG"));
    REQUIRE_FALSE(IsValidHex("DE AD"));
    REQUIRE_FALSE(IsValidHex("0x12"));
}

TEST_CASE("SplitFields", "[util][string_parsing]") {
    SECTION("Unlimited") {
        REQUIRE(SplitFields("a,b,c", ',') == std::vector<std::string>{"a", "b", "c"});
        REQUIRE(SplitFields("", ',') == std::vector<std::string>{""});
        REQUIRE(SplitFields("a,,b,", ',') == std::vector<std::string>{"a", "", "b", ""});
    }

    SECTION("Limit keeps the remainder in the last field") {
        auto fields = SplitFields("1,ND01,node_update,ND01,5,10,20", ',', 3);
        REQUIRE(fields == std::vector<std::string>{"1", "ND01", "node_update,ND01,5,10,20"});
    }

    SECTION("Limit larger than the field count") {
        REQUIRE(SplitFields("a,b", ',', 5) == std::vector<std::string>{"a", "b"});
    }

    SECTION("Limit of one returns the input") {
        REQUIRE(SplitFields("a,b", ',', 1) == std::vector<std::string>{"a,b"});
    }
}

TEST_CASE("Trim", "[util][string_parsing]") {
    REQUIRE(Trim("  abc \t") == "abc");
    REQUIRE(Trim("abc\r\n") == "abc");
    REQUIRE(Trim(" a b ") == "a b");
    REQUIRE(Trim("   ") == "");
    REQUIRE(Trim("") == "");
}
