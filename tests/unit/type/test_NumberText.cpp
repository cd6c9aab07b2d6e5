#include <doctest/doctest.h>

#include "type/NumberText.hpp"

using namespace SD;

TEST_SUITE("type.number_text") {

TEST_CASE("parseNumber accepts signs, fractions and exponents") {
    CHECK(parseNumber("42") == 42.0f);
    CHECK(parseNumber("-0.5") == -0.5f);
    CHECK(parseNumber("+3") == 3.0f);
    CHECK(parseNumber("1e2") == 100.0f);
    CHECK(parseNumber("2.5E-1") == 0.25f);
}

TEST_CASE("parseNumber rejects partial and non-finite input") {
    CHECK_FALSE(parseNumber("").has_value());
    CHECK_FALSE(parseNumber("+").has_value());
    CHECK_FALSE(parseNumber("+-1").has_value());
    CHECK_FALSE(parseNumber("1.2.3").has_value());
    CHECK_FALSE(parseNumber("10-20").has_value());
    CHECK_FALSE(parseNumber("abc").has_value());
    CHECK_FALSE(parseNumber("inf").has_value());
    CHECK_FALSE(parseNumber("nan").has_value());
    CHECK_FALSE(parseNumber("1e40").has_value());
    CHECK_FALSE(parseNumber("1,5").has_value());
}

TEST_CASE("formatNumber writes the shortest round-trip text") {
    CHECK(formatNumber(1.0f) == "1");
    CHECK(formatNumber(0.1f) == "0.1");
    CHECK(formatNumber(-0.25f) == "-0.25");
    CHECK(formatNumber(1000.5f) == "1000.5");
    CHECK(parseNumber(formatNumber(3.14159f)) == 3.14159f);
}

} // TEST_SUITE
