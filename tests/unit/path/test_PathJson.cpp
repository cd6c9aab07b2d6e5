#include <doctest/doctest.h>

#include "path/PathJson.hpp"

#include <nlohmann/json.hpp>

using namespace SD;

TEST_SUITE("path.json") {

TEST_CASE("export lists every segment with its operands") {
    auto path = PathData::parse("M 0,0 10,10 z");
    REQUIRE(path.has_value());

    auto json = nlohmann::json::parse(PathJsonExporter::Export(*path));
    CHECK(json["canonical"] == "M 0 0 10 10 z ");
    REQUIRE(json["segments"].size() == 3);

    auto const& move = json["segments"][0];
    CHECK(move["command"] == "M");
    CHECK(move["type"] == "MoveTo");
    CHECK(move["absolute"] == true);
    CHECK(move["operands"] == nlohmann::json::array({0.0, 0.0}));

    auto const& line = json["segments"][1];
    CHECK(line["command"] == "L");
    CHECK(line["type"] == "LineTo");

    auto const& close = json["segments"][2];
    CHECK(close["command"] == "z");
    CHECK(close["absolute"] == false);
    CHECK(close["operands"].empty());
}

TEST_CASE("export can omit the canonical text and indent") {
    auto path = PathData::parse("H 5");
    REQUIRE(path.has_value());

    auto text = PathJsonExporter::Export(*path, PathJsonOptions{.indent = -1, .includeCanonical = false});
    CHECK(text.find('\n') == std::string::npos);
    auto json = nlohmann::json::parse(text);
    CHECK_FALSE(json.contains("canonical"));
    CHECK(json["segments"][0]["operands"][0] == 5.0);
}

TEST_CASE("operands carry the digits of the canonical text") {
    auto path = PathData::parse("M 0.1 -2.3 L 0.25 1000.5");
    REQUIRE(path.has_value());

    auto text = PathJsonExporter::Export(*path, PathJsonOptions{.indent = -1});
    CHECK(text.find("[0.1,-2.3]") != std::string::npos);
    CHECK(text.find("[0.25,1000.5]") != std::string::npos);

    auto json = nlohmann::json::parse(text);
    CHECK(json["canonical"] == "M 0.1 -2.3 0.25 1000.5 ");
    CHECK(json["segments"][0]["operands"][0].get<double>() == 0.1);
    CHECK(json["segments"][1]["operands"][1].get<double>() == 1000.5);
}

} // TEST_SUITE
