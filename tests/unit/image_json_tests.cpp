#include <doctest/doctest.h>
#include <gbl/image.hpp>
#include <gbl/image_json.hpp>

#include "image_builder.hpp"

using gbl::json::image_to_json;
using gbl::json::parse_options_from_json;
using namespace gbl_test;

TEST_CASE("image_to_json describes header and elements") {
    auto data = finish(concat({header(0x03000000, 2), program(0x00020000, Bytes(6, 0))}));
    auto res = gbl::parse(data);
    REQUIRE(res.ok);

    auto j = image_to_json(res.image);
    CHECK(j["header"]["tag"] == "0x03a617eb");
    CHECK(j["header"]["length"] == 8);
    CHECK(j["header"]["version"] == "0x03000000");
    CHECK(j["header"]["type"] == 2);

    REQUIRE(j["elements"].is_array());
    REQUIRE(j["elements"].size() == 2);

    const auto& prog = j["elements"][0];
    CHECK(prog["tag"] == "0xfe0101fe");
    CHECK(prog["kind"] == "program");
    CHECK(prog["length"] == 10);
    CHECK(prog["flash_start_address"] == "0x00020000");
    CHECK(prog["size"] == 6);

    const auto& end = j["elements"][1];
    CHECK(end["kind"] == "end");
    CHECK(end["tag"] == "0xfc0404fc");
    CHECK(end.contains("ebl_crc"));
}

TEST_CASE("parse_options_from_json reads both options") {
    auto res = parse_options_from_json(R"({"payload_bounds": "to_buffer_end", "verify_checksum": false})");
    REQUIRE(res.ok);
    CHECK(res.value.payload_bounds == gbl::PayloadBounds::to_buffer_end);
    CHECK_FALSE(res.value.verify_checksum);
    CHECK(res.warnings.empty());
}

TEST_CASE("parse_options_from_json keeps defaults for missing keys") {
    auto res = parse_options_from_json("{}");
    REQUIRE(res.ok);
    CHECK(res.value.payload_bounds == gbl::PayloadBounds::declared);
    CHECK(res.value.verify_checksum);
}

TEST_CASE("parse_options_from_json warns on unknown keys") {
    auto res = parse_options_from_json(R"({"verbose": true})");
    REQUIRE(res.ok);
    REQUIRE(res.warnings.size() == 1);
    CHECK(res.warnings[0] == "unknown_option:verbose");
}

TEST_CASE("parse_options_from_json rejects invalid input") {
    CHECK_FALSE(parse_options_from_json(R"({"payload_bounds": "bogus"})").ok);
    CHECK_FALSE(parse_options_from_json(R"({"payload_bounds": 3})").ok);
    CHECK_FALSE(parse_options_from_json(R"({"verify_checksum": "yes"})").ok);
    CHECK_FALSE(parse_options_from_json("[]").ok);

    auto bad = parse_options_from_json("{not json");
    CHECK_FALSE(bad.ok);
    CHECK(bad.error.find("JSON parse error") != std::string::npos);
}
