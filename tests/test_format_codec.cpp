#include "idforge/format/format_codec.h"

#include <catch2/catch.hpp>

#include <string>

using idforge::domain::GeneratedId;
using idforge::domain::IdType;
using idforge::domain::UuidFormat;
using idforge::format::format_uuid;
using idforge::format::parse_uuid;
using idforge::format::render;

namespace {

constexpr const char* kHyphenated = "550e8400-e29b-41d4-a716-446655440000";

GeneratedId sample_uuid() {
  GeneratedId id;
  id.type = IdType::kUuid;
  id.version = 4;
  const auto bytes = parse_uuid(kHyphenated).value();
  id.raw.assign(bytes.begin(), bytes.end());
  id.canonical = kHyphenated;
  return id;
}

}  // namespace

TEST_CASE("UUID text forms", "[format][uuid]") {
  const auto bytes = parse_uuid(kHyphenated);
  REQUIRE(bytes.has_value());

  CHECK(format_uuid(bytes.value(), UuidFormat::kHyphenated) == kHyphenated);
  CHECK(format_uuid(bytes.value(), UuidFormat::kSimple) == "550e8400e29b41d4a716446655440000");
  CHECK(format_uuid(bytes.value(), UuidFormat::kUrn) ==
        "urn:uuid:550e8400-e29b-41d4-a716-446655440000");
}

TEST_CASE("parse_uuid accepted and rejected inputs", "[format][uuid]") {
  const auto expected = parse_uuid(kHyphenated);
  REQUIRE(expected.has_value());

  SECTION("Alternative spellings decode to the same bytes") {
    CHECK(parse_uuid("550e8400e29b41d4a716446655440000") == expected);
    CHECK(parse_uuid("550E8400-E29B-41D4-A716-446655440000") == expected);
    CHECK(parse_uuid("URN:UUID:550e8400-e29b-41d4-a716-446655440000") == expected);
    CHECK(parse_uuid("{550e8400-e29b-41d4-a716-446655440000}") == expected);
  }

  SECTION("Malformed inputs are rejected") {
    CHECK_FALSE(parse_uuid("").has_value());
    CHECK_FALSE(parse_uuid("550e8400-e29b41d4-a716-446655440000-").has_value());
    CHECK_FALSE(parse_uuid("550e8400-e29b-41d4-a716-44665544000g").has_value());
    CHECK_FALSE(parse_uuid("550e8400e29b41d4a71644665544000").has_value());
    CHECK_FALSE(parse_uuid(" 550e8400-e29b-41d4-a716-446655440000").has_value());
  }
}

TEST_CASE("render applies format, prefix and suffix", "[format][render]") {
  SECTION("UUID format selection") {
    const auto id = sample_uuid();
    CHECK(render(id, UuidFormat::kSimple, "", "") == "550e8400e29b41d4a716446655440000");
    CHECK(render(id, UuidFormat::kUrn, "", "") == "urn:uuid:550e8400-e29b-41d4-a716-446655440000");
  }

  SECTION("Prefix and suffix are concatenated verbatim") {
    CHECK(render(sample_uuid(), UuidFormat::kHyphenated, "user_", ".log") ==
          "user_550e8400-e29b-41d4-a716-446655440000.log");
  }

  SECTION("Non-UUID types ignore the format") {
    GeneratedId id;
    id.type = IdType::kUlid;
    id.canonical = "01ARZ3NDEKTSV4RRFFQ69G5FAV";
    CHECK(render(id, UuidFormat::kSimple, "[", "]") == "[01ARZ3NDEKTSV4RRFFQ69G5FAV]");
  }
}
