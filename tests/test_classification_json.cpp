#include "idforge/domain/classification_json.h"
#include "idforge/inspection/inspection_classifier.h"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using idforge::domain::IdentifierSpec;
using idforge::domain::IdType;

TEST_CASE("Inspection JSON", "[json][inspection]") {
  const std::string input = "f47ac10b-58cc-11e4-8b58-0800200c9a66";
  const auto j = idforge::domain::inspection_to_json(input, idforge::inspection::inspect(input));

  REQUIRE(j["candidates"].is_array());
  REQUIRE(j["candidates"].size() == 1);
  CHECK(j["input"] == input);

  const auto& first = j["candidates"][0];
  CHECK(first["type"] == "UUID");
  CHECK(first["version"] == 1);
  CHECK(first["confidence"] == "high");
  CHECK(first["decoded"]["node_id"] == "08:00:20:0c:9a:66");
  CHECK(first["decoded"]["clock_sequence"] == "2904");
}

TEST_CASE("Inspection JSON for unknown input", "[json][inspection]") {
  const auto j = idforge::domain::inspection_to_json("???", {});
  CHECK(j["candidates"].is_array());
  CHECK(j["candidates"].empty());
}

TEST_CASE("Candidate JSON omits an absent version", "[json]") {
  const auto candidates = idforge::inspection::inspect("01ARZ3NDEKTSV4RRFFQ69G5FAV");
  REQUIRE(candidates.size() == 1);
  const auto j = idforge::domain::candidate_to_json(candidates[0]);
  CHECK(j["type"] == "ULID");
  CHECK_FALSE(j.contains("version"));
}

TEST_CASE("Batch JSON", "[json][batch]") {
  SECTION("UUID batch reports the effective version and format") {
    IdentifierSpec spec;
    const auto j = idforge::domain::batch_to_json(spec, {"a", "b"});
    CHECK(j["type"] == "UUID");
    CHECK(j["version"] == 4);
    CHECK(j["format"] == "hyphenated");
    CHECK(j["count"] == 2);
    CHECK(j["ids"] == std::vector<std::string>{"a", "b"});
  }

  SECTION("Unversioned types carry no version or format") {
    IdentifierSpec spec;
    spec.type = IdType::kNanoId;
    const auto j = idforge::domain::batch_to_json(spec, {"x"});
    CHECK(j["type"] == "NanoID");
    CHECK_FALSE(j.contains("version"));
    CHECK_FALSE(j.contains("format"));
  }
}

TEST_CASE("Error JSON uses the stable code name", "[json][errors]") {
  const idforge::core::GenerationError error{idforge::core::GenerationErrorCode::kInvalidLength,
                                             "NanoID length must be between 1 and 1024, got 0"};
  const auto j = idforge::domain::error_to_json(error);
  CHECK(j["error"]["code"] == "InvalidLength");
  CHECK(j["error"]["message"] == error.message);
}
