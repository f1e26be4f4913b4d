#include "idforge/core/clock.h"
#include "idforge/core/node_identity.h"
#include "idforge/core/random_source.h"
#include "idforge/core/services.h"
#include "idforge/format/encoding.h"
#include "idforge/generation/cuid.h"
#include "idforge/generation/generation_engine.h"

#include <catch2/catch.hpp>

#include <memory>
#include <optional>
#include <set>
#include <string>

using idforge::core::FixedClock;
using idforge::core::FixedNodeIdentity;
using idforge::core::GenerationErrorCode;
using idforge::core::SequenceRandomSource;
using idforge::core::Services;
using idforge::core::SystemClock;
using idforge::core::SystemRandomSource;
using idforge::domain::IdentifierSpec;
using idforge::domain::IdType;
using idforge::generation::GenerationEngine;
using idforge::generation::GeneratorState;

namespace {

IdentifierSpec cuid_spec(std::optional<int> version, std::optional<int> length = std::nullopt) {
  IdentifierSpec spec;
  spec.type = IdType::kCuid;
  spec.version = version;
  spec.length = length;
  return spec;
}

FixedNodeIdentity build_host() {
  return FixedNodeIdentity({1, 2, 3, 4, 5, 6}, {1, 2, 3, 4, 5}, 4242, "build-host");
}

}  // namespace

TEST_CASE("CUID v1 fingerprint", "[cuid][v1]") {
  // pid 4242 is "39u" in base36 and host checksum 1065 is "tl"; each keeps two characters.
  CHECK(idforge::generation::cuid1_fingerprint(4242, "build-host") == "9utl");
  CHECK(idforge::generation::cuid1_fingerprint(0, "").size() == 4);
}

TEST_CASE("CUID v1 layout", "[cuid][v1]") {
  SequenceRandomSource random({0x00, 0x00, 0x00, 0x01});
  FixedClock clock(idforge::core::from_unix_millis(1413859802621));
  auto node = build_host();
  Services services{random, clock, node};
  GenerationEngine engine(services, std::make_unique<GeneratorState>(0, 0, 0, "fp"));

  SECTION("c + timestamp + counter + fingerprint + two random blocks") {
    const auto result = engine.generate(cuid_spec(1));
    REQUIRE(result.has_value());
    CHECK(result.value().canonical == "ci1inmdq500009utl00010001");
    CHECK(result.value().canonical.size() == idforge::generation::kCuid1Length);
    CHECK(result.value().version == 1);
  }

  SECTION("Counter block advances per call") {
    const auto first = engine.generate(cuid_spec(1));
    const auto second = engine.generate(cuid_spec(1));
    CHECK(first.value().canonical.substr(9, 4) == "0000");
    CHECK(second.value().canonical.substr(9, 4) == "0001");
  }
}

TEST_CASE("CUID v2 generation", "[cuid][v2]") {
  SystemRandomSource random;
  SystemClock clock;
  auto node = build_host();
  Services services{random, clock, node};
  GenerationEngine engine(services);

  SECTION("Default version is 2 with length 24") {
    const auto result = engine.generate(cuid_spec(std::nullopt));
    REQUIRE(result.has_value());
    const auto& id = result.value().canonical;
    CHECK(result.value().version == 2);
    CHECK(id.size() == 24);
    CHECK(id.front() >= 'a');
    CHECK(id.front() <= 'z');
    CHECK(idforge::format::is_base36_lower(id));
  }

  SECTION("Length bounds") {
    CHECK(engine.generate(cuid_spec(2, 2)).value().canonical.size() == 2);
    CHECK(engine.generate(cuid_spec(2, 32)).value().canonical.size() == 32);

    for (const int length : {1, 33, 0, -4}) {
      const auto result = engine.generate(cuid_spec(2, length));
      REQUIRE_FALSE(result.has_value());
      CHECK(result.error().code == GenerationErrorCode::kInvalidLength);
    }
  }

  SECTION("Unsupported version") {
    const auto result = engine.generate(cuid_spec(3));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == GenerationErrorCode::kUnsupportedType);
  }

  SECTION("No collisions in a modest sample") {
    std::set<std::string> seen;
    for (int i = 0; i < 2000; ++i) {
      seen.insert(engine.generate(cuid_spec(2)).value().canonical);
    }
    CHECK(seen.size() == 2000);
  }
}

TEST_CASE("CUID v2 hash drops the leading base36 digit", "[cuid][v2]") {
  const std::string hash = idforge::generation::cuid2_hash("abc");
  CHECK(idforge::format::is_base36_lower(hash));
  CHECK(hash.size() >= 90);
  CHECK(hash == idforge::generation::cuid2_hash("abc"));
  CHECK(hash != idforge::generation::cuid2_hash("abd"));
}
