#include "idforge/core/clock.h"
#include "idforge/core/node_identity.h"
#include "idforge/core/random_source.h"
#include "idforge/core/services.h"
#include "idforge/generation/generation_engine.h"
#include "idforge/generation/nanoid.h"

#include <catch2/catch.hpp>

#include <map>
#include <optional>
#include <string>

using idforge::core::FixedNodeIdentity;
using idforge::core::GenerationErrorCode;
using idforge::core::SequenceRandomSource;
using idforge::core::Services;
using idforge::core::SystemClock;
using idforge::core::SystemRandomSource;
using idforge::domain::IdentifierSpec;
using idforge::domain::IdType;
using idforge::generation::GenerationEngine;
using idforge::generation::kNanoIdAlphabet;

namespace {

IdentifierSpec nanoid_spec(std::optional<int> length = std::nullopt) {
  IdentifierSpec spec;
  spec.type = IdType::kNanoId;
  spec.length = length;
  return spec;
}

bool in_alphabet(const std::string& id) {
  return id.find_first_not_of(kNanoIdAlphabet) == std::string::npos;
}

}  // namespace

TEST_CASE("NanoID reference algorithm", "[nanoid]") {
  SECTION("Masked bytes index the alphabet directly") {
    SequenceRandomSource random;
    CHECK(idforge::generation::nanoid(random, kNanoIdAlphabet, 5) == "usean");
  }

  SECTION("Bytes past a short alphabet are skipped") {
    // Alphabet of 3 uses mask 3; byte value 3 has no symbol.
    SequenceRandomSource random({0, 3, 1, 3, 2});
    CHECK(idforge::generation::nanoid(random, "abc", 3) == "abc");
  }
}

TEST_CASE("NanoID generation", "[nanoid]") {
  SystemRandomSource random;
  SystemClock clock;
  FixedNodeIdentity node({1, 2, 3, 4, 5, 6}, {1, 2, 3, 4, 5}, 1, "host");
  Services services{random, clock, node};
  GenerationEngine engine(services);

  SECTION("Default length is 21 from the URL-safe alphabet") {
    const auto result = engine.generate(nanoid_spec());
    REQUIRE(result.has_value());
    CHECK(result.value().canonical.size() == 21);
    CHECK(in_alphabet(result.value().canonical));
  }

  SECTION("Custom lengths at the bounds") {
    CHECK(engine.generate(nanoid_spec(1)).value().canonical.size() == 1);
    CHECK(engine.generate(nanoid_spec(1024)).value().canonical.size() == 1024);
  }

  SECTION("Out-of-range lengths are rejected") {
    for (const int length : {0, -1, 1025}) {
      const auto result = engine.generate(nanoid_spec(length));
      REQUIRE_FALSE(result.has_value());
      CHECK(result.error().code == GenerationErrorCode::kInvalidLength);
    }
  }

  SECTION("Every symbol of the alphabet is reachable") {
    std::map<char, int> histogram;
    for (int i = 0; i < 200; ++i) {
      for (const char ch : engine.generate(nanoid_spec(64)).value().canonical) {
        ++histogram[ch];
      }
    }
    CHECK(histogram.size() == kNanoIdAlphabet.size());
  }
}
