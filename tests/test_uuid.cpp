#include "idforge/core/clock.h"
#include "idforge/core/node_identity.h"
#include "idforge/core/random_source.h"
#include "idforge/core/services.h"
#include "idforge/generation/generation_engine.h"

#include <catch2/catch.hpp>

#include <array>
#include <memory>
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

constexpr std::int64_t kOctober2014Millis = 1413859802621;

FixedNodeIdentity test_node() {
  return FixedNodeIdentity({0x08, 0x00, 0x20, 0x0c, 0x9a, 0x66}, {1, 2, 3, 4, 5}, 4242,
                           "build-host");
}

IdentifierSpec uuid_spec(int version) {
  IdentifierSpec spec;
  spec.type = IdType::kUuid;
  spec.version = version;
  return spec;
}

IdentifierSpec named_spec(int version, std::string ns, std::string name) {
  IdentifierSpec spec = uuid_spec(version);
  spec.id_namespace = std::move(ns);
  spec.name = std::move(name);
  return spec;
}

}  // namespace

TEST_CASE("UUID v3 and v5 are deterministic", "[uuid][named]") {
  SequenceRandomSource random;
  FixedClock clock(idforge::core::from_unix_millis(kOctober2014Millis));
  auto node = test_node();
  Services services{random, clock, node};
  GenerationEngine engine(services);

  SECTION("Well-known DNS namespace") {
    const auto v3 = engine.generate(named_spec(3, "DNS", "example.com"));
    const auto v5 = engine.generate(named_spec(5, "dns", "example.com"));
    REQUIRE(v3.has_value());
    REQUIRE(v5.has_value());
    CHECK(v3.value().canonical == "9073926b-929f-31c2-abc9-fad77ae3e8eb");
    CHECK(v5.value().canonical == "cfbff0d1-9375-5685-968c-48ce8b15ae17");
    CHECK(v3.value().version == 3);
    CHECK(v5.value().version == 5);
  }

  SECTION("URL namespace") {
    CHECK(engine.generate(named_spec(3, "URL", "https://example.com")).value().canonical ==
          "68794df6-5e20-385f-ab08-bb73f8a433cb");
    CHECK(engine.generate(named_spec(5, "URL", "https://example.com")).value().canonical ==
          "4fd35a71-71ef-5a55-a9d9-aa75c889a6d0");
  }

  SECTION("Custom namespace UUID") {
    const auto v5 =
        engine.generate(named_spec(5, "550e8400-e29b-41d4-a716-446655440000", "idforge"));
    REQUIRE(v5.has_value());
    CHECK(v5.value().canonical == "285f3687-3eb2-5d60-a4ea-31b220ad01fe");
  }

  SECTION("Repeated calls return identical values") {
    const auto first = engine.generate(named_spec(5, "DNS", "example.com"));
    const auto second = engine.generate(named_spec(5, "DNS", "example.com"));
    CHECK(first.value().canonical == second.value().canonical);
  }
}

TEST_CASE("UUID v3 and v5 argument errors", "[uuid][named][errors]") {
  SequenceRandomSource random;
  SystemClock clock;
  auto node = test_node();
  Services services{random, clock, node};
  GenerationEngine engine(services);

  SECTION("Missing namespace") {
    IdentifierSpec spec = uuid_spec(5);
    spec.name = "example.com";
    const auto result = engine.generate(spec);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == GenerationErrorCode::kInvalidNamespace);
  }

  SECTION("Missing name") {
    IdentifierSpec spec = uuid_spec(3);
    spec.id_namespace = "DNS";
    const auto result = engine.generate(spec);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == GenerationErrorCode::kMissingName);
  }

  SECTION("Unparseable namespace") {
    const auto result = engine.generate(named_spec(5, "not-a-namespace", "example.com"));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == GenerationErrorCode::kInvalidNamespace);
    CHECK(result.error().message.find("not-a-namespace") != std::string::npos);
  }

  SECTION("Unsupported versions") {
    for (const int version : {0, 2, 6, 7}) {
      const auto result = engine.generate(uuid_spec(version));
      REQUIRE_FALSE(result.has_value());
      CHECK(result.error().code == GenerationErrorCode::kUnsupportedType);
    }
  }
}

TEST_CASE("UUID v4 layout", "[uuid][v4]") {
  SystemRandomSource random;
  SystemClock clock;
  auto node = test_node();
  Services services{random, clock, node};
  GenerationEngine engine(services);

  SECTION("Default UUID version is 4") {
    IdentifierSpec spec;
    const auto result = engine.generate(spec);
    REQUIRE(result.has_value());
    CHECK(result.value().version == 4);
    CHECK(result.value().canonical.size() == 36);
    CHECK(result.value().canonical[14] == '4');
  }

  SECTION("Version and variant bits with balanced random bits") {
    constexpr int kSamples = 2000;
    std::array<int, 128> ones{};
    std::set<std::string> seen;

    for (int i = 0; i < kSamples; ++i) {
      const auto result = engine.generate(uuid_spec(4));
      REQUIRE(result.has_value());
      const auto& raw = result.value().raw;
      REQUIRE(raw.size() == 16);
      REQUIRE((raw[6] >> 4u) == 4);
      REQUIRE((raw[8] & 0xc0u) == 0x80u);
      seen.insert(result.value().canonical);

      for (std::size_t bit = 0; bit < 128; ++bit) {
        if ((raw[bit / 8] >> (7 - bit % 8)) & 0x01u) {
          ++ones[bit];
        }
      }
    }

    CHECK(seen.size() == static_cast<std::size_t>(kSamples));

    // Bits 48..51 are the version and 64..65 the variant; every other bit is random.
    for (std::size_t bit = 0; bit < 128; ++bit) {
      const bool fixed = (bit >= 48 && bit < 52) || bit == 64 || bit == 65;
      if (!fixed) {
        CHECK(ones[bit] > kSamples * 4 / 10);
        CHECK(ones[bit] < kSamples * 6 / 10);
      }
    }
  }
}

TEST_CASE("UUID v1 layout and clock handling", "[uuid][v1]") {
  SequenceRandomSource random;
  FixedClock clock(idforge::core::from_unix_millis(kOctober2014Millis));
  auto node = test_node();
  Services services{random, clock, node};
  GenerationEngine engine(services, std::make_unique<GeneratorState>(0, 0, 2904, "fp"));

  SECTION("Timestamp, clock sequence and node are laid out per RFC 4122") {
    const auto result = engine.generate(uuid_spec(1));
    REQUIRE(result.has_value());
    CHECK(result.value().canonical == "f47aaad0-58cc-11e4-8b58-0800200c9a66");
    CHECK_FALSE(result.value().warning.has_value());
  }

  SECTION("Same instant yields distinct, increasing timestamps") {
    const auto first = engine.generate(uuid_spec(1));
    const auto second = engine.generate(uuid_spec(1));
    CHECK(first.value().canonical == "f47aaad0-58cc-11e4-8b58-0800200c9a66");
    CHECK(second.value().canonical == "f47aaad1-58cc-11e4-8b58-0800200c9a66");
  }

  SECTION("Backwards clock bumps the clock sequence and reports a warning") {
    REQUIRE(engine.generate(uuid_spec(1)).has_value());
    clock.advance(-std::chrono::seconds(1));

    const auto result = engine.generate(uuid_spec(1));
    REQUIRE(result.has_value());
    REQUIRE(result.value().warning.has_value());
    CHECK(result.value().warning->code == GenerationErrorCode::kClockRegression);
    // 2905 = 0x0b59, variant bits give 8b59
    CHECK(result.value().canonical.substr(19, 4) == "8b59");
  }
}
