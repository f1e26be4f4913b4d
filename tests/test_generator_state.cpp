#include "idforge/core/random_source.h"
#include "idforge/generation/generator_state.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <set>
#include <thread>
#include <vector>

using idforge::core::GenerationErrorCode;
using idforge::core::SequenceRandomSource;
using idforge::generation::GeneratorState;

TEST_CASE("GeneratorState ObjectID counter wraps at 2^24", "[state][objectid]") {
  GeneratorState state(0xfffffeu, 0, 0, "fp");

  CHECK(state.next_object_id_counter() == 0xfffffeu);
  CHECK(state.next_object_id_counter() == 0xffffffu);
  CHECK(state.next_object_id_counter() == 0u);
  CHECK(state.next_object_id_counter() == 1u);
}

TEST_CASE("CUID counters", "[state][cuid]") {
  GeneratorState state(0, 476782300u, 0, "fp");

  SECTION("CUID v1 counter starts at zero and increments") {
    CHECK(state.next_cuid1_counter() == 0u);
    CHECK(state.next_cuid1_counter() == 1u);
    CHECK(state.next_cuid1_counter() == 2u);
  }

  SECTION("CUID v2 counter continues from its seed") {
    CHECK(state.next_cuid2_counter() == 476782300u);
    CHECK(state.next_cuid2_counter() == 476782301u);
  }
}

TEST_CASE("Concurrent counter draws never repeat", "[state][concurrency]") {
  GeneratorState state(0, 0, 0, "fp");
  constexpr int kThreads = 4;
  constexpr int kPerThread = 1000;

  std::vector<std::vector<std::uint32_t>> drawn(kThreads);
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&state, &drawn, t] {
      for (int i = 0; i < kPerThread; ++i) {
        drawn[static_cast<std::size_t>(t)].push_back(state.next_cuid1_counter());
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  std::set<std::uint32_t> unique;
  for (const auto& values : drawn) {
    unique.insert(values.begin(), values.end());
  }
  CHECK(unique.size() == static_cast<std::size_t>(kThreads * kPerThread));
}

TEST_CASE("Concurrent ObjectID counter draws never repeat", "[state][objectid][concurrency]") {
  GeneratorState state(0xfff000u, 0, 0, "fp");
  constexpr int kThreads = 4;
  constexpr int kPerThread = 5000;

  std::vector<std::vector<std::uint32_t>> drawn(kThreads);
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&state, &drawn, t] {
      for (int i = 0; i < kPerThread; ++i) {
        drawn[static_cast<std::size_t>(t)].push_back(state.next_object_id_counter());
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  // The seed sits 4096 below the wrap, so the draws cross it.
  std::set<std::uint32_t> unique;
  for (const auto& values : drawn) {
    for (const auto value : values) {
      CHECK(value <= idforge::generation::kObjectIdCounterMask);
    }
    unique.insert(values.begin(), values.end());
  }
  CHECK(unique.size() == static_cast<std::size_t>(kThreads * kPerThread));
  CHECK(unique.count(0u) == 1);
}

TEST_CASE("UUID v1 stamps", "[state][uuid1]") {
  GeneratorState state(0, 0, 0x0123u, "fp");

  SECTION("Advancing clock keeps the clock sequence") {
    const auto first = state.next_uuid1_stamp(1000);
    const auto second = state.next_uuid1_stamp(2000);
    CHECK(first.ticks == 1000u);
    CHECK(second.ticks == 2000u);
    CHECK(first.clock_seq == 0x0123u);
    CHECK(second.clock_seq == 0x0123u);
    CHECK_FALSE(second.regressed);
  }

  SECTION("Repeated tick is bumped to stay unique") {
    (void)state.next_uuid1_stamp(1000);
    const auto again = state.next_uuid1_stamp(1000);
    CHECK(again.ticks == 1001u);
    CHECK_FALSE(again.regressed);
  }

  SECTION("Clock regression advances the clock sequence") {
    (void)state.next_uuid1_stamp(5000);
    const auto back = state.next_uuid1_stamp(4000);
    CHECK(back.regressed);
    CHECK(back.ticks == 4000u);
    CHECK(back.clock_seq == 0x0124u);
  }
}

TEST_CASE("ULID monotonic state", "[state][ulid]") {
  SequenceRandomSource random({0x10, 0x20, 0x30});
  GeneratorState state(0, 0, 0, "fp");

  SECTION("Same millisecond increments the random component") {
    const auto first = state.next_ulid(1000, random);
    const auto second = state.next_ulid(1000, random);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(second.value()[15] == static_cast<std::uint8_t>(first.value()[15] + 1u));
    CHECK(first.value() < second.value());
  }

  SECTION("Earlier millisecond reuses the last timestamp") {
    const auto first = state.next_ulid(2000, random);
    const auto earlier = state.next_ulid(1500, random);
    REQUIRE(first.has_value());
    REQUIRE(earlier.has_value());
    CHECK(first.value() < earlier.value());
    CHECK(std::equal(first.value().begin(), first.value().begin() + 6, earlier.value().begin()));
  }

  SECTION("Randomness overflow is reported and leaves state unchanged") {
    SequenceRandomSource saturated({0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff});
    const auto first = state.next_ulid(3000, saturated);
    REQUIRE(first.has_value());

    const auto overflow = state.next_ulid(3000, saturated);
    REQUIRE_FALSE(overflow.has_value());
    CHECK(overflow.error().code == GenerationErrorCode::kMonotonicOverflow);

    // A later millisecond draws fresh randomness and succeeds.
    const auto later = state.next_ulid(3001, random);
    REQUIRE(later.has_value());
    CHECK(first.value() < later.value());
  }
}
