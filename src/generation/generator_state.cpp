#include "idforge/generation/generator_state.h"

#include <array>

namespace idforge::generation {

GeneratorState::GeneratorState(const std::uint32_t object_id_counter_seed,
                               const std::uint64_t cuid2_counter_seed,
                               const std::uint16_t clock_seq_seed,
                               std::string cuid2_fingerprint)
    : object_id_counter_(object_id_counter_seed & kObjectIdCounterMask),
      cuid2_counter_(cuid2_counter_seed),
      cuid2_fingerprint_(std::move(cuid2_fingerprint)),
      clock_seq_(static_cast<std::uint16_t>(clock_seq_seed & kClockSequenceMask)) {}

std::unique_ptr<GeneratorState> GeneratorState::seeded(core::IRandomSource& random,
                                                       std::string cuid2_fingerprint) {
  std::array<std::uint8_t, 5> seed{};
  random.fill(seed);

  const std::uint32_t object_id_seed = (static_cast<std::uint32_t>(seed[0]) << 16u) |
                                       (static_cast<std::uint32_t>(seed[1]) << 8u) |
                                       static_cast<std::uint32_t>(seed[2]);
  const auto clock_seq_seed = static_cast<std::uint16_t>(
      (static_cast<std::uint32_t>(seed[3]) << 8u) | static_cast<std::uint32_t>(seed[4]));
  const std::uint64_t cuid2_seed = core::random_below(random, kCuid2InitialCountMax);

  return std::make_unique<GeneratorState>(object_id_seed, cuid2_seed, clock_seq_seed,
                                          std::move(cuid2_fingerprint));
}

std::uint32_t GeneratorState::next_object_id_counter() {
  // 2^32 is a multiple of 2^24, so masking the wrapped 32-bit value keeps the cycle intact.
  return object_id_counter_.fetch_add(1, std::memory_order_relaxed) & kObjectIdCounterMask;
}

std::uint32_t GeneratorState::next_cuid1_counter() {
  // 2^32 is not a multiple of 36^4; a CAS loop keeps the counter inside the block.
  std::uint32_t current = cuid1_counter_.load(std::memory_order_relaxed);
  std::uint32_t next = 0;
  do {
    next = (current + 1u) % kCuid1CounterModulus;
  } while (!cuid1_counter_.compare_exchange_weak(current, next, std::memory_order_relaxed));
  return current;
}

std::uint64_t GeneratorState::next_cuid2_counter() {
  return cuid2_counter_.fetch_add(1, std::memory_order_relaxed);
}

Uuid1Stamp GeneratorState::next_uuid1_stamp(const std::uint64_t now_ticks) {
  const std::lock_guard<std::mutex> lock(uuid1_mutex_);

  Uuid1Stamp stamp;
  if (uuid1_started_ && now_ticks < last_raw_ticks_) {
    // RFC 4122 §4.2.1: clock moved backwards, change the clock sequence.
    clock_seq_ = static_cast<std::uint16_t>((clock_seq_ + 1u) & kClockSequenceMask);
    stamp.ticks = now_ticks;
    stamp.regressed = true;
  } else if (uuid1_started_ && now_ticks <= last_emitted_ticks_) {
    stamp.ticks = last_emitted_ticks_ + 1u;
  } else {
    stamp.ticks = now_ticks;
  }

  uuid1_started_ = true;
  last_raw_ticks_ = now_ticks;
  last_emitted_ticks_ = stamp.ticks;
  stamp.clock_seq = clock_seq_;
  return stamp;
}

core::Result<domain::UuidBytes, core::GenerationError> GeneratorState::next_ulid(
    const std::uint64_t now_millis, core::IRandomSource& random) {
  using ResultT = core::Result<domain::UuidBytes, core::GenerationError>;

  const std::lock_guard<std::mutex> lock(ulid_mutex_);

  std::uint64_t millis = now_millis;
  std::array<std::uint8_t, 10> randomness{};

  if (ulid_started_ && now_millis <= last_ulid_millis_) {
    millis = last_ulid_millis_;
    randomness = last_ulid_random_;

    // Increment the 80-bit big-endian value with carry.
    int i = static_cast<int>(randomness.size()) - 1;
    for (; i >= 0; --i) {
      auto& byte = randomness[static_cast<std::size_t>(i)];
      byte = static_cast<std::uint8_t>(byte + 1u);
      if (byte != 0u) {
        break;
      }
    }
    if (i < 0) {
      return ResultT::err({core::GenerationErrorCode::kMonotonicOverflow,
                           "ULID randomness exhausted within one millisecond"});
    }
  } else {
    random.fill(randomness);
  }

  ulid_started_ = true;
  last_ulid_millis_ = millis;
  last_ulid_random_ = randomness;

  domain::UuidBytes bytes{};
  for (unsigned i = 0; i < 6u; ++i) {
    bytes[i] = static_cast<std::uint8_t>(millis >> ((5u - i) * 8u));
  }
  for (unsigned i = 0; i < 10u; ++i) {
    bytes[6u + i] = randomness[i];
  }
  return ResultT::ok(bytes);
}

}  // namespace idforge::generation
