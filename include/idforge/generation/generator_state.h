#pragma once

#include "idforge/core/random_source.h"
#include "idforge/core/result.h"
#include "idforge/domain/generated_id.h"

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace idforge::generation {

constexpr std::uint32_t kObjectIdCounterMask = 0xffffffu;  // 24-bit counter
constexpr std::uint32_t kCuid1CounterModulus = 1679616u;   // 36^4, one 4-char block
constexpr std::uint32_t kCuid2InitialCountMax = 476782367u;
constexpr std::uint16_t kClockSequenceMask = 0x3fffu;      // 14 bits

// Uuid1Stamp is the time/sequence pair for one UUID v1.
struct Uuid1Stamp {
  std::uint64_t ticks{0};       // NOLINT(readability-identifier-naming)
  std::uint16_t clock_seq{0};   // NOLINT(readability-identifier-naming)
  bool regressed{false};        // NOLINT(readability-identifier-naming)
};

// GeneratorState holds every piece of mutable state the engine needs across calls:
// the ObjectID and CUID counters, the UUID v1 clock sequence and the ULID monotonic
// state. It is owned by one GenerationEngine and is the only engine-owned mutable state.
//
// Thread-safe. Counters are atomics; UUID v1 and ULID state each sit behind a mutex.
// Two engines never share a GeneratorState, so uniqueness guarantees are per engine.
class GeneratorState {
 public:
  GeneratorState(std::uint32_t object_id_counter_seed, std::uint64_t cuid2_counter_seed,
                 std::uint16_t clock_seq_seed, std::string cuid2_fingerprint);
  ~GeneratorState() = default;

  // Not copyable or movable (contains atomics and mutexes)
  GeneratorState(const GeneratorState&) = delete;
  GeneratorState& operator=(const GeneratorState&) = delete;
  GeneratorState(GeneratorState&&) = delete;
  GeneratorState& operator=(GeneratorState&&) = delete;

  // seeded draws every seed from random, as the reference implementations do at startup.
  [[nodiscard]] static std::unique_ptr<GeneratorState> seeded(core::IRandomSource& random,
                                                              std::string cuid2_fingerprint);

  // Next 24-bit ObjectID counter value; wraps to 0 after 0xffffff.
  [[nodiscard]] std::uint32_t next_object_id_counter();

  // Next CUID v1 counter value in [0, 36^4).
  [[nodiscard]] std::uint32_t next_cuid1_counter();

  // Next CUID v2 counter value; starts below 476782367 and only grows.
  [[nodiscard]] std::uint64_t next_cuid2_counter();

  [[nodiscard]] const std::string& cuid2_fingerprint() const { return cuid2_fingerprint_; }

  // next_uuid1_stamp turns a raw clock reading into a unique (ticks, clock_seq) pair.
  // - Clock behind the previous raw reading: clock sequence is bumped, regressed = true.
  // - Clock not past the previous emitted ticks: ticks step to previous + 1.
  [[nodiscard]] Uuid1Stamp next_uuid1_stamp(std::uint64_t now_ticks);

  // next_ulid returns the 16-byte ULID for now_millis.
  // Within the same (or an earlier) millisecond the previous randomness is incremented by
  // one instead of redrawn; exhausting all 80 bits yields kMonotonicOverflow.
  [[nodiscard]] core::Result<domain::UuidBytes, core::GenerationError> next_ulid(
      std::uint64_t now_millis, core::IRandomSource& random);

 private:
  std::atomic<std::uint32_t> object_id_counter_;
  std::atomic<std::uint32_t> cuid1_counter_{0};
  std::atomic<std::uint64_t> cuid2_counter_;
  const std::string cuid2_fingerprint_;

  std::mutex uuid1_mutex_;
  std::uint16_t clock_seq_;
  bool uuid1_started_{false};
  std::uint64_t last_raw_ticks_{0};
  std::uint64_t last_emitted_ticks_{0};

  std::mutex ulid_mutex_;
  bool ulid_started_{false};
  std::uint64_t last_ulid_millis_{0};
  std::array<std::uint8_t, 10> last_ulid_random_{};
};

}  // namespace idforge::generation
