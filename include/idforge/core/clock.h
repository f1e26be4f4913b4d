#pragma once

#include "idforge/core/time.h"

#include <atomic>

namespace idforge::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests use fixed or stepped timestamps.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return the current wall-clock time (UTC).
  // Callers derive seconds, milliseconds or 100 ns ticks via core/time.h.
  virtual Timestamp now() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  Timestamp now() override;
};

// Fixed clock: returns a settable timestamp for deterministic tests.
// Thread-safe: set() and advance() may race with now() from other threads.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(Timestamp fixed_time) : ticks_(fixed_time.time_since_epoch().count()) {}
  ~FixedClock() override = default;

  // Not copyable or movable (contains atomic)
  FixedClock(const FixedClock&) = delete;
  FixedClock& operator=(const FixedClock&) = delete;
  FixedClock(FixedClock&&) = delete;
  FixedClock& operator=(FixedClock&&) = delete;

  Timestamp now() override;

  void set(Timestamp time);
  void advance(Clock::duration delta);

 private:
  std::atomic<Clock::rep> ticks_;
};

}  // namespace idforge::core
