#include "idforge/core/clock.h"

namespace idforge::core {

Timestamp SystemClock::now() {
  return now_utc();
}

Timestamp FixedClock::now() {
  return Timestamp{Clock::duration{ticks_.load(std::memory_order_relaxed)}};
}

void FixedClock::set(const Timestamp time) {
  ticks_.store(time.time_since_epoch().count(), std::memory_order_relaxed);
}

void FixedClock::advance(const Clock::duration delta) {
  ticks_.fetch_add(delta.count(), std::memory_order_relaxed);
}

}  // namespace idforge::core
