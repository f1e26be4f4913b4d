#include "idforge/core/random_source.h"

#include <algorithm>
#include <array>
#include <cstring>

namespace idforge::core {

void SystemRandomSource::fill(std::span<std::uint8_t> out) {
  const std::lock_guard<std::mutex> lock(mutex_);

  std::size_t offset = 0;
  while (offset < out.size()) {
    // random_device yields unsigned int; copy as many bytes as still needed.
    const unsigned int word = device_();
    const std::size_t n = std::min(sizeof(word), out.size() - offset);
    std::memcpy(out.data() + offset, &word, n);
    offset += n;
  }
}

void SequenceRandomSource::fill(std::span<std::uint8_t> out) {
  const std::lock_guard<std::mutex> lock(mutex_);

  for (auto& byte : out) {
    if (pattern_.empty()) {
      byte = static_cast<std::uint8_t>(position_ & 0xffu);
    } else {
      byte = pattern_[position_ % pattern_.size()];
    }
    ++position_;
  }
}

std::uint32_t random_below(IRandomSource& random, const std::uint32_t bound) {
  // Reject draws from the final partial block so every residue is equally likely.
  const std::uint32_t limit = UINT32_MAX - (UINT32_MAX % bound);
  std::array<std::uint8_t, 4> buf{};
  for (;;) {
    random.fill(buf);
    const std::uint32_t draw = (static_cast<std::uint32_t>(buf[0]) << 24u) |
                               (static_cast<std::uint32_t>(buf[1]) << 16u) |
                               (static_cast<std::uint32_t>(buf[2]) << 8u) |
                               static_cast<std::uint32_t>(buf[3]);
    if (draw < limit) {
      return draw % bound;
    }
  }
}

}  // namespace idforge::core
