#include "idforge/generation/nanoid.h"

#include <bit>
#include <cstdint>
#include <vector>

namespace idforge::generation {

std::string nanoid(core::IRandomSource& random, std::string_view alphabet,
                   const std::size_t size) {
  // mask = 2^ceil(log2(|alphabet|)) - 1
  const auto top = static_cast<std::uint32_t>((alphabet.size() - 1u) | 1u);
  const std::uint32_t mask = (2u << (31 - std::countl_zero(top))) - 1u;

  // 1.6 compensates for rejected bytes so one draw usually suffices.
  const auto step = static_cast<std::size_t>(
      (16u * static_cast<std::size_t>(mask) * size + 10u * alphabet.size() - 1u) /
      (10u * alphabet.size()));

  std::string id;
  id.reserve(size);
  std::vector<std::uint8_t> bytes(step == 0 ? 1 : step);

  while (id.size() < size) {
    random.fill(bytes);
    for (const std::uint8_t b : bytes) {
      const std::size_t index = b & mask;
      if (index < alphabet.size()) {
        id.push_back(alphabet[index]);
        if (id.size() == size) {
          break;
        }
      }
    }
  }
  return id;
}

}  // namespace idforge::generation
