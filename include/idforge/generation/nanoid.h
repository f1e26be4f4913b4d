#pragma once

#include "idforge/core/random_source.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace idforge::generation {

// Reference NanoID URL-safe alphabet, in the reference's (deliberately scrambled) order.
constexpr std::string_view kNanoIdAlphabet =
    "useandom-26T198340PX75pxJACKVERYMINDBUSHWOLF_GQZbfghjklqvwyzrict";

constexpr int kNanoIdMinLength = 1;
constexpr int kNanoIdMaxLength = 1024;

// nanoid draws size symbols uniformly from alphabet.
//
// Follows the reference customRandom algorithm: each random byte is masked to the
// smallest covering power of two and bytes that land outside the alphabet are
// discarded, so there is no modulo bias for any alphabet size in [2, 256].
[[nodiscard]] std::string nanoid(core::IRandomSource& random, std::string_view alphabet,
                                 std::size_t size);

}  // namespace idforge::generation
