#pragma once

#include "idforge/core/node_identity.h"
#include "idforge/core/random_source.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace idforge::generation {

// ── CUID v1 ─────────────────────────────────────────────────────────────────
//
// c | timestamp (base36 ms) | counter (4) | fingerprint (4) | random (8)

constexpr std::size_t kCuid1BlockSize = 4;
constexpr std::size_t kCuid1Length = 25;  // holds for timestamps up to 2059-05-25

// cuid1_fingerprint: 2 base36 chars of the pid followed by 2 base36 chars of the host
// name checksum (sum of char codes + length + 36), each left-padded and right-truncated.
[[nodiscard]] std::string cuid1_fingerprint(std::uint64_t process_id, std::string_view host_name);

// cuid1 assembles one CUID v1 from its parts; the random block is drawn from random.
[[nodiscard]] std::string cuid1(std::uint64_t unix_millis, std::uint32_t counter,
                                std::string_view fingerprint, core::IRandomSource& random);

// ── CUID v2 ─────────────────────────────────────────────────────────────────

constexpr int kCuid2MinLength = 2;
constexpr int kCuid2MaxLength = 32;
constexpr std::size_t kCuid2FingerprintLength = 32;

// cuid2_entropy returns length base36 chars drawn uniformly.
[[nodiscard]] std::string cuid2_entropy(core::IRandomSource& random, std::size_t length);

// cuid2_hash: base36(SHA3-512(input)) without its first char.
[[nodiscard]] std::string cuid2_hash(std::string_view input);

// cuid2_fingerprint hashes host facts plus 32 chars of entropy into a 32-char block.
[[nodiscard]] std::string cuid2_fingerprint(const core::INodeIdentity& node,
                                            core::IRandomSource& random);

// cuid2 assembles one CUID v2:
//   random letter ‖ cuid2_hash(time ‖ salt ‖ count ‖ fingerprint)[1 .. length)
[[nodiscard]] std::string cuid2(std::uint64_t unix_millis, std::uint64_t counter,
                                std::string_view fingerprint, std::size_t length,
                                core::IRandomSource& random);

}  // namespace idforge::generation
