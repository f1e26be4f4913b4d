#include "idforge/generation/cuid.h"

#include "idforge/core/sha3.h"
#include "idforge/format/encoding.h"
#include "idforge/generation/generator_state.h"

namespace idforge::generation {

namespace {

constexpr std::size_t kCuid1FingerprintPadding = 2;

std::string cuid1_random_block(core::IRandomSource& random) {
  return format::pad_base36(format::to_base36(core::random_below(random, kCuid1CounterModulus)),
                            kCuid1BlockSize);
}

}  // namespace

std::string cuid1_fingerprint(const std::uint64_t process_id, std::string_view host_name) {
  std::uint64_t host_id = host_name.size() + 36u;
  for (const char ch : host_name) {
    host_id += static_cast<unsigned char>(ch);
  }
  return format::pad_base36(format::to_base36(process_id), kCuid1FingerprintPadding) +
         format::pad_base36(format::to_base36(host_id), kCuid1FingerprintPadding);
}

std::string cuid1(const std::uint64_t unix_millis, const std::uint32_t counter,
                  std::string_view fingerprint, core::IRandomSource& random) {
  std::string id = "c";
  id += format::to_base36(unix_millis);
  id += format::pad_base36(format::to_base36(counter), kCuid1BlockSize);
  id += fingerprint;
  id += cuid1_random_block(random);
  id += cuid1_random_block(random);
  return id;
}

std::string cuid2_entropy(core::IRandomSource& random, const std::size_t length) {
  std::string entropy;
  entropy.reserve(length);
  while (entropy.size() < length) {
    entropy.push_back(format::kBase36Alphabet[core::random_below(random, 36u)]);
  }
  return entropy;
}

std::string cuid2_hash(std::string_view input) {
  // The leading digit is dropped because it skews the character histogram.
  const core::Sha3_512Digest digest = core::sha3_512_digest(input);
  return format::bytes_to_base36(digest).substr(1);
}

std::string cuid2_fingerprint(const core::INodeIdentity& node, core::IRandomSource& random) {
  const std::string source = node.host_name() + std::to_string(node.process_id()) +
                             cuid2_entropy(random, kCuid2FingerprintLength);
  return cuid2_hash(source).substr(0, kCuid2FingerprintLength);
}

std::string cuid2(const std::uint64_t unix_millis, const std::uint64_t counter,
                  std::string_view fingerprint, const std::size_t length,
                  core::IRandomSource& random) {
  const char first_letter = static_cast<char>('a' + core::random_below(random, 26u));
  const std::string time = format::to_base36(unix_millis);
  const std::string count = format::to_base36(counter);
  const std::string salt = cuid2_entropy(random, length);

  std::string hash_input = time;
  hash_input += salt;
  hash_input += count;
  hash_input += fingerprint;

  std::string id(1, first_letter);
  id += cuid2_hash(hash_input).substr(1, length - 1);
  return id;
}

}  // namespace idforge::generation
