#include "idforge/core/node_identity.h"

#include <unistd.h>

#include <array>

namespace idforge::core {

namespace {

constexpr std::size_t kHostNameMax = 256;

std::string read_host_name() {
  std::array<char, kHostNameMax + 1> buf{};
  if (::gethostname(buf.data(), kHostNameMax) != 0) {
    return "localhost";
  }
  return std::string{buf.data()};
}

}  // namespace

SystemNodeIdentity::SystemNodeIdentity(IRandomSource& random)
    : process_id_(static_cast<std::uint64_t>(::getpid())), host_name_(read_host_name()) {
  random.fill(node_id_);
  node_id_[0] |= 0x01u;  // multicast bit: marks a non-hardware node id
  random.fill(session_);
}

}  // namespace idforge::core
