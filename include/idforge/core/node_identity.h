#pragma once

#include "idforge/core/random_source.h"

#include <array>
#include <cstdint>
#include <string>
#include <utility>

namespace idforge::core {

using NodeId = std::array<std::uint8_t, 6>;
using SessionBytes = std::array<std::uint8_t, 5>;

// Abstract node identity: the machine/process facts embedded in time-based identifiers.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class INodeIdentity {
 public:
  virtual ~INodeIdentity() = default;

  // 48-bit node id for UUID v1.
  [[nodiscard]] virtual NodeId node_id() const = 0;

  // Per-session random bytes for ObjectID bytes 4..8.
  [[nodiscard]] virtual SessionBytes object_id_session() const = 0;

  // Process id and host name feed the CUID v1 fingerprint.
  [[nodiscard]] virtual std::uint64_t process_id() const = 0;
  [[nodiscard]] virtual std::string host_name() const = 0;

 protected:
  INodeIdentity() = default;
  INodeIdentity(const INodeIdentity&) = default;
  INodeIdentity& operator=(const INodeIdentity&) = default;
  INodeIdentity(INodeIdentity&&) = default;
  INodeIdentity& operator=(INodeIdentity&&) = default;
};

// Production identity: values are captured once at construction and stay stable for the
// object's lifetime.
//
// The node id is random with the multicast bit set (RFC 4122 §4.5), so it can never
// collide with a real IEEE 802 address. Session bytes are random per instance.
class SystemNodeIdentity final : public INodeIdentity {
 public:
  explicit SystemNodeIdentity(IRandomSource& random);
  ~SystemNodeIdentity() override = default;

  SystemNodeIdentity(const SystemNodeIdentity&) = default;
  SystemNodeIdentity& operator=(const SystemNodeIdentity&) = default;
  SystemNodeIdentity(SystemNodeIdentity&&) = default;
  SystemNodeIdentity& operator=(SystemNodeIdentity&&) = default;

  [[nodiscard]] NodeId node_id() const override { return node_id_; }
  [[nodiscard]] SessionBytes object_id_session() const override { return session_; }
  [[nodiscard]] std::uint64_t process_id() const override { return process_id_; }
  [[nodiscard]] std::string host_name() const override { return host_name_; }

 private:
  NodeId node_id_{};
  SessionBytes session_{};
  std::uint64_t process_id_{0};
  std::string host_name_;
};

// Fixed identity for deterministic tests.
class FixedNodeIdentity final : public INodeIdentity {
 public:
  FixedNodeIdentity(NodeId node_id, SessionBytes session, std::uint64_t process_id,
                    std::string host_name)
      : node_id_(node_id),
        session_(session),
        process_id_(process_id),
        host_name_(std::move(host_name)) {}
  ~FixedNodeIdentity() override = default;

  FixedNodeIdentity(const FixedNodeIdentity&) = default;
  FixedNodeIdentity& operator=(const FixedNodeIdentity&) = default;
  FixedNodeIdentity(FixedNodeIdentity&&) = default;
  FixedNodeIdentity& operator=(FixedNodeIdentity&&) = default;

  [[nodiscard]] NodeId node_id() const override { return node_id_; }
  [[nodiscard]] SessionBytes object_id_session() const override { return session_; }
  [[nodiscard]] std::uint64_t process_id() const override { return process_id_; }
  [[nodiscard]] std::string host_name() const override { return host_name_; }

 private:
  NodeId node_id_;
  SessionBytes session_;
  std::uint64_t process_id_;
  std::string host_name_;
};

}  // namespace idforge::core
