#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <span>
#include <vector>

namespace idforge::core {

// Abstract random byte source for dependency injection.
// Allows production code to draw from the OS entropy pool while tests use scripted bytes.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IRandomSource {
 public:
  virtual ~IRandomSource() = default;

  // Fill every byte of out.
  // Contract: implementations tolerate concurrent calls from multiple threads.
  virtual void fill(std::span<std::uint8_t> out) = 0;

 protected:
  IRandomSource() = default;
  IRandomSource(const IRandomSource&) = default;
  IRandomSource& operator=(const IRandomSource&) = default;
  IRandomSource(IRandomSource&&) = default;
  IRandomSource& operator=(IRandomSource&&) = default;
};

// Production random source backed by std::random_device (the OS CSPRNG on Linux).
// Thread-safe. random_device invocations are serialized by a mutex.
class SystemRandomSource final : public IRandomSource {
 public:
  SystemRandomSource() = default;
  ~SystemRandomSource() override = default;

  // Not copyable or movable (contains mutex and device handle)
  SystemRandomSource(const SystemRandomSource&) = delete;
  SystemRandomSource& operator=(const SystemRandomSource&) = delete;
  SystemRandomSource(SystemRandomSource&&) = delete;
  SystemRandomSource& operator=(SystemRandomSource&&) = delete;

  void fill(std::span<std::uint8_t> out) override;

 private:
  std::mutex mutex_;
  std::random_device device_;
};

// Deterministic random source: replays a fixed byte pattern cyclically.
// With an empty pattern it emits 0x00, 0x01, 0x02, ... wrapping at 0xff.
// For tests where reproducible output is required.
// Thread-safe. Same sequence of fill() calls produces the same bytes.
class SequenceRandomSource final : public IRandomSource {
 public:
  SequenceRandomSource() = default;
  explicit SequenceRandomSource(std::vector<std::uint8_t> pattern)
      : pattern_(std::move(pattern)) {}
  ~SequenceRandomSource() override = default;

  SequenceRandomSource(const SequenceRandomSource&) = delete;
  SequenceRandomSource& operator=(const SequenceRandomSource&) = delete;
  SequenceRandomSource(SequenceRandomSource&&) = delete;
  SequenceRandomSource& operator=(SequenceRandomSource&&) = delete;

  void fill(std::span<std::uint8_t> out) override;

 private:
  std::mutex mutex_;
  std::vector<std::uint8_t> pattern_;
  std::size_t position_{0};
};

// random_below returns a uniformly distributed value in [0, bound) using rejection
// sampling on 32-bit draws. bound must be non-zero.
[[nodiscard]] std::uint32_t random_below(IRandomSource& random, std::uint32_t bound);

}  // namespace idforge::core
