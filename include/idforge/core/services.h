#pragma once

#include "idforge/core/clock.h"
#include "idforge/core/node_identity.h"
#include "idforge/core/random_source.h"

namespace idforge::core {

// Services is a composition root that bundles the engine's capability dependencies.
// It holds references (not ownership) to the random source, clock and node identity.
// The CLI or other entry points are responsible for creating concrete instances
// and managing their lifetimes.
struct Services {
  IRandomSource& random;  // NOLINT(readability-identifier-naming)
  IClock& clock;          // NOLINT(readability-identifier-naming)
  INodeIdentity& node;    // NOLINT(readability-identifier-naming)

  Services(IRandomSource& random, IClock& clock, INodeIdentity& node)
      : random(random), clock(clock), node(node) {}

  ~Services() = default;

  // Prevent copying and moving to avoid accidental lifetime issues
  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace idforge::core
