#pragma once

namespace idforge::core {

// kBuildVersion is the current software version string.
// Updated once per release slice.
constexpr const char* kBuildVersion = "1.3.0";

}  // namespace idforge::core
