#pragma once

#include "idforge/core/result.h"

namespace idforge::cli {

// Exit codes follow the usual Unix convention.
constexpr int kExitSuccess = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

// Invalid requests are usage errors; running out of monotonic space is a runtime failure.
[[nodiscard]] inline int exit_code_for(const core::GenerationError& error) {
  return error.code == core::GenerationErrorCode::kMonotonicOverflow ? kExitError : kExitUsage;
}

}  // namespace idforge::cli
