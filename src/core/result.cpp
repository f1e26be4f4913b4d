#include "idforge/core/result.h"

namespace idforge::core {

const char* error_code_to_string(const GenerationErrorCode code) {
  switch (code) {
    case GenerationErrorCode::kInvalidNamespace:
      return "InvalidNamespace";
    case GenerationErrorCode::kMissingName:
      return "MissingName";
    case GenerationErrorCode::kInvalidLength:
      return "InvalidLength";
    case GenerationErrorCode::kUnsupportedType:
      return "UnsupportedType";
    case GenerationErrorCode::kClockRegression:
      return "ClockRegression";
    case GenerationErrorCode::kMonotonicOverflow:
      return "MonotonicOverflow";
  }
  return "Unknown";
}

}  // namespace idforge::core
