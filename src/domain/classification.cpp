#include "idforge/domain/classification.h"

namespace idforge::domain {

std::string confidence_to_string(Confidence confidence) {
  switch (confidence) {
    case Confidence::kLow:
      return "low";
    case Confidence::kMedium:
      return "medium";
    case Confidence::kHigh:
      return "high";
  }
  return "unknown";
}

}  // namespace idforge::domain
