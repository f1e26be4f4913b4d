#include "inspect_logic.h"

#include "exit_codes.h"
#include "idforge/app/id_service.h"
#include "idforge/domain/classification_json.h"

#include <nlohmann/json.hpp>

namespace idforge::cli {

int execute_inspect(const std::string& target, bool json, std::ostream& out) {
  const auto candidates = app::IdService::inspect(target);

  if (json) {
    out << domain::inspection_to_json(target, candidates).dump(2) << "\n";
  } else {
    out << "ID: " << target << "\n";
    out << "Valid: " << (candidates.empty() ? "false" : "true") << "\n";
    if (candidates.empty()) {
      out << "Type: Unknown\n";
    }
    for (const auto& candidate : candidates) {
      out << "Type: " << domain::id_type_to_string(candidate.type);
      if (candidate.version.has_value()) {
        out << " v" << candidate.version.value();
      }
      out << " (confidence: " << domain::confidence_to_string(candidate.confidence) << ")\n";
      for (const auto& [field, value] : candidate.decoded) {
        out << "  " << field << ": " << value << "\n";
      }
    }
  }

  return candidates.empty() ? kExitError : kExitSuccess;
}

}  // namespace idforge::cli
