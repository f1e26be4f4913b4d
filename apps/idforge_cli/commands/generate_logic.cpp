#include "generate_logic.h"

#include "exit_codes.h"
#include "idforge/domain/classification_json.h"

#include <nlohmann/json.hpp>

namespace idforge::cli {

int execute_generate(const CliConfig& config, app::IdService& service, std::ostream& out,
                     std::ostream& err) {
  const auto batch = service.generate_batch(config.spec, config.count);
  if (!batch.has_value()) {
    if (config.json) {
      out << domain::error_to_json(batch.error()).dump(2) << "\n";
    }
    err << "Error: " << batch.error().message << "\n";
    return exit_code_for(batch.error());
  }

  for (const auto& warning : batch.value().warnings) {
    err << "Warning: " << warning.message << "\n";
  }

  if (config.json) {
    out << domain::batch_to_json(config.spec, batch.value().ids).dump(2) << "\n";
  } else {
    for (const auto& id : batch.value().ids) {
      out << id << "\n";
    }
  }
  return kExitSuccess;
}

}  // namespace idforge::cli
