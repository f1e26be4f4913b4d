#pragma once

#include "../config.h"
#include "idforge/app/id_service.h"

#include <ostream>

namespace idforge::cli {

// execute_generate: generate config.count identifiers through service and print them to out,
// one per line or as a JSON batch. Warnings and errors go to err. Returns the exit code.
[[nodiscard]] int execute_generate(const CliConfig& config, app::IdService& service,
                                   std::ostream& out, std::ostream& err);

}  // namespace idforge::cli
