#include "commands/exit_codes.h"
#include "commands/generate_logic.h"
#include "commands/inspect_logic.h"
#include "config.h"
#include "idforge/app/id_service.h"
#include "idforge/core/clock.h"
#include "idforge/core/node_identity.h"
#include "idforge/core/random_source.h"
#include "idforge/core/services.h"
#include "idforge/core/version.h"

#include <iostream>

int main(int argc, char* argv[]) {
  using idforge::cli::kExitSuccess;
  using idforge::cli::kExitUsage;

  const auto parsed = idforge::cli::parse_args(argc, argv);

  if (!parsed.ok()) {
    for (const auto& error : parsed.errors) {
      std::cerr << "Error: " << error << "\n";
    }
    std::cerr << "Run 'idforge_cli --help' for usage.\n";
    return kExitUsage;
  }

  const auto& config = parsed.config;

  if (config.show_help) {
    std::cout << idforge::cli::usage_text(idforge::cli::build_option_registry());
    return kExitSuccess;
  }
  if (config.show_version) {
    std::cout << "idforge " << idforge::core::kBuildVersion << "\n";
    return kExitSuccess;
  }
  if (config.inspect_target.has_value()) {
    return idforge::cli::execute_inspect(config.inspect_target.value(), config.json, std::cout);
  }

  idforge::core::SystemRandomSource random;
  idforge::core::SystemClock clock;
  idforge::core::SystemNodeIdentity node(random);
  idforge::core::Services services{random, clock, node};
  idforge::app::IdService service(services);

  return idforge::cli::execute_generate(config, service, std::cout, std::cerr);
}
