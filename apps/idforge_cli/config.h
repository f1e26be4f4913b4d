#pragma once

#include "../shared/arg_parser.h"
#include "idforge/domain/identifier_spec.h"

#include <optional>
#include <string>
#include <vector>

namespace idforge::cli {

// CliConfig holds all parsed flags for idforge_cli.
// Every field has an explicit default; the default run prints one hyphenated UUID v4.
struct CliConfig {
  domain::IdentifierSpec spec;                // NOLINT(readability-identifier-naming)
  int count{1};                               // NOLINT(readability-identifier-naming)
  bool json{false};                           // NOLINT(readability-identifier-naming)
  bool show_help{false};                      // NOLINT(readability-identifier-naming)
  bool show_version{false};                   // NOLINT(readability-identifier-naming)
  std::optional<std::string> inspect_target;  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::vector<apps::Option<CliConfig>> build_option_registry();

// parse_args accepts either flags only, or "inspect <id> [--json]".
[[nodiscard]] apps::ParsedOptions<CliConfig> parse_args(int argc,
                                                        char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

[[nodiscard]] std::string usage_text(const std::vector<apps::Option<CliConfig>>& options);

}  // namespace idforge::cli
