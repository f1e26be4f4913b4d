#pragma once

#include <ostream>
#include <string>

namespace idforge::cli {

// execute_inspect: classify target and print every candidate to out, as text or JSON.
// Returns kExitError when no scheme matches.
[[nodiscard]] int execute_inspect(const std::string& target, bool json, std::ostream& out);

}  // namespace idforge::cli
