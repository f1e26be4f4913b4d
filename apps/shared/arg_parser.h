#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace idforge::apps {

// ValueArity says whether a flag consumes the following token.
// kOptional consumes it only when it does not look like another flag ("-n 10" vs "-n -c 3").
// A negative number is a value, not a flag ("-n -1").
enum class ValueArity {
  kNone,      // NOLINT(readability-identifier-naming)
  kRequired,  // NOLINT(readability-identifier-naming)
  kOptional,  // NOLINT(readability-identifier-naming)
};

// Option describes a single command-line flag accepted by an app.
// Config is the caller-defined configuration struct that handlers populate.
//
// aliases lists every spelling of the flag ("-c", "--count").
// handler returns true on success, false when the value is rejected; the parser
// records the rejection and keeps going so every problem is reported at once.
template <typename Config>
struct Option {
  std::vector<std::string> aliases;          // NOLINT(readability-identifier-naming)
  ValueArity arity{ValueArity::kNone};       // NOLINT(readability-identifier-naming)
  std::string value_name;                    // NOLINT(readability-identifier-naming)
  std::string description;                   // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedOptions {
  Config config;                    // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const { return errors.empty(); }
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler, and returns the populated config together with every usage error.
// Unknown flag-like tokens are usage errors. Non-flag tokens that no option consumed
// are reported as unexpected arguments.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), {}};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    for (const auto& alias : opt.aliases) {
      option_map[alias] = &opt;
    }
  }

  const auto looks_like_number = [](const std::string& token) {
    const std::size_t digits = (!token.empty() && token[0] == '-') ? 1 : 0;
    return token.size() > digits &&
           std::all_of(token.begin() + static_cast<std::ptrdiff_t>(digits), token.end(),
                       [](const char ch) { return ch >= '0' && ch <= '9'; });
  };
  const auto looks_like_flag = [&looks_like_number](const std::string& token) {
    return token.size() > 1 && token[0] == '-' && !looks_like_number(token);
  };

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      if (looks_like_flag(arg)) {
        parsed.errors.push_back("Unknown option: " + arg);
      } else {
        parsed.errors.push_back("Unexpected argument: " + arg);
      }
      continue;
    }

    const Option<Config>* opt = it->second;
    std::string value;
    switch (opt->arity) {
      case ValueArity::kNone:
        break;
      case ValueArity::kRequired:
        if (i + 1 >= argc) {
          parsed.errors.push_back("Option " + arg + " requires a value");
          continue;
        }
        value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        break;
      case ValueArity::kOptional:
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (i + 1 < argc && !looks_like_flag(argv[i + 1])) {
          value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
        break;
    }

    if (!opt->handler(parsed.config, value)) {
      parsed.errors.push_back("Invalid value for " + arg + ": '" + value + "'");
    }
  }

  return parsed;
}

}  // namespace idforge::apps
