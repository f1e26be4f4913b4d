#include "config.h"

#include "idforge/domain/id_type.h"

#include <charconv>
#include <functional>
#include <sstream>
#include <string_view>
#include <system_error>
#include <utility>

namespace idforge::cli {

namespace {

using domain::IdType;
using domain::UuidFormat;

std::optional<int> parse_int(const std::string& value) {
  int parsed = 0;
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc{} || ptr != last || value.empty()) {
    return std::nullopt;
  }
  return parsed;
}

void select(CliConfig& config, IdType type, std::optional<int> version) {
  config.spec.type = type;
  config.spec.version = version;
}

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

std::function<bool(CliConfig&, const std::string&)> select_uuid(int version) {
  return [version](CliConfig& config, const std::string& /*value*/) {
    select(config, IdType::kUuid, version);
    return true;
  };
}

std::function<bool(CliConfig&, const std::string&)> select_cuid(int version) {
  return [version](CliConfig& config, const std::string& /*value*/) {
    select(config, IdType::kCuid, version);
    return true;
  };
}

std::function<bool(CliConfig&, const std::string&)> select_format(UuidFormat format) {
  return [format](CliConfig& config, const std::string& /*value*/) {
    config.spec.format = format;
    return true;
  };
}

bool handle_type(CliConfig& config, const std::string& value) {
  static const std::vector<std::pair<std::string_view, std::pair<IdType, int>>> kVersioned = {
      {"uuid1", {IdType::kUuid, 1}}, {"u1", {IdType::kUuid, 1}},
      {"uuid3", {IdType::kUuid, 3}}, {"u3", {IdType::kUuid, 3}},
      {"uuid4", {IdType::kUuid, 4}}, {"u4", {IdType::kUuid, 4}},
      {"uuid5", {IdType::kUuid, 5}}, {"u5", {IdType::kUuid, 5}},
      {"cuid1", {IdType::kCuid, 1}}, {"c1", {IdType::kCuid, 1}},
      {"cuid2", {IdType::kCuid, 2}}, {"c2", {IdType::kCuid, 2}},
  };
  for (const auto& [name, selection] : kVersioned) {
    if (value == name) {
      select(config, selection.first, selection.second);
      return true;
    }
  }
  if (value == "nano") {
    select(config, IdType::kNanoId, std::nullopt);
    return true;
  }
  if (value == "oid") {
    select(config, IdType::kObjectId, std::nullopt);
    return true;
  }
  const auto type = domain::string_to_id_type(value);
  if (!type.has_value()) {
    return false;
  }
  select(config, type.value(), std::nullopt);
  return true;
}

bool handle_nanoid(CliConfig& config, const std::string& value) {
  select(config, IdType::kNanoId, std::nullopt);
  if (value.empty()) {
    return true;
  }
  // Range is checked by the engine so the caller sees its InvalidLength message.
  const auto length = parse_int(value);
  if (!length.has_value()) {
    return false;
  }
  config.spec.length = length;
  return true;
}

bool handle_length(CliConfig& config, const std::string& value) {
  const auto length = parse_int(value);
  if (!length.has_value()) {
    return false;
  }
  config.spec.length = length;
  return true;
}

bool handle_count(CliConfig& config, const std::string& value) {
  const auto count = parse_int(value);
  if (!count.has_value()) {
    return false;
  }
  config.count = count.value();
  return true;
}

bool handle_inspect(CliConfig& config, const std::string& value) {
  config.inspect_target = value;
  return true;
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

using Opt = apps::Option<CliConfig>;
using apps::ValueArity;

}  // namespace

std::vector<Opt> build_option_registry() {
  return {
      {{"-h", "--help"}, ValueArity::kNone, "", "Show this help and exit",
       [](CliConfig& c, const std::string&) { return c.show_help = true; }},
      {{"-v", "--version"}, ValueArity::kNone, "", "Show the version and exit",
       [](CliConfig& c, const std::string&) { return c.show_version = true; }},
      {{"-t", "--type"}, ValueArity::kRequired, "TYPE",
       "ID type: uuid1|uuid3|uuid4|uuid5|nanoid|cuid1|cuid2|ulid|objectid", handle_type},
      {{"-u1", "--uuid1"}, ValueArity::kNone, "", "UUID v1 (time-based)", select_uuid(1)},
      {{"-u3", "--uuid3"}, ValueArity::kNone, "", "UUID v3 (MD5, needs --namespace and --name)",
       select_uuid(3)},
      {{"-u4", "--uuid4"}, ValueArity::kNone, "", "UUID v4 (random, default)", select_uuid(4)},
      {{"-u5", "--uuid5"}, ValueArity::kNone, "", "UUID v5 (SHA-1, needs --namespace and --name)",
       select_uuid(5)},
      {{"-d", "--hyphen"}, ValueArity::kNone, "", "Hyphenated UUID format (default)",
       select_format(UuidFormat::kHyphenated)},
      {{"-s", "--simple"}, ValueArity::kNone, "", "Simple UUID format (no hyphens)",
       select_format(UuidFormat::kSimple)},
      {{"-u", "--urn"}, ValueArity::kNone, "", "URN UUID format (urn:uuid:...)",
       select_format(UuidFormat::kUrn)},
      {{"-o", "--objectid"}, ValueArity::kNone, "", "ObjectID",
       [](CliConfig& c, const std::string&) {
         select(c, IdType::kObjectId, std::nullopt);
         return true;
       }},
      {{"-n", "--nano"}, ValueArity::kOptional, "LEN", "NanoID, optional length (default 21)",
       handle_nanoid},
      {{"-c1", "--cuid1"}, ValueArity::kNone, "", "CUID v1", select_cuid(1)},
      {{"-c2", "--cuid2"}, ValueArity::kNone, "", "CUID v2", select_cuid(2)},
      {{"--cuid-length", "--length"}, ValueArity::kRequired, "LEN",
       "Length for CUID v2 (2..32) or NanoID (1..1024)", handle_length},
      {{"-l", "--ulid"}, ValueArity::kNone, "", "ULID",
       [](CliConfig& c, const std::string&) {
         select(c, IdType::kUlid, std::nullopt);
         return true;
       }},
      {{"-c", "--count"}, ValueArity::kRequired, "N", "Number of IDs to generate (default 1)",
       handle_count},
      {{"-p", "--prefix"}, ValueArity::kRequired, "TEXT", "Prefix added to every ID",
       [](CliConfig& c, const std::string& value) {
         c.spec.prefix = value;
         return true;
       }},
      {{"-f", "--suffix"}, ValueArity::kRequired, "TEXT", "Suffix added to every ID",
       [](CliConfig& c, const std::string& value) {
         c.spec.suffix = value;
         return true;
       }},
      {{"--namespace"}, ValueArity::kRequired, "NS",
       "Namespace for UUID v3/v5: DNS, URL, OID, X500 or a UUID",
       [](CliConfig& c, const std::string& value) {
         c.spec.id_namespace = value;
         return true;
       }},
      {{"--name"}, ValueArity::kRequired, "NAME", "Name for UUID v3/v5",
       [](CliConfig& c, const std::string& value) {
         c.spec.name = value;
         return true;
       }},
      {{"--json"}, ValueArity::kNone, "", "Print results as JSON",
       [](CliConfig& c, const std::string&) { return c.json = true; }},
      {{"--inspect"}, ValueArity::kRequired, "ID", "Identify an ID and decode its fields",
       handle_inspect},
  };
}

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

apps::ParsedOptions<CliConfig> parse_args(int argc, char* argv[]) {
  const auto options = build_option_registry();

  // "inspect <id>" is accepted as a subcommand spelling of --inspect.
  if (argc > 1 && std::string_view{argv[1]} == "inspect") {  // NOLINT
    if (argc < 3) {
      apps::ParsedOptions<CliConfig> parsed;
      parsed.errors.emplace_back("inspect requires an ID argument");
      return parsed;
    }
    CliConfig config;
    config.inspect_target = argv[2];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    return apps::parse_options(argc, argv, options, 3, std::move(config));
  }

  return apps::parse_options(argc, argv, options);
}

std::string usage_text(const std::vector<apps::Option<CliConfig>>& options) {
  std::ostringstream out;
  out << "Usage: idforge_cli [OPTIONS]\n"
      << "       idforge_cli inspect <ID> [--json]\n\n"
      << "Options:\n";
  for (const auto& opt : options) {
    std::string flags;
    for (const auto& alias : opt.aliases) {
      if (!flags.empty()) {
        flags += ", ";
      }
      flags += alias;
    }
    if (opt.arity == apps::ValueArity::kRequired) {
      flags += " <" + opt.value_name + ">";
    } else if (opt.arity == apps::ValueArity::kOptional) {
      flags += " [" + opt.value_name + "]";
    }
    out << "  " << flags;
    constexpr std::size_t kColumn = 28;
    if (flags.size() + 2 < kColumn) {
      out << std::string(kColumn - flags.size() - 2, ' ');
    } else {
      out << "\n" << std::string(kColumn, ' ');
    }
    out << opt.description << "\n";
  }
  out << "\nExamples:\n"
      << "  idforge_cli                                   random UUID v4\n"
      << "  idforge_cli -u5 --namespace DNS --name example.com\n"
      << "  idforge_cli -n 10 -c 3                        three NanoIDs of length 10\n"
      << "  idforge_cli -l --json                         ULID as JSON\n"
      << "  idforge_cli --inspect 01ARZ3NDEKTSV4RRFFQ69G5FAV\n";
  return out.str();
}

}  // namespace idforge::cli
