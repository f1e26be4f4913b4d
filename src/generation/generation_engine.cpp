#include "idforge/generation/generation_engine.h"

#include "idforge/core/time.h"
#include "idforge/format/encoding.h"
#include "idforge/format/format_codec.h"
#include "idforge/generation/cuid.h"
#include "idforge/generation/nanoid.h"
#include "idforge/generation/object_id.h"
#include "idforge/generation/uuid.h"

#include <string_view>

namespace idforge::generation {

namespace {

using core::GenerationError;
using core::GenerationErrorCode;
using domain::GeneratedId;
using domain::IdType;

constexpr std::string_view kNamespaceExample =
    " (e.g. DNS, URL or 6ba7b810-9dad-11d1-80b4-00c04fd430c8)";

GenerateResult fail(GenerationErrorCode code, std::string message) {
  return GenerateResult::err(GenerationError{code, std::move(message)});
}

GeneratedId from_uuid(const domain::UuidBytes& bytes, int version) {
  GeneratedId id;
  id.type = IdType::kUuid;
  id.version = version;
  id.raw.assign(bytes.begin(), bytes.end());
  id.canonical = format::format_uuid(bytes, domain::UuidFormat::kHyphenated);
  return id;
}

GeneratedId from_symbols(IdType type, std::optional<int> version, std::string text) {
  GeneratedId id;
  id.type = type;
  id.version = version;
  id.raw.assign(text.begin(), text.end());
  id.canonical = std::move(text);
  return id;
}

std::optional<GenerateResult> reject_version(const domain::IdentifierSpec& spec) {
  if (!spec.version.has_value()) {
    return std::nullopt;
  }
  return fail(GenerationErrorCode::kUnsupportedType,
              domain::id_type_to_string(spec.type) + " has no version " +
                  std::to_string(spec.version.value()));
}

}  // namespace

GenerationEngine::GenerationEngine(core::Services& services)
    : GenerationEngine(services,
                       GeneratorState::seeded(services.random,
                                              cuid2_fingerprint(services.node, services.random))) {
}

GenerationEngine::GenerationEngine(core::Services& services,
                                   std::unique_ptr<GeneratorState> state)
    : services_(services),
      state_(std::move(state)),
      cuid1_fingerprint_(
          cuid1_fingerprint(services.node.process_id(), services.node.host_name())) {}

GenerateResult GenerationEngine::generate(const domain::IdentifierSpec& spec) {
  switch (spec.type) {
    case IdType::kUuid:
      return generate_uuid(spec);
    case IdType::kObjectId:
      return generate_object_id(spec);
    case IdType::kNanoId:
      return generate_nanoid(spec);
    case IdType::kCuid:
      return generate_cuid(spec);
    case IdType::kUlid:
      return generate_ulid(spec);
  }
  return fail(GenerationErrorCode::kUnsupportedType, "Unknown identifier type");
}

GenerateResult GenerationEngine::generate_uuid(const domain::IdentifierSpec& spec) {
  const int version = spec.version.value_or(domain::kDefaultUuidVersion);

  switch (version) {
    case 1: {
      const auto stamp =
          state_->next_uuid1_stamp(core::to_gregorian_ticks(services_.clock.now()));
      GeneratedId id = from_uuid(uuid_v1(stamp.ticks, stamp.clock_seq, services_.node.node_id()),
                                 1);
      if (stamp.regressed) {
        id.warning = GenerationError{
            GenerationErrorCode::kClockRegression,
            "System clock moved backwards; UUID v1 clock sequence advanced to " +
                std::to_string(stamp.clock_seq)};
      }
      return GenerateResult::ok(std::move(id));
    }
    case 3:
    case 5: {
      const std::string label = "UUID v" + std::to_string(version);
      if (!spec.id_namespace.has_value()) {
        return fail(GenerationErrorCode::kInvalidNamespace,
                    label + " requires a namespace" + std::string{kNamespaceExample});
      }
      if (!spec.name.has_value()) {
        return fail(GenerationErrorCode::kMissingName,
                    label + " requires a name (e.g. example.com)");
      }
      const auto ns = resolve_namespace(spec.id_namespace.value());
      if (!ns.has_value()) {
        return fail(GenerationErrorCode::kInvalidNamespace,
                    "Invalid namespace UUID format: '" + spec.id_namespace.value() +
                        "'. Must be a well-known name or a valid UUID" +
                        std::string{kNamespaceExample});
      }
      const auto bytes = version == 3 ? uuid_v3(ns.value(), spec.name.value())
                                      : uuid_v5(ns.value(), spec.name.value());
      return GenerateResult::ok(from_uuid(bytes, version));
    }
    case 4: {
      domain::UuidBytes random_bytes{};
      services_.random.fill(random_bytes);
      return GenerateResult::ok(from_uuid(uuid_v4(random_bytes), 4));
    }
    default:
      return fail(GenerationErrorCode::kUnsupportedType,
                  "UUID version " + std::to_string(version) +
                      " is not supported (supported: 1, 3, 4, 5)");
  }
}

GenerateResult GenerationEngine::generate_object_id(const domain::IdentifierSpec& spec) {
  if (auto rejected = reject_version(spec)) {
    return std::move(rejected.value());
  }

  const auto seconds = static_cast<std::uint32_t>(core::to_unix_seconds(services_.clock.now()));
  const auto bytes =
      object_id(seconds, services_.node.object_id_session(), state_->next_object_id_counter());

  GeneratedId id;
  id.type = IdType::kObjectId;
  id.raw.assign(bytes.begin(), bytes.end());
  id.canonical = format::hex_encode(bytes);
  return GenerateResult::ok(std::move(id));
}

GenerateResult GenerationEngine::generate_nanoid(const domain::IdentifierSpec& spec) {
  if (auto rejected = reject_version(spec)) {
    return std::move(rejected.value());
  }

  const int length = spec.length.value_or(domain::kDefaultNanoIdLength);
  if (length < kNanoIdMinLength || length > kNanoIdMaxLength) {
    return fail(GenerationErrorCode::kInvalidLength,
                "NanoID length must be between " + std::to_string(kNanoIdMinLength) + " and " +
                    std::to_string(kNanoIdMaxLength) + ", got " + std::to_string(length));
  }

  return GenerateResult::ok(from_symbols(
      IdType::kNanoId, std::nullopt,
      nanoid(services_.random, kNanoIdAlphabet, static_cast<std::size_t>(length))));
}

GenerateResult GenerationEngine::generate_cuid(const domain::IdentifierSpec& spec) {
  const int version = spec.version.value_or(domain::kDefaultCuidVersion);
  const auto millis = static_cast<std::uint64_t>(core::to_unix_millis(services_.clock.now()));

  if (version == 1) {
    return GenerateResult::ok(from_symbols(
        IdType::kCuid, 1,
        cuid1(millis, state_->next_cuid1_counter(), cuid1_fingerprint_, services_.random)));
  }

  if (version == 2) {
    const int length = spec.length.value_or(domain::kDefaultCuid2Length);
    if (length < kCuid2MinLength || length > kCuid2MaxLength) {
      return fail(GenerationErrorCode::kInvalidLength,
                  "CUID v2 length must be between " + std::to_string(kCuid2MinLength) +
                      " and " + std::to_string(kCuid2MaxLength) + ", got " +
                      std::to_string(length));
    }
    return GenerateResult::ok(from_symbols(
        IdType::kCuid, 2,
        cuid2(millis, state_->next_cuid2_counter(), state_->cuid2_fingerprint(),
              static_cast<std::size_t>(length), services_.random)));
  }

  return fail(GenerationErrorCode::kUnsupportedType,
              "CUID version " + std::to_string(version) + " is not supported (supported: 1, 2)");
}

GenerateResult GenerationEngine::generate_ulid(const domain::IdentifierSpec& spec) {
  if (auto rejected = reject_version(spec)) {
    return std::move(rejected.value());
  }

  const auto millis = static_cast<std::uint64_t>(core::to_unix_millis(services_.clock.now()));
  auto bytes = state_->next_ulid(millis, services_.random);
  if (!bytes.has_value()) {
    return GenerateResult::err(bytes.error());
  }

  GeneratedId id;
  id.type = IdType::kUlid;
  id.raw.assign(bytes.value().begin(), bytes.value().end());
  id.canonical = format::crockford_encode(bytes.value());
  return GenerateResult::ok(std::move(id));
}

}  // namespace idforge::generation
