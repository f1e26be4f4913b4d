#pragma once

#include "idforge/core/result.h"
#include "idforge/core/services.h"
#include "idforge/domain/classification.h"
#include "idforge/domain/generated_id.h"
#include "idforge/domain/identifier_spec.h"
#include "idforge/generation/generation_engine.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace idforge::app {

// ────────────────────────────────────────────────────────────────
// Batch Generation
// ────────────────────────────────────────────────────────────────

struct BatchResponse {
  std::vector<std::string> ids;                 // NOLINT(readability-identifier-naming)
  std::vector<core::GenerationError> warnings;    // NOLINT(readability-identifier-naming)
};

// IdService is the entry point used by applications.
// It wires one GenerationEngine to the supplied Services and exposes generation,
// rendering and inspection. Services must outlive the IdService.
class IdService {
 public:
  explicit IdService(core::Services& services);
  IdService(core::Services& services, std::unique_ptr<generation::GeneratorState> state);

  ~IdService() = default;

  IdService(const IdService&) = delete;
  IdService& operator=(const IdService&) = delete;
  IdService(IdService&&) = delete;
  IdService& operator=(IdService&&) = delete;

  [[nodiscard]] generation::GenerateResult generate(const domain::IdentifierSpec& spec);

  // Generates count identifiers rendered with the requested format, prefix and suffix.
  // count must be at least 1. Stops at the first error; the ids produced so far are dropped.
  [[nodiscard]] core::Result<BatchResponse, core::GenerationError> generate_batch(
      const domain::IdentifierSpec& spec, int count);

  [[nodiscard]] static std::string render(const domain::GeneratedId& id,
                                          domain::UuidFormat format, std::string_view prefix,
                                          std::string_view suffix);

  [[nodiscard]] static std::vector<domain::ClassificationCandidate> inspect(
      std::string_view input);

 private:
  generation::GenerationEngine engine_;
};

}  // namespace idforge::app
