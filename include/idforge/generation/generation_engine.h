#pragma once

#include "idforge/core/result.h"
#include "idforge/core/services.h"
#include "idforge/domain/generated_id.h"
#include "idforge/domain/identifier_spec.h"
#include "idforge/generation/generator_state.h"

#include <memory>
#include <string>

namespace idforge::generation {

using GenerateResult = core::Result<domain::GeneratedId, core::GenerationError>;

// GenerationEngine builds identifiers from an IdentifierSpec.
//
// The engine consults the random source, clock and node identity held in Services and
// owns one GeneratorState (counters, clock sequence, ULID monotonic state). Errors are
// returned, never thrown; a failed call does not advance any counter.
//
// Thread-safe: concurrent generate() calls share the GeneratorState safely.
class GenerationEngine {
 public:
  // Seeds a fresh GeneratorState from services.random.
  explicit GenerationEngine(core::Services& services);

  // Uses the supplied state (tests inject pre-seeded counters).
  GenerationEngine(core::Services& services, std::unique_ptr<GeneratorState> state);

  ~GenerationEngine() = default;

  GenerationEngine(const GenerationEngine&) = delete;
  GenerationEngine& operator=(const GenerationEngine&) = delete;
  GenerationEngine(GenerationEngine&&) = delete;
  GenerationEngine& operator=(GenerationEngine&&) = delete;

  [[nodiscard]] GenerateResult generate(const domain::IdentifierSpec& spec);

 private:
  [[nodiscard]] GenerateResult generate_uuid(const domain::IdentifierSpec& spec);
  [[nodiscard]] GenerateResult generate_object_id(const domain::IdentifierSpec& spec);
  [[nodiscard]] GenerateResult generate_nanoid(const domain::IdentifierSpec& spec);
  [[nodiscard]] GenerateResult generate_cuid(const domain::IdentifierSpec& spec);
  [[nodiscard]] GenerateResult generate_ulid(const domain::IdentifierSpec& spec);

  core::Services& services_;
  std::unique_ptr<GeneratorState> state_;
  std::string cuid1_fingerprint_;
};

}  // namespace idforge::generation
