#pragma once

#include "idforge/core/result.h"
#include "idforge/domain/classification.h"
#include "idforge/domain/identifier_spec.h"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace idforge::domain {

/// Serialize a single candidate: {"type", "version"?, "confidence", "decoded"}
[[nodiscard]] nlohmann::json candidate_to_json(const ClassificationCandidate& candidate);

/// Serialize an inspection: {"input", "candidates": [...]} in ranked order
[[nodiscard]] nlohmann::json inspection_to_json(std::string_view input,
                                                const std::vector<ClassificationCandidate>& candidates);

/// Serialize a generated batch: {"type", "version"?, "count", "ids": [...]}
[[nodiscard]] nlohmann::json batch_to_json(const IdentifierSpec& spec,
                                           const std::vector<std::string>& ids);

/// Serialize a generation failure: {"error": {"code", "message"}}
[[nodiscard]] nlohmann::json error_to_json(const core::GenerationError& error);

}  // namespace idforge::domain
