#include "idforge/domain/classification_json.h"

namespace idforge::domain {

nlohmann::json candidate_to_json(const ClassificationCandidate& candidate) {
  nlohmann::json j;
  j["type"] = id_type_to_string(candidate.type);
  if (candidate.version.has_value()) {
    j["version"] = candidate.version.value();
  }
  j["confidence"] = confidence_to_string(candidate.confidence);
  // std::map iteration order keeps the decoded keys sorted
  j["decoded"] = candidate.decoded;
  return j;
}

nlohmann::json inspection_to_json(std::string_view input,
                                  const std::vector<ClassificationCandidate>& candidates) {
  nlohmann::json j;
  j["input"] = std::string{input};

  nlohmann::json candidates_json = nlohmann::json::array();
  for (const auto& candidate : candidates) {
    candidates_json.push_back(candidate_to_json(candidate));
  }
  j["candidates"] = candidates_json;
  return j;
}

nlohmann::json batch_to_json(const IdentifierSpec& spec, const std::vector<std::string>& ids) {
  nlohmann::json j;
  j["type"] = id_type_to_string(spec.type);
  if (spec.version.has_value()) {
    j["version"] = spec.version.value();
  } else if (spec.type == IdType::kUuid) {
    j["version"] = kDefaultUuidVersion;
  } else if (spec.type == IdType::kCuid) {
    j["version"] = kDefaultCuidVersion;
  }
  if (spec.type == IdType::kUuid) {
    j["format"] = uuid_format_to_string(spec.format);
  }
  j["count"] = ids.size();
  j["ids"] = ids;
  return j;
}

nlohmann::json error_to_json(const core::GenerationError& error) {
  nlohmann::json j;
  j["error"] = {
      {"code", core::error_code_to_string(error.code)},
      {"message", error.message},
  };
  return j;
}

}  // namespace idforge::domain
