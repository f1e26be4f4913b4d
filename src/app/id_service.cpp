#include "idforge/app/id_service.h"

#include "idforge/format/format_codec.h"
#include "idforge/inspection/inspection_classifier.h"

namespace idforge::app {

IdService::IdService(core::Services& services) : engine_(services) {}

IdService::IdService(core::Services& services, std::unique_ptr<generation::GeneratorState> state)
    : engine_(services, std::move(state)) {}

generation::GenerateResult IdService::generate(const domain::IdentifierSpec& spec) {
  return engine_.generate(spec);
}

core::Result<BatchResponse, core::GenerationError> IdService::generate_batch(
    const domain::IdentifierSpec& spec, const int count) {
  using Response = core::Result<BatchResponse, core::GenerationError>;

  if (count < 1) {
    return Response::err(core::GenerationError{
        core::GenerationErrorCode::kInvalidLength,
        "Count must be a positive integer, got " + std::to_string(count)});
  }

  BatchResponse response;
  response.ids.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i) {
    auto generated = engine_.generate(spec);
    if (!generated.has_value()) {
      return Response::err(generated.error());
    }
    const domain::GeneratedId& id = generated.value();
    if (id.warning.has_value()) {
      response.warnings.push_back(id.warning.value());
    }
    response.ids.push_back(format::render(id, spec.format, spec.prefix, spec.suffix));
  }
  return Response::ok(std::move(response));
}

std::string IdService::render(const domain::GeneratedId& id, const domain::UuidFormat format,
                              std::string_view prefix, std::string_view suffix) {
  return format::render(id, format, prefix, suffix);
}

std::vector<domain::ClassificationCandidate> IdService::inspect(std::string_view input) {
  return inspection::inspect(input);
}

}  // namespace idforge::app
