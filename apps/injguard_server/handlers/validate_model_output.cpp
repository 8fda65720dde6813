#include "validate_model_output.h"

#include "injguard/core/errors.h"
#include "injguard/domain/verdict.h"
#include "injguard/validation/response_validator.h"
#include "injguard/validation/verdict_resolver.h"

#include <string>

namespace injguard::server::handlers {

using json = nlohmann::json;

json handle_validate_model_output(const json& params, ServerContext& /*ctx*/) {
  if (!params.contains("model_output")) {
    throw core::MissingFieldError("model_output");
  }
  if (!params["model_output"].is_string()) {
    throw core::InvalidValueError(std::string("Field 'model_output' must be a string, got ") +
                                  params["model_output"].type_name());
  }

  const auto outcome =
      validation::validate_model_response(params["model_output"].get<std::string>());

  json result;
  result["accepted"] = outcome.has_value();
  if (!outcome.has_value()) {
    result["code"] = std::string(validation::to_string(outcome.error().code));
    result["reason"] = outcome.error().message;
  }
  result["verdict"] = domain::to_json(validation::resolve_verdict(outcome));
  return result;
}

}  // namespace injguard::server::handlers
