#include "validate_logic.h"

#include "injguard/domain/verdict.h"
#include "injguard/validation/response_validator.h"
#include "injguard/validation/verdict_resolver.h"

#include <nlohmann/json.hpp>

int execute_validate(const std::string& model_output, std::ostream& out) {
  const auto outcome = injguard::validation::validate_model_response(model_output);

  nlohmann::json report;
  report["accepted"] = outcome.has_value();
  if (!outcome.has_value()) {
    report["code"] = std::string(injguard::validation::to_string(outcome.error().code));
    report["reason"] = outcome.error().message;
  }
  report["verdict"] = injguard::domain::to_json(injguard::validation::resolve_verdict(outcome));

  out << report.dump(2) << "\n";
  return outcome.has_value() ? kExitAccepted : kExitRejected;
}
