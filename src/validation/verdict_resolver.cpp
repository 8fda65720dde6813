#include "injguard/validation/verdict_resolver.h"

#include <string>

namespace injguard::validation {

domain::Verdict resolve_verdict(const ValidationOutcome& outcome) {
  if (outcome.has_value()) {
    return outcome.value();
  }
  return domain::Verdict{false, std::string(kFailClosedReasonPrefix) + outcome.error().message};
}

bool is_fail_closed_reasoning(std::string_view reasoning) noexcept {
  return reasoning.starts_with(kFailClosedReasonPrefix);
}

}  // namespace injguard::validation
