#pragma once

#include "injguard/domain/verdict.h"
#include "injguard/validation/response_validator.h"

#include <string_view>

namespace injguard::validation {

// Prepended to every fail-closed reasoning string. A model-produced reasoning never goes
// through this path, so auditors can separate "the model judged it unsafe" from "the
// model's output could not be trusted at all".
constexpr std::string_view kFailClosedReasonPrefix = "Deterministic validation failure: ";

// resolve_verdict maps Accepted(v) to v unchanged and any rejection to
// {safe=false, reasoning=kFailClosedReasonPrefix + message}. Ambiguity never resolves to safe.
[[nodiscard]] domain::Verdict resolve_verdict(const ValidationOutcome& outcome);

// True when `reasoning` was produced by the fail-closed path.
[[nodiscard]] bool is_fail_closed_reasoning(std::string_view reasoning) noexcept;

}  // namespace injguard::validation
