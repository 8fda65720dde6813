#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace injguard::domain {

// Verdict is the two-field safety judgment returned to every caller.
//
// Produced either by the model path (the model's own opinion, accepted verbatim after
// shape validation) or by the fail-closed path (safe=false with a machine-stated reason
// carrying kFailClosedReasonPrefix; see validation/verdict_resolver.h).
struct Verdict {
  bool safe{false};       // NOLINT(readability-identifier-naming)
  std::string reasoning;  // NOLINT(readability-identifier-naming)

  bool operator==(const Verdict&) const = default;
};

// to_json emits exactly {"reasoning": ..., "safe": ...}. No other keys, ever.
[[nodiscard]] nlohmann::json to_json(const Verdict& verdict);

}  // namespace injguard::domain
