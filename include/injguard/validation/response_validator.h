#pragma once

#include "injguard/core/result.h"
#include "injguard/domain/verdict.h"

#include <string>
#include <string_view>

namespace injguard::validation {

// RejectionCode names the first check a model response failed, in evaluation order.
enum class RejectionCode {
  kInvalidJson,   // NOLINT(readability-identifier-naming) not parseable, or trailing data
  kNotAnObject,   // NOLINT(readability-identifier-naming) parsed, but not a JSON object
  kWrongKeys,     // NOLINT(readability-identifier-naming) key set is not exactly {safe, reasoning}
  kWrongType,     // NOLINT(readability-identifier-naming) safe is not bool / reasoning not string
  kExtraContent,  // NOLINT(readability-identifier-naming) text not reconstructible from payload
};

// Stable snake_case name ("invalid_json", "wrong_keys", ...) for logs and audit payloads.
[[nodiscard]] std::string_view to_string(RejectionCode code) noexcept;

struct Rejection {
  RejectionCode code{RejectionCode::kInvalidJson};  // NOLINT(readability-identifier-naming)
  std::string message;                              // NOLINT(readability-identifier-naming)
};

// Accepted(Verdict) or Rejected(code, message).
using ValidationOutcome = core::Result<domain::Verdict, Rejection>;

// validate_model_response decides whether raw model output is exactly the contracted shape:
// one JSON object with exactly the keys "safe" (boolean) and "reasoning" (string), either
// bare or wrapped as ```json\n<payload>\n```, with nothing else but surrounding whitespace.
//
// Total: never throws, always returns an outcome. Checks run in this order and the first
// failure wins:
//   1. trim surrounding ASCII whitespace
//   2. strip the fence if match_json_fence() recognises it, else treat the text as bare JSON
//   3. strict parse (trailing data and a leading byte-order mark are parse failures)
//   4. object
//   5. exact key set (case-sensitive)
//   6. value types
//   7. reconstruction: fence + payload (or payload alone) must reproduce the trimmed text
//
// Step 7 catches formatting noise between the fence and the payload that the parser
// tolerates as JSON whitespace: blank lines, per-line indentation, tabs.
[[nodiscard]] ValidationOutcome validate_model_response(std::string_view raw);

}  // namespace injguard::validation
