#pragma once

#include "injguard/config/guard_config.h"
#include "injguard/core/clock.h"
#include "injguard/core/id_generator.h"
#include "injguard/core/services.h"
#include "injguard/domain/verdict.h"
#include "injguard/storage/audit_event.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace injguard::app {

// ────────────────────────────────────────────────────────────────
// Classification
// ────────────────────────────────────────────────────────────────

struct ClassifyRequest {
  std::string user_input;                           // NOLINT(readability-identifier-naming)
  std::optional<std::string> prompt_override_key;   // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;              // NOLINT(readability-identifier-naming)
};

struct ClassifyResponse {
  std::string trace_id;     // NOLINT(readability-identifier-naming)
  domain::Verdict verdict;  // NOLINT(readability-identifier-naming)
};

// parse_classify_request reads an event object:
//   {"user_input": str, "prompt_override_key"?: str|null, "trace_id"?: str|null}
// Unknown fields are ignored. A null optional field counts as absent.
//
// Throws:
// - core::InvalidValueError if the event is not an object or a field has the wrong type
// - core::MissingFieldError("user_input") if user_input is absent
[[nodiscard]] ClassifyRequest parse_classify_request(const nlohmann::json& event);

// run_classification executes one request end to end:
// prompt → assemble → model → extract text → validate → resolve verdict.
//
// The verdict is always well formed. Model output that fails validation resolves to the
// fail-closed verdict. Everything upstream of validation (prompt lookup, transport, envelope)
// throws core::GuardError subclasses and produces no verdict.
//
// Emits audit events: ClassificationStarted, PromptResolved, ModelInputAssembled,
// ModelOutputReceived, ValidationRejected (rejections only), VerdictResolved.
// Writes the MODEL INPUT / MODEL OUTPUT banners to stderr.
[[nodiscard]] ClassifyResponse run_classification(const ClassifyRequest& req,
                                                  core::Services& services,
                                                  const config::GuardConfig& config,
                                                  core::IIdGenerator& id_gen,
                                                  core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Audit Trace
// ────────────────────────────────────────────────────────────────

[[nodiscard]] std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                                 core::Services& services);

}  // namespace injguard::app
