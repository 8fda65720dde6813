#include "injguard/app/classify_service.h"

#include "injguard/core/errors.h"
#include "injguard/model/converse_envelope.h"
#include "injguard/prompt/prompt_assembler.h"
#include "injguard/prompt/prompt_override_key.h"
#include "injguard/validation/response_validator.h"
#include "injguard/validation/verdict_resolver.h"

#include <iostream>

namespace injguard::app {

namespace {

constexpr const char* kBanner =
    "================================================================================";

std::optional<std::string> optional_string_field(const nlohmann::json& event,
                                                 const char* field) {
  if (!event.contains(field) || event[field].is_null()) {
    return std::nullopt;
  }
  if (!event[field].is_string()) {
    throw core::InvalidValueError(std::string("Field '") + field + "' must be a string, got " +
                                  event[field].type_name());
  }
  return event[field].get<std::string>();
}

void append_event(core::Services& services, core::IIdGenerator& id_gen, core::IClock& clock,
                  const std::string& trace_id, const char* event_type,
                  const nlohmann::json& payload, std::vector<std::string> refs = {}) {
  services.audit_log.append({id_gen.next("evt"), trace_id, event_type, payload.dump(),
                             clock.now_iso8601(), std::move(refs)});
}

}  // namespace

ClassifyRequest parse_classify_request(const nlohmann::json& event) {
  if (!event.is_object()) {
    throw core::InvalidValueError(std::string("Event must be a JSON object, got ") +
                                  event.type_name());
  }
  if (!event.contains("user_input")) {
    throw core::MissingFieldError("user_input");
  }
  if (!event["user_input"].is_string()) {
    throw core::InvalidValueError(std::string("Field 'user_input' must be a string, got ") +
                                  event["user_input"].type_name());
  }

  return ClassifyRequest{
      .user_input = event["user_input"].get<std::string>(),
      .prompt_override_key = optional_string_field(event, "prompt_override_key"),
      .trace_id = optional_string_field(event, "trace_id"),
  };
}

ClassifyResponse run_classification(const ClassifyRequest& req, core::Services& services,
                                    const config::GuardConfig& config,
                                    core::IIdGenerator& id_gen, core::IClock& clock) {
  const std::string trace_id =
      req.trace_id.has_value() ? req.trace_id.value() : id_gen.next("trace");

  append_event(services, id_gen, clock, trace_id, storage::kEventClassificationStarted,
               {{"input_chars", req.user_input.size()},
                {"request_override", req.prompt_override_key.has_value()}});

  // ── Prompt ───────────────────────────────────────────────────────
  const std::string effective_key = prompt::resolve_effective_key(
      req.prompt_override_key, services.prompts.deploy_key());
  const std::string tmpl = services.prompts.load(req.prompt_override_key);
  append_event(services, id_gen, clock, trace_id, storage::kEventPromptResolved,
               {{"source", effective_key.empty() ? "default" : "override"},
                {"template_chars", tmpl.size()}},
               effective_key.empty() ? std::vector<std::string>{}
                                     : std::vector<std::string>{effective_key});

  const std::string full_prompt = prompt::assemble_prompt(tmpl, req.user_input);
  std::cerr << kBanner << "\nMODEL INPUT (complete prompt sent to model):\n"
            << kBanner << "\n"
            << full_prompt << "\n"
            << kBanner << "\n";
  append_event(services, id_gen, clock, trace_id, storage::kEventModelInputAssembled,
               {{"model_id", config.model_id},
                {"prompt_chars", full_prompt.size()},
                {"max_tokens", config.max_tokens},
                {"temperature", config.temperature}});

  // ── Model ────────────────────────────────────────────────────────
  const nlohmann::json envelope = services.model.converse(model::ConverseRequest{
      .model_id = config.model_id,
      .prompt = full_prompt,
      .max_tokens = config.max_tokens,
      .temperature = config.temperature,
  });
  const std::string model_output = model::extract_model_text(envelope);
  std::cerr << kBanner << "\nMODEL OUTPUT (raw response from model):\n"
            << kBanner << "\n"
            << model_output << "\n"
            << kBanner << "\n";
  append_event(services, id_gen, clock, trace_id, storage::kEventModelOutputReceived,
               {{"output_chars", model_output.size()}});

  // ── Validation ───────────────────────────────────────────────────
  const auto outcome = validation::validate_model_response(model_output);
  if (!outcome.has_value()) {
    std::cerr << "VALIDATION FAILED: " << outcome.error().message << "\n";
    append_event(services, id_gen, clock, trace_id, storage::kEventValidationRejected,
                 {{"code", std::string(validation::to_string(outcome.error().code))},
                  {"reason", outcome.error().message}});
  }

  const domain::Verdict verdict = validation::resolve_verdict(outcome);
  append_event(services, id_gen, clock, trace_id, storage::kEventVerdictResolved,
               {{"safe", verdict.safe}, {"fail_closed", !outcome.has_value()}});

  return ClassifyResponse{.trace_id = trace_id, .verdict = verdict};
}

std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                   core::Services& services) {
  return services.audit_log.query(trace_id);
}

}  // namespace injguard::app
