#pragma once

#include "injguard/model/model_client.h"
#include "injguard/prompt/prompt_source.h"
#include "injguard/storage/audit_log.h"

namespace injguard::core {

// Services is the composition root handed to the classification pipeline.
// It holds references (not ownership); the entry point (server, CLI, test) creates the
// concrete instances and keeps them alive for as long as Services is used.
struct Services {
  prompt::PromptSource& prompts;  // NOLINT(readability-identifier-naming)
  model::IModelClient& model;     // NOLINT(readability-identifier-naming)
  storage::IAuditLog& audit_log;  // NOLINT(readability-identifier-naming)

  Services(prompt::PromptSource& prompts, model::IModelClient& model,
           storage::IAuditLog& audit_log)
      : prompts(prompts), model(model), audit_log(audit_log) {}

  ~Services() = default;

  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace injguard::core
