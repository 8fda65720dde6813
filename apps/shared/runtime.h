#pragma once

#include "injguard/config/guard_config.h"
#include "injguard/core/result.h"
#include "injguard/core/services.h"
#include "injguard/model/model_client.h"
#include "injguard/prompt/prompt_cache.h"
#include "injguard/prompt/prompt_source.h"
#include "injguard/prompt/prompt_store.h"
#include "injguard/storage/audit_log.h"

#include "shared/runtime_options.h"
#include <memory>
#include <string>

namespace injguard::apps {

// Runtime owns every backend a classifying process needs and exposes them as
// core::Services. Built once by build_runtime(); not copyable or movable because
// Services and PromptSource hold references into it.
struct Runtime {
  std::unique_ptr<prompt::IPromptStore> prompt_store;  // NOLINT(readability-identifier-naming)
  prompt::PromptCache prompt_cache;                     // NOLINT(readability-identifier-naming)
  std::unique_ptr<prompt::PromptSource> prompts;        // NOLINT(readability-identifier-naming)
  std::unique_ptr<storage::IAuditLog> audit_log;        // NOLINT(readability-identifier-naming)
  std::unique_ptr<model::IModelClient> model;           // NOLINT(readability-identifier-naming)
  std::unique_ptr<core::Services> services;             // NOLINT(readability-identifier-naming)
};

// build_runtime constructs the backends selected by `options` after
// validate_runtime_options() has accepted them, and writes one startup diagnostic line
// per subsystem to stderr. Ephemeral fallbacks are logged as WARNINGs.
//
// Returns an error message when a backend cannot be opened (database, Redis).
[[nodiscard]] core::Result<std::unique_ptr<Runtime>, std::string> build_runtime(
    const RuntimeOptions& options, const config::GuardConfig& guard_config);

}  // namespace injguard::apps
