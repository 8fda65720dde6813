#include "shared/runtime.h"

#include "injguard/core/errors.h"
#include "injguard/model/http_model_client.h"
#include "injguard/prompt/redis_prompt_store.h"
#include "injguard/storage/sqlite/sqlite_audit_log.h"
#include "injguard/storage/sqlite/sqlite_db.h"

#include <iostream>

namespace injguard::apps {

namespace {

using RuntimeResult = core::Result<std::unique_ptr<Runtime>, std::string>;

}  // namespace

RuntimeResult build_runtime(const RuntimeOptions& options,
                            const config::GuardConfig& guard_config) {
  auto runtime = std::make_unique<Runtime>();

  // ── Prompt store ─────────────────────────────────────────────────
  if (options.redis_uri.has_value()) {
    try {
      runtime->prompt_store = std::make_unique<prompt::RedisPromptStore>(options.redis_uri.value());
    } catch (const core::TransportError& e) {
      return RuntimeResult::err(e.what());
    }
    std::cerr << "Prompts:     " << runtime->prompt_store->describe() << " (bucket "
              << guard_config.prompt_bucket << ")\n";
  } else if (options.prompt_dir.has_value()) {
    runtime->prompt_store =
        std::make_unique<prompt::FilesystemPromptStore>(options.prompt_dir.value());
    std::cerr << "Prompts:     " << runtime->prompt_store->describe() << " (bucket "
              << guard_config.prompt_bucket << ")\n";
  } else {
    runtime->prompt_store = std::make_unique<prompt::InMemoryPromptStore>();
    std::cerr << "WARNING: No --redis or --prompt-dir specified. The prompt store is EMPTY.\n"
                 "         Only the built-in template is available; any prompt override key\n"
                 "         will fail with a configuration error.\n";
  }

  if (guard_config.deploy_override_key.has_value()) {
    std::cerr << "Override:    deploy-time key '" << guard_config.deploy_override_key.value()
              << "'\n";
  }

  runtime->prompts = std::make_unique<prompt::PromptSource>(
      *runtime->prompt_store, runtime->prompt_cache, guard_config.prompt_bucket,
      guard_config.deploy_override_key);

  // ── Audit log ────────────────────────────────────────────────────
  if (options.db_path.has_value()) {
    auto db_result = storage::sqlite::SqliteDb::open(options.db_path.value());
    if (!db_result.has_value()) {
      return RuntimeResult::err(db_result.error());
    }
    auto db = db_result.value();
    auto schema_result = db->ensure_schema_v1();
    if (!schema_result.has_value()) {
      return RuntimeResult::err("Failed to initialize schema: " + schema_result.error());
    }
    runtime->audit_log = std::make_unique<storage::sqlite::SqliteAuditLog>(db);
    std::cerr << "Audit:       SQLite -- " << options.db_path.value() << "\n";
  } else {
    runtime->audit_log = std::make_unique<storage::InMemoryAuditLog>();
    std::cerr << "WARNING: No --db path specified. Running with EPHEMERAL in-memory audit log.\n"
                 "         Audit traces will be LOST on process exit. Pass --db <path> to keep "
                 "them.\n";
  }

  // ── Model ────────────────────────────────────────────────────────
  switch (options.model_backend) {
    case ModelBackend::kHttp:
      runtime->model = std::make_unique<model::HttpModelClient>(model::HttpModelClientOptions{
          .endpoint = guard_config.model_endpoint.value_or(""),
          .api_key = guard_config.model_api_key,
          .retry = model::RetryPolicy{},
      });
      std::cerr << "Model:       HTTP -- " << guard_config.model_endpoint.value_or("") << " ("
                << guard_config.model_id << ", max_tokens " << guard_config.max_tokens
                << ", temperature " << guard_config.temperature << ")\n";
      break;
    case ModelBackend::kStub:
      runtime->model = std::make_unique<model::StubModelClient>();
      std::cerr << "WARNING: --model-backend stub. Every classification returns the stub\n"
                   "         model's canned unsafe verdict. Do not use in production.\n";
      break;
  }

  runtime->services = std::make_unique<core::Services>(*runtime->prompts, *runtime->model,
                                                       *runtime->audit_log);
  return RuntimeResult::ok(std::move(runtime));
}

}  // namespace injguard::apps
