#include "injguard/config/guard_config.h"
#include "injguard/core/clock.h"
#include "injguard/core/errors.h"
#include "injguard/core/id_generator.h"
#include "injguard/core/version.h"

#include "config.h"
#include "server_context.h"
#include "server_loop.h"
#include "shared/runtime.h"
#include "shared/startup_guard.h"
#include <iostream>
#include <string>

using namespace injguard;

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  apps::ParseStatus status;
  const auto config = server::parse_args(argc, argv, status);
  if (config.show_help) {
    std::cerr << "Usage: injguard_server [options]\n";
    apps::print_usage(std::cerr, server::build_option_registry());
    return 0;
  }
  if (!status.ok) {
    return 1;
  }

  // Deployment configuration is read once; a broken environment refuses to start.
  config::GuardConfig guard_config;
  try {
    guard_config = config::load_guard_config(config::process_env_lookup());
  } catch (const core::GuardError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  // Validate before emitting any startup output so no partial messages appear on error.
  const std::string config_error = apps::validate_runtime_options(config.runtime, guard_config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  // ── Startup diagnostic block ──────────────────────────────────────────────
  std::cerr << "injection-guard MCP Server v" << core::kBuildVersion << "\n";

  auto runtime_result = apps::build_runtime(config.runtime, guard_config);
  if (!runtime_result.has_value()) {
    std::cerr << "Error: " << runtime_result.error() << "\n";
    return 1;
  }
  const auto& runtime = runtime_result.value();

  std::cerr << "Listening on stdio for JSON-RPC requests...\n";
  // ─────────────────────────────────────────────────────────────────────────

  core::SystemIdGenerator id_gen;
  core::SystemClock clock;

  server::ServerContext ctx{*runtime->services, guard_config, id_gen, clock};
  server::run_server_loop(ctx, std::cin, std::cout);

  return 0;
}
