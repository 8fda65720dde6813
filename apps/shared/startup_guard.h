#pragma once

#include "injguard/config/guard_config.h"

#include "shared/runtime_options.h"
#include <string>

namespace injguard::apps {

// validate_runtime_options checks startup preconditions before any backend is built.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - --redis and --prompt-dir are mutually exclusive
// - if redis_uri is present, parse_redis_uri() must succeed
// - if prompt_dir is present, it must name an existing directory
// - the http model backend requires MODEL_ENDPOINT
[[nodiscard]] std::string validate_runtime_options(const RuntimeOptions& options,
                                                   const config::GuardConfig& guard_config);

}  // namespace injguard::apps
