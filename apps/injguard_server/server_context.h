#pragma once

#include "injguard/config/guard_config.h"
#include "injguard/core/clock.h"
#include "injguard/core/id_generator.h"
#include "injguard/core/services.h"

namespace injguard::server {

// ServerContext holds all process-lifetime service references passed to every tool handler.
// All references must remain valid for the lifetime of run_server_loop().
struct ServerContext {
  core::Services& services;                  // NOLINT(readability-identifier-naming)
  const config::GuardConfig& guard_config;   // NOLINT(readability-identifier-naming)
  core::IIdGenerator& id_gen;                // NOLINT(readability-identifier-naming)
  core::IClock& clock;                       // NOLINT(readability-identifier-naming)
};

}  // namespace injguard::server
