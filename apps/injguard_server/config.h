#pragma once

#include "shared/arg_parser.h"
#include "shared/runtime_options.h"
#include <vector>

namespace injguard::server {

// ServerConfig holds all parsed startup flags for the MCP server.
struct ServerConfig {
  apps::RuntimeOptions runtime;  // NOLINT(readability-identifier-naming)
  bool show_help{false};         // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::vector<apps::Option<ServerConfig>> build_option_registry();

// parse_args reports bad flags on stderr and clears status.ok.
ServerConfig parse_args(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                        apps::ParseStatus& status);

}  // namespace injguard::server
