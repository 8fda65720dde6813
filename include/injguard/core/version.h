#pragma once

namespace injguard::core {

// Reported by the MCP server's initialize response and the startup banner.
constexpr const char* kBuildVersion = "0.3.0";

}  // namespace injguard::core
