#pragma once

#include "server_context.h"
#include <iosfwd>
#include <optional>
#include <string>

namespace injguard::server {

// handle_line processes one JSON-RPC message and returns the serialized response, or
// nullopt for notifications (no id) and blank lines.
//
// Handler failures are reported as JSON-RPC errors:
// - core::GuardError  -> kGuardError with data {kind, message}
// - RpcError          -> its own code and data
// - anything else derived from std::exception -> kInternalError
[[nodiscard]] std::optional<std::string> handle_line(const std::string& line,
                                                     ServerContext& ctx);

// run_server_loop reads one message per line from `in` until EOF and writes each response
// as one line to `out`. Logs go to stderr.
void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out);

}  // namespace injguard::server
