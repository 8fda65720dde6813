#include "server_loop.h"

#include "injguard/core/errors.h"

#include <nlohmann/json.hpp>

#include "mcp_protocol.h"
#include "method_handlers.h"
#include <iostream>
#include <string>

namespace injguard::server {

using json = nlohmann::json;

std::optional<std::string> handle_line(const std::string& line, ServerContext& ctx) {
  if (line.empty() || line.find_first_not_of(" \t\r") == std::string::npos) {
    return std::nullopt;
  }

  auto request_opt = parse_request(line);
  if (!request_opt.has_value()) {
    return make_error_response(std::nullopt, kParseError, "Invalid JSON");
  }

  const auto& request = request_opt.value();
  std::cerr << "Received: " << request.method << "\n";

  if (request.method.empty()) {
    return make_error_response(request.id, kInvalidRequest, "Missing method");
  }

  static const auto method_registry = build_method_registry();

  std::string response;
  auto it = method_registry.find(request.method);
  if (it == method_registry.end()) {
    response = make_error_response(request.id, kMethodNotFound,
                                   "Unknown method: " + request.method);
  } else {
    try {
      response = make_response(request.id, it->second(request, ctx));
    } catch (const core::GuardError& e) {
      const std::string kind{core::to_string(e.kind())};
      std::cerr << "ERROR (" << kind << "): " << e.what() << "\n";
      response = make_error_response(request.id, kGuardError, e.what(),
                                     json{{"kind", kind}, {"message", e.what()}});
    } catch (const RpcError& e) {
      response = make_error_response(request.id, e.code(), e.what(), e.data());
    } catch (const std::exception& e) {
      std::cerr << "ERROR (internal): " << e.what() << "\n";
      response = make_error_response(request.id, kInternalError, e.what());
    }
  }

  if (!request.id.has_value()) {
    return std::nullopt;
  }
  return response;
}

void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out) {
  std::string line;
  while (std::getline(in, line)) {
    const auto response = handle_line(line, ctx);
    if (response.has_value()) {
      out << response.value() << "\n" << std::flush;
    }
  }

  std::cerr << "MCP Server shutting down\n";
}

}  // namespace injguard::server
