#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace injguard::server {

// JSON-RPC 2.0 message types. The id is echoed back with its original JSON type.
struct JsonRpcRequest {
  std::string jsonrpc{"2.0"};        // NOLINT(readability-identifier-naming)
  std::optional<nlohmann::json> id;  // NOLINT(readability-identifier-naming) absent: notification
  std::string method;                // NOLINT(readability-identifier-naming)
  nlohmann::json params;             // NOLINT(readability-identifier-naming)
};

// JSON-RPC 2.0 error codes, plus one server-defined code
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
// Pipeline fault (configuration, missing field, bad value, key validation, transport).
// data.kind carries core::to_string(ErrorKind).
constexpr int kGuardError = -32000;

// RpcError is thrown by method handlers to produce a specific JSON-RPC error.
class RpcError : public std::runtime_error {
 public:
  RpcError(int code, const std::string& message,
           nlohmann::json data = nlohmann::json::object())
      : std::runtime_error(message), code_(code), data_(std::move(data)) {}

  [[nodiscard]] int code() const noexcept { return code_; }
  [[nodiscard]] const nlohmann::json& data() const noexcept { return data_; }

 private:
  int code_;
  nlohmann::json data_;
};

// Parse a JSON-RPC request. nullopt when the line is not JSON or not an object.
std::optional<JsonRpcRequest> parse_request(const std::string& json_str);

std::string make_response(const std::optional<nlohmann::json>& id, const nlohmann::json& result);

std::string make_error_response(const std::optional<nlohmann::json>& id, int code,
                                const std::string& message,
                                const nlohmann::json& data = nlohmann::json::object());

}  // namespace injguard::server
