#include "mcp_protocol.h"

namespace injguard::server {

std::optional<JsonRpcRequest> parse_request(const std::string& json_str) {
  auto json = nlohmann::json::parse(json_str, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    return std::nullopt;
  }

  JsonRpcRequest request;
  if (json.contains("jsonrpc") && json["jsonrpc"].is_string()) {
    request.jsonrpc = json["jsonrpc"].get<std::string>();
  }

  if (json.contains("id") && (json["id"].is_string() || json["id"].is_number())) {
    request.id = json["id"];
  }

  if (json.contains("method") && json["method"].is_string()) {
    request.method = json["method"].get<std::string>();
  }

  if (json.contains("params") && json["params"].is_object()) {
    request.params = json["params"];
  } else {
    request.params = nlohmann::json::object();
  }

  return request;
}

std::string make_response(const std::optional<nlohmann::json>& id, const nlohmann::json& result) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id.has_value() ? id.value() : nlohmann::json(nullptr);
  response["result"] = result;
  return response.dump();
}

std::string make_error_response(const std::optional<nlohmann::json>& id, int code,
                                const std::string& message, const nlohmann::json& data) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id.has_value() ? id.value() : nlohmann::json(nullptr);
  response["error"] = {
      {"code", code},
      {"message", message},
      {"data", data},
  };
  return response.dump();
}

}  // namespace injguard::server
