#include "method_handlers.h"

#include "injguard/core/version.h"

#include "handlers/tool_registry.h"

namespace injguard::server {

using json = nlohmann::json;

json handle_initialize(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  return json{
      {"protocolVersion", "2024-11-05"},
      {"capabilities", {{"tools", json::object()}}},
      {"serverInfo", {{"name", "injection-guard"}, {"version", core::kBuildVersion}}},
  };
}

json handle_tools_list(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  json tools = json::array();

  tools.push_back({
      {"name", "classify_input"},
      {"description",
       "Classify untrusted text as safe or unsafe (prompt injection, jailbreak, malicious "
       "intent). Model output is re-validated and fails closed."},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties",
            {
                {"user_input",
                 {{"type", "string"}, {"description", "Text to classify, passed verbatim"}}},
                {"prompt_override_key",
                 {{"type", "string"},
                  {"description",
                   "Template object key under custom_prompts/; empty selects the built-in "
                   "template"}}},
                {"trace_id", {{"type", "string"}}},
            }},
           {"required", json::array({"user_input"})},
       }},
  });

  tools.push_back({
      {"name", "validate_model_output"},
      {"description",
       "Run the deterministic response validator on raw model output (no model call)"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties", {{"model_output", {{"type", "string"}}}}},
           {"required", json::array({"model_output"})},
       }},
  });

  tools.push_back({
      {"name", "get_audit_trace"},
      {"description", "Fetch audit events by trace_id"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties", {{"trace_id", {{"type", "string"}}}}},
           {"required", json::array({"trace_id"})},
       }},
  });

  return json{{"tools", tools}};
}

json handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx) {
  if (!req.params.contains("name") || !req.params["name"].is_string()) {
    throw RpcError(kInvalidParams, "tools/call requires a string 'name'");
  }
  const std::string tool_name = req.params["name"].get<std::string>();
  const json tool_params = req.params.value("arguments", json::object());

  static const auto tool_registry = handlers::build_tool_registry();

  auto it = tool_registry.find(tool_name);
  if (it == tool_registry.end()) {
    throw RpcError(kInvalidParams, "Unknown tool: " + tool_name);
  }

  return it->second(tool_params, ctx);
}

std::unordered_map<std::string, MethodHandler> build_method_registry() {
  return {
      {"initialize", handle_initialize},
      {"tools/list", handle_tools_list},
      {"tools/call", handle_tools_call},
  };
}

}  // namespace injguard::server
