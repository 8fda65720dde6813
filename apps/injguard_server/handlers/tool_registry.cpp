#include "tool_registry.h"

#include "classify_input.h"
#include "get_audit_trace.h"
#include "validate_model_output.h"

namespace injguard::server::handlers {

std::unordered_map<std::string, ToolHandler> build_tool_registry() {
  return {
      {"classify_input", handle_classify_input},
      {"validate_model_output", handle_validate_model_output},
      {"get_audit_trace", handle_get_audit_trace},
  };
}

}  // namespace injguard::server::handlers
