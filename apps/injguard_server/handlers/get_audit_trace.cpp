#include "get_audit_trace.h"

#include "injguard/app/classify_service.h"
#include "injguard/core/errors.h"

#include <string>

namespace injguard::server::handlers {

using json = nlohmann::json;

json handle_get_audit_trace(const json& params, ServerContext& ctx) {
  if (!params.contains("trace_id")) {
    throw core::MissingFieldError("trace_id");
  }
  if (!params["trace_id"].is_string()) {
    throw core::InvalidValueError("Field 'trace_id' must be a string");
  }
  const std::string trace_id = params["trace_id"].get<std::string>();
  const auto events = app::fetch_audit_trace(trace_id, ctx.services);

  json result;
  result["trace_id"] = trace_id;
  result["events"] = json::array();

  for (const auto& event : events) {
    auto payload = json::parse(event.payload, nullptr, false);
    if (payload.is_discarded()) {
      payload = event.payload;
    }
    result["events"].push_back({
        {"event_id", event.event_id},
        {"trace_id", event.trace_id},
        {"event_type", event.event_type},
        {"payload", payload},
        {"created_at", event.created_at},
        {"refs", event.refs},
    });
  }

  return result;
}

}  // namespace injguard::server::handlers
