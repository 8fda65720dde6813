#include "classify_input.h"

#include "injguard/app/classify_service.h"

namespace injguard::server::handlers {

using json = nlohmann::json;

// Pipeline faults propagate as core::GuardError and become JSON-RPC errors in the
// server loop. Only a resolved verdict is returned as a result.
json handle_classify_input(const json& params, ServerContext& ctx) {
  const auto request = app::parse_classify_request(params);
  const auto response = app::run_classification(request, ctx.services, ctx.guard_config,
                                                ctx.id_gen, ctx.clock);

  return json{
      {"trace_id", response.trace_id},
      {"safe", response.verdict.safe},
      {"reasoning", response.verdict.reasoning},
  };
}

}  // namespace injguard::server::handlers
