#include "classify_logic.h"

#include "injguard/app/classify_service.h"
#include "injguard/core/errors.h"
#include "injguard/domain/verdict.h"

#include <nlohmann/json.hpp>

int execute_classify(const std::string& event_text, injguard::core::Services& services,
                     const injguard::config::GuardConfig& guard_config,
                     injguard::core::IIdGenerator& id_gen, injguard::core::IClock& clock,
                     std::ostream& out, std::ostream& err) {
  const auto event = nlohmann::json::parse(event_text, nullptr, false);
  if (event.is_discarded()) {
    err << "Error (value_error): event is not valid JSON\n";
    return kExitFatal;
  }

  try {
    const auto request = injguard::app::parse_classify_request(event);
    const auto response =
        injguard::app::run_classification(request, services, guard_config, id_gen, clock);
    err << "trace_id: " << response.trace_id << "\n";
    out << injguard::domain::to_json(response.verdict).dump() << "\n";
    return kExitClassified;
  } catch (const injguard::core::GuardError& e) {
    err << "Error (" << injguard::core::to_string(e.kind()) << "): " << e.what() << "\n";
    return kExitFatal;
  }
}
