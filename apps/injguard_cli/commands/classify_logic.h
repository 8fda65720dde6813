#pragma once

#include "injguard/config/guard_config.h"
#include "injguard/core/clock.h"
#include "injguard/core/id_generator.h"
#include "injguard/core/services.h"

#include <ostream>
#include <string>

inline constexpr int kExitClassified = 0;
inline constexpr int kExitFatal = 1;

// execute_classify parses `event_text` as a classification event, runs it, and prints the
// verdict {"reasoning", "safe"} to `out`. The trace id goes to `err`.
//
// Pipeline faults (bad event, prompt lookup, transport, malformed envelope) are printed to
// `err` as "Error (<kind>): <message>" and return kExitFatal. No verdict is printed then.
// Takes only interface types; no concrete backend headers are included in this TU.
int execute_classify(const std::string& event_text, injguard::core::Services& services,
                     const injguard::config::GuardConfig& guard_config,
                     injguard::core::IIdGenerator& id_gen, injguard::core::IClock& clock,
                     std::ostream& out, std::ostream& err);
