#pragma once

#include <string>
#include <vector>

namespace injguard::storage {

// Event type names emitted by the classification pipeline, in emission order.
inline constexpr const char* kEventClassificationStarted = "ClassificationStarted";
inline constexpr const char* kEventPromptResolved = "PromptResolved";
inline constexpr const char* kEventModelInputAssembled = "ModelInputAssembled";
inline constexpr const char* kEventModelOutputReceived = "ModelOutputReceived";
inline constexpr const char* kEventValidationRejected = "ValidationRejected";
inline constexpr const char* kEventVerdictResolved = "VerdictResolved";

struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;  // JSON object text
  std::string created_at;
  std::vector<std::string> refs;
};

}  // namespace injguard::storage
