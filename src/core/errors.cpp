#include "injguard/core/errors.h"

namespace injguard::core {

std::string_view to_string(const ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kConfiguration:
      return "configuration_error";
    case ErrorKind::kMissingField:
      return "missing_field";
    case ErrorKind::kInvalidValue:
      return "value_error";
    case ErrorKind::kValidation:
      return "validation_error";
    case ErrorKind::kTransport:
      return "transport_error";
  }
  return "unknown_error";
}

}  // namespace injguard::core
