#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace injguard::core {

// ErrorKind classifies fail-fatal conditions. These are pipeline faults (broken config,
// malformed request, transport failure, malformed provider envelope) and are surfaced to
// the caller as errors. They are never converted into a safe/unsafe verdict.
enum class ErrorKind {
  kConfiguration,  // NOLINT(readability-identifier-naming)
  kMissingField,   // NOLINT(readability-identifier-naming)
  kInvalidValue,   // NOLINT(readability-identifier-naming)
  kValidation,     // NOLINT(readability-identifier-naming)
  kTransport,      // NOLINT(readability-identifier-naming)
};

// Stable wire name for an error kind ("configuration_error", "missing_field", ...).
[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

class GuardError : public std::runtime_error {
 public:
  GuardError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

// Required configuration is missing, or a referenced remote template does not exist.
class ConfigurationError final : public GuardError {
 public:
  explicit ConfigurationError(const std::string& message)
      : GuardError(ErrorKind::kConfiguration, message) {}
};

// A required field is absent from a request or from the provider's response envelope.
class MissingFieldError final : public GuardError {
 public:
  explicit MissingFieldError(std::string field)
      : GuardError(ErrorKind::kMissingField, "Missing required field: " + field),
        field_(std::move(field)) {}

  [[nodiscard]] const std::string& field() const noexcept { return field_; }

 private:
  std::string field_;
};

// A value is present but malformed (non-numeric config, wrong JSON type, empty content list).
class InvalidValueError final : public GuardError {
 public:
  explicit InvalidValueError(const std::string& message)
      : GuardError(ErrorKind::kInvalidValue, message) {}
};

// A prompt override key failed validation. Raised before any fetch is attempted.
class ValidationError final : public GuardError {
 public:
  explicit ValidationError(const std::string& message)
      : GuardError(ErrorKind::kValidation, message) {}
};

// The model provider or the prompt store could not be reached, refused the request,
// or kept throttling after the retry budget was spent.
class TransportError final : public GuardError {
 public:
  explicit TransportError(const std::string& message, long http_status = 0)
      : GuardError(ErrorKind::kTransport, message), http_status_(http_status) {}

  // 0 when the failure happened below HTTP (DNS, connect, timeout) or outside HTTP entirely.
  [[nodiscard]] long http_status() const noexcept { return http_status_; }

 private:
  long http_status_;
};

}  // namespace injguard::core
