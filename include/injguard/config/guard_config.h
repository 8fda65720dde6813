#pragma once

#include <functional>
#include <optional>
#include <string>

namespace injguard::config {

// EnvLookup returns the value of an environment variable, or nullopt when unset.
// Injected so tests can supply a fixed environment.
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

// GuardConfig is the deployment configuration, read once at startup.
//
// Numeric values are parsed strictly but never range-checked: zero, negative and very
// large values are handed to the model provider unchanged.
struct GuardConfig {
  std::string model_id;                              // NOLINT(readability-identifier-naming)
  int max_tokens{0};                                 // NOLINT(readability-identifier-naming)
  double temperature{0.0};                           // NOLINT(readability-identifier-naming)
  std::string prompt_bucket;                         // NOLINT(readability-identifier-naming)
  std::optional<std::string> deploy_override_key;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> model_endpoint;         // NOLINT(readability-identifier-naming)
  std::optional<std::string> model_api_key;          // NOLINT(readability-identifier-naming)
};

inline constexpr const char* kEnvModelId = "MODEL_ID";
inline constexpr const char* kEnvMaxTokens = "MAX_TOKENS";
inline constexpr const char* kEnvTemperature = "TEMPERATURE";
inline constexpr const char* kEnvPromptBucket = "PROMPT_BUCKET";
inline constexpr const char* kEnvPromptOverrideKey = "PROMPT_OVERRIDE_KEY";
inline constexpr const char* kEnvModelEndpoint = "MODEL_ENDPOINT";
inline constexpr const char* kEnvModelApiKey = "MODEL_API_KEY";

// load_guard_config reads every variable through `env`.
//
// Throws:
// - core::ConfigurationError naming the first missing required variable
//   (MODEL_ID, MAX_TOKENS, TEMPERATURE, PROMPT_BUCKET, in that order)
// - core::InvalidValueError when MAX_TOKENS is not a complete integer or TEMPERATURE is
//   not a complete decimal number
//
// Optional variables that are set to an empty string are treated as unset.
[[nodiscard]] GuardConfig load_guard_config(const EnvLookup& env);

// EnvLookup backed by std::getenv.
[[nodiscard]] EnvLookup process_env_lookup();

// parse_int_strict / parse_double_strict accept the whole string or nothing.
// Surrounding ASCII whitespace is tolerated.
[[nodiscard]] std::optional<int> parse_int_strict(const std::string& text);
[[nodiscard]] std::optional<double> parse_double_strict(const std::string& text);

}  // namespace injguard::config
