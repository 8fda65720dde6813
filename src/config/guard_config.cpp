#include "injguard/config/guard_config.h"

#include "injguard/core/errors.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace injguard::config {

namespace {

bool is_ascii_space(const char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string trim_ascii(const std::string& text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && is_ascii_space(text[begin])) {
    ++begin;
  }
  while (end > begin && is_ascii_space(text[end - 1])) {
    --end;
  }
  return text.substr(begin, end - begin);
}

std::string require(const EnvLookup& env, const char* name) {
  auto value = env(name);
  if (!value.has_value()) {
    throw core::ConfigurationError(std::string("Missing required environment variable: ") + name);
  }
  return *value;
}

std::optional<std::string> optional_value(const EnvLookup& env, const char* name) {
  auto value = env(name);
  if (!value.has_value() || value->empty()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<int> parse_int_strict(const std::string& text) {
  const std::string trimmed = trim_ascii(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  const long parsed = std::strtol(trimmed.c_str(), &end, 10);
  if (errno == ERANGE || end != trimmed.c_str() + trimmed.size()) {
    return std::nullopt;
  }
  if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
    return std::nullopt;
  }
  return static_cast<int>(parsed);
}

std::optional<double> parse_double_strict(const std::string& text) {
  const std::string trimmed = trim_ascii(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  const double parsed = std::strtod(trimmed.c_str(), &end);
  if (errno == ERANGE || end != trimmed.c_str() + trimmed.size() || !std::isfinite(parsed)) {
    return std::nullopt;
  }
  return parsed;
}

GuardConfig load_guard_config(const EnvLookup& env) {
  GuardConfig config;

  config.model_id = require(env, kEnvModelId);

  const std::string max_tokens_text = require(env, kEnvMaxTokens);
  const std::string temperature_text = require(env, kEnvTemperature);
  config.prompt_bucket = require(env, kEnvPromptBucket);

  const auto max_tokens = parse_int_strict(max_tokens_text);
  if (!max_tokens.has_value()) {
    throw core::InvalidValueError(std::string(kEnvMaxTokens) + " is not an integer: '" +
                                  max_tokens_text + "'");
  }
  config.max_tokens = *max_tokens;

  const auto temperature = parse_double_strict(temperature_text);
  if (!temperature.has_value()) {
    throw core::InvalidValueError(std::string(kEnvTemperature) + " is not a number: '" +
                                  temperature_text + "'");
  }
  config.temperature = *temperature;

  config.deploy_override_key = optional_value(env, kEnvPromptOverrideKey);
  config.model_endpoint = optional_value(env, kEnvModelEndpoint);
  config.model_api_key = optional_value(env, kEnvModelApiKey);

  return config;
}

EnvLookup process_env_lookup() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());  // NOLINT(concurrency-mt-unsafe)
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

}  // namespace injguard::config
