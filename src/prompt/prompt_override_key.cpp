#include "injguard/prompt/prompt_override_key.h"

namespace injguard::prompt {

std::string validate_prompt_override_key(std::string_view key) {
  if (key.empty()) {
    return "";
  }

  if (key.size() > kMaxOverrideKeyLength) {
    return "Prompt override key exceeds " + std::to_string(kMaxOverrideKeyLength) +
           " characters (got " + std::to_string(key.size()) + ")";
  }

  if (key.find('\0') != std::string_view::npos) {
    return "Prompt override key contains a NUL byte";
  }

  if (!key.starts_with(kRequiredKeyPrefix)) {
    return "Prompt override key must start with '" + std::string(kRequiredKeyPrefix) + "'";
  }

  if (key.find("..") != std::string_view::npos) {
    return "Prompt override key must not contain '..'";
  }

  const auto last_slash = key.rfind('/');
  const std::string_view filename = key.substr(last_slash + 1);
  if (filename.empty() || filename == ".") {
    return "Prompt override key must name a file, not a directory";
  }

  return "";
}

std::string resolve_effective_key(const std::optional<std::string>& request_key,
                                  const std::optional<std::string>& deploy_key) {
  if (request_key.has_value()) {
    return request_key.value();
  }
  if (!deploy_key.has_value()) {
    return "";
  }

  constexpr std::string_view kWhitespace = " \t\n\r\f\v";
  const std::string& raw = deploy_key.value();
  const auto first = raw.find_first_not_of(kWhitespace);
  if (first == std::string::npos) {
    return "";
  }
  const auto last = raw.find_last_not_of(kWhitespace);
  return raw.substr(first, last - first + 1);
}

}  // namespace injguard::prompt
