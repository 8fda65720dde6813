#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace injguard::prompt {

constexpr std::string_view kRequiredKeyPrefix = "custom_prompts/";
constexpr std::size_t kMaxOverrideKeyLength = 1024;

// validate_prompt_override_key checks a remote template key before any lookup.
//
// Returns: "" when the key is acceptable, otherwise a human-readable reason.
//
// The empty key is acceptable and means "use the built-in template". A non-empty key must:
// - be at most kMaxOverrideKeyLength bytes
// - contain no NUL byte
// - start with kRequiredKeyPrefix
// - contain no ".." sequence
// - name a file, not a directory (no trailing '/')
[[nodiscard]] std::string validate_prompt_override_key(std::string_view key);

// resolve_effective_key applies override precedence. A request key that is present wins,
// including an explicitly empty one (which selects the built-in template even when a
// deploy-time key is configured). Otherwise the deploy-time key, whitespace-trimmed.
[[nodiscard]] std::string resolve_effective_key(const std::optional<std::string>& request_key,
                                                const std::optional<std::string>& deploy_key);

}  // namespace injguard::prompt
