#pragma once

#include <optional>
#include <string_view>

namespace injguard::validation {

constexpr std::string_view kFenceOpen = "```json";
constexpr std::string_view kFenceClose = "```";

// match_json_fence recognises the one fenced shape the model is allowed to use:
//
//   ```json[ \t]*\n<body>\n```
//
// anchored at both ends of `text` (callers pass already-trimmed text). Only '\n' is a
// line terminator: a '\r' after the tag, an uppercase tag, or a fourth backtick all
// fail to match. Returns a view of the body (not trimmed) into `text`, or nullopt.
//
// This is deliberately a fixed grammar, not a markdown parser. Many valid markdown
// fence variants must NOT match.
[[nodiscard]] std::optional<std::string_view> match_json_fence(std::string_view text) noexcept;

}  // namespace injguard::validation
