#include "injguard/validation/code_fence.h"

namespace injguard::validation {

std::optional<std::string_view> match_json_fence(std::string_view text) noexcept {
  if (!text.starts_with(kFenceOpen)) {
    return std::nullopt;
  }

  // Opening line: tag, optional horizontal whitespace, exactly one '\n'.
  std::size_t pos = kFenceOpen.size();
  while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) {
    ++pos;
  }
  if (pos >= text.size() || text[pos] != '\n') {
    return std::nullopt;
  }
  const std::size_t body_begin = pos + 1;

  // Closing line: '\n' immediately followed by the fence at the very end.
  constexpr std::size_t kCloseLen = kFenceClose.size() + 1;
  if (text.size() < kCloseLen || !text.ends_with(kFenceClose) ||
      text[text.size() - kCloseLen] != '\n') {
    return std::nullopt;
  }
  const std::size_t body_end = text.size() - kCloseLen;

  // The opening '\n' cannot double as the closing one.
  if (body_end < body_begin) {
    return std::nullopt;
  }

  return text.substr(body_begin, body_end - body_begin);
}

}  // namespace injguard::validation
