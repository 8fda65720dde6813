#pragma once

#include <string>
#include <string_view>

namespace injguard::prompt {

constexpr std::string_view kClosingMarker = "=== END USER REQUEST ===";

// assemble_prompt returns template + "\n" + user_input + "\n" + kClosingMarker.
//
// user_input is passed through byte for byte: no escaping, trimming, length limit or
// control-character filtering. Input that imitates kClosingMarker stays in place; the
// model is the component that analyses it.
[[nodiscard]] std::string assemble_prompt(std::string_view prompt_template,
                                          std::string_view user_input);

}  // namespace injguard::prompt
