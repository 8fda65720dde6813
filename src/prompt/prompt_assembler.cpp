#include "injguard/prompt/prompt_assembler.h"

namespace injguard::prompt {

std::string assemble_prompt(std::string_view prompt_template, std::string_view user_input) {
  std::string full;
  full.reserve(prompt_template.size() + user_input.size() + kClosingMarker.size() + 2);
  full += prompt_template;
  full += '\n';
  full += user_input;
  full += '\n';
  full += kClosingMarker;
  return full;
}

}  // namespace injguard::prompt
