#include "check_key_logic.h"

#include "injguard/prompt/prompt_override_key.h"

int execute_check_key(const std::string& key, std::ostream& out, std::ostream& err) {
  const std::string error = injguard::prompt::validate_prompt_override_key(key);
  if (!error.empty()) {
    err << "INVALID: " << error << "\n";
    return 1;
  }

  if (key.empty()) {
    out << "OK: empty key selects the built-in template\n";
  } else {
    out << "OK: " << key << "\n";
  }
  return 0;
}
