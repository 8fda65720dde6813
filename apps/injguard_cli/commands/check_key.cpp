#include "check_key.h"

#include "check_key_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct CheckKeyCliConfig {};

}  // namespace

int cmd_check_key(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  injguard::apps::ParseStatus status;
  const std::vector<injguard::apps::Option<CheckKeyCliConfig>> options = {};
  (void)injguard::apps::parse_options(argc, argv, options, status, 2);
  if (!status.ok || status.positional.size() != 1) {
    std::cerr << "Usage: injguard_cli check-key <key>\n";
    return 1;
  }

  return execute_check_key(status.positional.front(), std::cout, std::cerr);
}
