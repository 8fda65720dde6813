#include "validate.h"

#include "shared/arg_parser.h"
#include "validate_logic.h"
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace {

struct ValidateCliConfig {};

}  // namespace

int cmd_validate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  injguard::apps::ParseStatus status;
  const std::vector<injguard::apps::Option<ValidateCliConfig>> options = {};
  (void)injguard::apps::parse_options(argc, argv, options, status, 2);
  if (!status.ok || !status.positional.empty()) {
    std::cerr << "Usage: injguard_cli validate < model_output.txt\n";
    return 1;
  }

  // Read stdin verbatim: trailing newlines are part of what the validator judges.
  const std::string model_output{std::istreambuf_iterator<char>(std::cin),
                                 std::istreambuf_iterator<char>()};
  return execute_validate(model_output, std::cout);
}
