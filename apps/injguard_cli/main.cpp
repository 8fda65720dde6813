#include "injguard/core/version.h"

#include "commands/check_key.h"
#include "commands/classify.h"
#include "commands/validate.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "injection-guard CLI v" << injguard::core::kBuildVersion << "\n"
            << "Usage:\n"
            << "  injguard_cli validate                 < model_output.txt\n"
            << "  injguard_cli check-key <key>\n"
            << "  injguard_cli classify --event <file|-> [--redis <uri> | --prompt-dir <dir>]\n"
            << "                        [--db <path>] [--model-backend http|stub]\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "validate") {
    return cmd_validate(argc, argv);
  }
  if (subcommand == "check-key") {
    return cmd_check_key(argc, argv);
  }
  if (subcommand == "classify") {
    return cmd_classify(argc, argv);
  }
  if (subcommand == "--help" || subcommand == "help") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown subcommand: " << subcommand << "\n";
  print_usage();
  return 1;
}
