#include "classify.h"

#include "injguard/config/guard_config.h"
#include "injguard/core/clock.h"
#include "injguard/core/errors.h"
#include "injguard/core/id_generator.h"

#include "classify_logic.h"
#include "shared/arg_parser.h"
#include "shared/runtime.h"
#include "shared/runtime_options.h"
#include "shared/startup_guard.h"
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct ClassifyCliConfig {
  injguard::apps::RuntimeOptions runtime;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> event_path;   // NOLINT(readability-identifier-naming)
};

std::optional<std::string> read_event(const std::string& path) {
  if (path == "-") {
    return std::string{std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>()};
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

}  // namespace

int cmd_classify(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto options = injguard::apps::runtime_option_registry(&ClassifyCliConfig::runtime);
  options.push_back({"--event", true, "Event JSON file, or - for stdin",
                     [](ClassifyCliConfig& c, const std::string& v) {
                       c.event_path = v;
                       return true;
                     }});

  injguard::apps::ParseStatus status;
  const auto config = injguard::apps::parse_options(argc, argv, options, status, 2);
  if (!status.ok) {
    return 1;
  }
  if (!config.event_path.has_value()) {
    std::cerr << "Error: --event <file|-> is required\n";
    return 1;
  }

  injguard::config::GuardConfig guard_config;
  try {
    guard_config = injguard::config::load_guard_config(injguard::config::process_env_lookup());
  } catch (const injguard::core::GuardError& e) {
    std::cerr << "Error (" << injguard::core::to_string(e.kind()) << "): " << e.what() << "\n";
    return 1;
  }

  const std::string config_error =
      injguard::apps::validate_runtime_options(config.runtime, guard_config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  const auto event_text = read_event(config.event_path.value());
  if (!event_text.has_value()) {
    std::cerr << "Error: cannot read event file '" << config.event_path.value() << "'\n";
    return 1;
  }

  auto runtime_result = injguard::apps::build_runtime(config.runtime, guard_config);
  if (!runtime_result.has_value()) {
    std::cerr << "Error: " << runtime_result.error() << "\n";
    return 1;
  }
  const auto& runtime = runtime_result.value();

  injguard::core::SystemIdGenerator id_gen;
  injguard::core::SystemClock clock;
  return execute_classify(event_text.value(), *runtime->services, guard_config, id_gen, clock,
                          std::cout, std::cerr);
}
