#include "config.h"

namespace injguard::server {

std::vector<apps::Option<ServerConfig>> build_option_registry() {
  auto options = apps::runtime_option_registry(&ServerConfig::runtime);
  options.push_back({"--help", false, "Print this help and exit",
                     [](ServerConfig& c, const std::string& /*v*/) {
                       c.show_help = true;
                       return true;
                     }});
  return options;
}

ServerConfig parse_args(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                        apps::ParseStatus& status) {
  return apps::parse_options(argc, argv, build_option_registry(), status);
}

}  // namespace injguard::server
