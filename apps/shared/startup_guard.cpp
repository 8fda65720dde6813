#include "shared/startup_guard.h"

#include "injguard/config/redis_config.h"

#include <filesystem>
#include <system_error>

namespace injguard::apps {

std::string validate_runtime_options(const RuntimeOptions& options,
                                     const config::GuardConfig& guard_config) {
  if (options.redis_uri.has_value() && options.prompt_dir.has_value()) {
    return "Error: --redis and --prompt-dir are mutually exclusive.\n"
           "       Choose one prompt store.";
  }

  if (options.redis_uri.has_value() &&
      !config::parse_redis_uri(options.redis_uri.value()).has_value()) {
    return "Error: --redis URI '" + options.redis_uri.value() +
           "' is not a valid Redis URI.\n"
           "       Accepted formats: tcp://host:port, redis://host:port, tcp://host, "
           "redis://host:port/N";
  }

  if (options.prompt_dir.has_value()) {
    std::error_code ec;
    if (!std::filesystem::is_directory(options.prompt_dir.value(), ec)) {
      return "Error: --prompt-dir '" + options.prompt_dir.value() + "' is not a directory.";
    }
  }

  if (options.model_backend == ModelBackend::kHttp && !guard_config.model_endpoint.has_value()) {
    return "Error: the http model backend requires MODEL_ENDPOINT.\n"
           "       Set MODEL_ENDPOINT to the runtime base URL, or pass --model-backend stub.";
  }

  return "";
}

}  // namespace injguard::apps
