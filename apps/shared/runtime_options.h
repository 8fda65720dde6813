#pragma once

#include "injguard/config/guard_config.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace injguard::apps {

enum class ModelBackend {
  kHttp,  // NOLINT(readability-identifier-naming)
  kStub,  // NOLINT(readability-identifier-naming)
};

// RuntimeOptions selects the backends a classifying process is wired with.
// Every field has an explicit default; optional fields mean "not configured".
struct RuntimeOptions {
  std::optional<std::string> db_path;     // NOLINT(readability-identifier-naming)
  std::optional<std::string> redis_uri;   // NOLINT(readability-identifier-naming)
  std::optional<std::string> prompt_dir;  // NOLINT(readability-identifier-naming)
  ModelBackend model_backend{ModelBackend::kHttp};  // NOLINT(readability-identifier-naming)
};

// The flags shared by injguard_server and `injguard_cli classify`, bound to the
// RuntimeOptions member `field` of the caller's config struct.
template <typename Config>
std::vector<Option<Config>> runtime_option_registry(RuntimeOptions Config::*field) {
  return {
      {"--db", true, "Path to SQLite audit database (default: in-memory, lost on exit)",
       [field](Config& c, const std::string& v) {
         (c.*field).db_path = v;
         return true;
       }},
      {"--redis", true, "Redis URI of the prompt store (tcp://host:port, redis://host:port/N)",
       [field](Config& c, const std::string& v) {
         (c.*field).redis_uri = v;
         return true;
       }},
      {"--prompt-dir", true, "Directory holding prompt objects as <dir>/<bucket>/<key>",
       [field](Config& c, const std::string& v) {
         (c.*field).prompt_dir = v;
         return true;
       }},
      {"--model-backend", true, "Model backend (http|stub)",
       [field](Config& c, const std::string& v) {
         if (v == "http") {
           (c.*field).model_backend = ModelBackend::kHttp;
           return true;
         }
         if (v == "stub") {
           (c.*field).model_backend = ModelBackend::kStub;
           return true;
         }
         std::cerr << "Invalid --model-backend: " << v << " (valid: http, stub)\n";
         return false;
       }},
  };
}

}  // namespace injguard::apps
