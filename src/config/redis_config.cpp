#include "injguard/config/redis_config.h"

#include <string_view>

namespace injguard::config {

namespace {

// Digits only, no sign, bounded so the value fits comfortably in int.
std::optional<int> parse_decimal(std::string_view digits) {
  if (digits.empty() || digits.size() > 9) {
    return std::nullopt;
  }
  int value = 0;
  for (const char c : digits) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  return value;
}

}  // namespace

std::optional<RedisConfig> parse_redis_uri(const std::string& uri) {
  if (uri.empty()) {
    return std::nullopt;
  }

  std::string_view view{uri};
  std::string_view rest;
  bool allows_db = false;

  if (view.starts_with("tcp://")) {
    rest = view.substr(6);
  } else if (view.starts_with("redis://")) {
    rest = view.substr(8);
    allows_db = true;
  } else {
    return std::nullopt;
  }

  int redis_db = 0;
  const auto slash_pos = rest.find('/');
  if (slash_pos != std::string_view::npos) {
    if (!allows_db) {
      return std::nullopt;
    }
    const auto db = parse_decimal(rest.substr(slash_pos + 1));
    if (!db.has_value()) {
      return std::nullopt;
    }
    redis_db = *db;
    rest = rest.substr(0, slash_pos);
  }

  // Credentials ([user]:password@) are kept in uri only and never reach host.
  if (const auto at_pos = rest.rfind('@'); at_pos != std::string_view::npos) {
    rest = rest.substr(at_pos + 1);
  }

  if (rest.empty()) {
    return std::nullopt;
  }

  // Split on last colon to separate host from port.
  std::string host;
  int port = 6379;
  const auto colon_pos = rest.rfind(':');
  if (colon_pos == std::string_view::npos) {
    host = std::string{rest};
  } else {
    host = std::string{rest.substr(0, colon_pos)};
    const auto parsed_port = parse_decimal(rest.substr(colon_pos + 1));
    if (!parsed_port.has_value() || *parsed_port < 1 || *parsed_port > 65535) {
      return std::nullopt;
    }
    port = *parsed_port;
  }

  if (host.empty()) {
    return std::nullopt;
  }

  return RedisConfig{.uri = uri, .host = host, .port = port, .redis_db = redis_db};
}

std::string redis_config_to_log_string(const RedisConfig& config) {
  std::string out = config.host + ":" + std::to_string(config.port);
  if (config.redis_db != 0) {
    out += "/" + std::to_string(config.redis_db);
  }
  return out;
}

}  // namespace injguard::config
