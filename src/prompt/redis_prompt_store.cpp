#include "injguard/prompt/redis_prompt_store.h"

#include "injguard/config/redis_config.h"
#include "injguard/core/errors.h"

#include <sw/redis++/redis++.h>

namespace injguard::prompt {

RedisPromptStore::RedisPromptStore(const std::string& redis_uri)
    : endpoint_(describe_endpoint(redis_uri)) {
  try {
    redis_ = std::make_unique<sw::redis::Redis>(redis_uri);
    redis_->ping();
  } catch (const sw::redis::Error& e) {
    throw core::TransportError("Failed to connect to Redis prompt store: " +
                               std::string(e.what()));
  }
}

RedisPromptStore::~RedisPromptStore() = default;

std::string RedisPromptStore::object_key(const std::string& bucket, const std::string& key) {
  return "injguard:prompt:" + bucket + ":" + key;
}

std::optional<std::string> RedisPromptStore::get_object(const std::string& bucket,
                                                        const std::string& key) {
  try {
    auto value = redis_->get(object_key(bucket, key));
    if (!value) {
      return std::nullopt;
    }
    return *value;
  } catch (const sw::redis::Error& e) {
    throw core::TransportError("Failed to read prompt from Redis: " + std::string(e.what()));
  }
}

void RedisPromptStore::put_object(const std::string& bucket, const std::string& key,
                                  const std::string& body) {
  try {
    redis_->set(object_key(bucket, key), body);
  } catch (const sw::redis::Error& e) {
    throw core::TransportError("Failed to write prompt to Redis: " + std::string(e.what()));
  }
}

std::string RedisPromptStore::describe_endpoint(const std::string& redis_uri) {
  const auto config = config::parse_redis_uri(redis_uri);
  return config.has_value() ? config::redis_config_to_log_string(config.value())
                            : "<unparsed uri>";
}

std::string RedisPromptStore::describe() const {
  return "redis -- " + endpoint_;
}

}  // namespace injguard::prompt
