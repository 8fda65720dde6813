#pragma once

#ifdef INJGUARD_TRANSPORT_BOUNDARY_GUARD
#error "Concrete redis header included in a guarded translation unit — use IPromptStore only."
#endif

#include "injguard/prompt/prompt_store.h"

#include <memory>
#include <string>

// Forward declare redis++ so the header does not leak it to callers.
namespace sw {
namespace redis {
class Redis;
}
}  // namespace sw

namespace injguard::prompt {

// RedisPromptStore reads template overrides from Redis string values.
//
// Data model: injguard:prompt:{bucket}:{key} -> template text (UTF-8)
//
// A missing key maps to nullopt. Connection or command failures throw core::TransportError.
class RedisPromptStore final : public IPromptStore {
 public:
  // Connects and pings. Throws core::TransportError when Redis is unreachable.
  explicit RedisPromptStore(const std::string& redis_uri);
  ~RedisPromptStore() override;

  RedisPromptStore(const RedisPromptStore&) = delete;
  RedisPromptStore& operator=(const RedisPromptStore&) = delete;
  RedisPromptStore(RedisPromptStore&&) = delete;
  RedisPromptStore& operator=(RedisPromptStore&&) = delete;

  [[nodiscard]] std::optional<std::string> get_object(const std::string& bucket,
                                                      const std::string& key) override;
  [[nodiscard]] std::string describe() const override;

  // Writes an object. Used by provisioning tooling and integration tests.
  void put_object(const std::string& bucket, const std::string& key, const std::string& body);

  [[nodiscard]] static std::string object_key(const std::string& bucket, const std::string& key);

  // "host:port[/db]" for logs. Credentials in the URI are dropped.
  [[nodiscard]] static std::string describe_endpoint(const std::string& redis_uri);

 private:
  std::string endpoint_;
  std::unique_ptr<sw::redis::Redis> redis_;
};

}  // namespace injguard::prompt
