#pragma once

#ifdef INJGUARD_TRANSPORT_BOUNDARY_GUARD
#error "Concrete transport header included in a guarded translation unit — use IModelClient only."
#endif

#include "injguard/model/model_client.h"
#include "injguard/model/retry_policy.h"

#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace injguard::model {

struct HttpModelClientOptions {
  // Base URL of the runtime endpoint, e.g. "https://bedrock-runtime.us-east-1.amazonaws.com".
  std::string endpoint;                 // NOLINT(readability-identifier-naming)
  std::optional<std::string> api_key;   // NOLINT(readability-identifier-naming) bearer token
  RetryPolicy retry{};                  // NOLINT(readability-identifier-naming)
};

// HttpModelClient calls a Converse-compatible runtime over HTTPS with libcurl.
//
// POST {endpoint}/model/{url-escaped model_id}/converse, JSON body from build_converse_body().
//
// Retries transport failures (connect, DNS, timeout) and retryable statuses with
// AdaptiveBackoff, up to RetryPolicy::max_attempts attempts in total. Non-retryable
// statuses (400 validation, 403 access denied, 404 unknown model, ...) fail at once.
// A 2xx body that is not JSON is a malformed envelope (core::InvalidValueError).
class HttpModelClient final : public IModelClient {
 public:
  explicit HttpModelClient(HttpModelClientOptions options);
  ~HttpModelClient() override = default;

  HttpModelClient(const HttpModelClient&) = delete;
  HttpModelClient& operator=(const HttpModelClient&) = delete;
  HttpModelClient(HttpModelClient&&) = delete;
  HttpModelClient& operator=(HttpModelClient&&) = delete;

  [[nodiscard]] nlohmann::json converse(const ConverseRequest& request) override;

 private:
  struct HttpResponse {
    bool transport_ok{false};  // NOLINT(readability-identifier-naming)
    long status{0};            // NOLINT(readability-identifier-naming)
    std::string body;          // NOLINT(readability-identifier-naming)
    std::string error;         // NOLINT(readability-identifier-naming)
  };

  [[nodiscard]] HttpResponse post_once(const std::string& url, const std::string& body) const;
  [[nodiscard]] std::string converse_url(const std::string& model_id) const;

  HttpModelClientOptions options_;
  std::mutex backoff_mutex_;
  AdaptiveBackoff backoff_;
  std::mt19937 jitter_engine_;
};

}  // namespace injguard::model
