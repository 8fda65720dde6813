#pragma once

#include <chrono>

namespace injguard::model {

// RetryPolicy bounds how hard the transport tries before giving up.
// Defaults: 5 attempts in total, 60 s connect timeout, 300 s read (inactivity) timeout.
struct RetryPolicy {
  int max_attempts{5};                          // NOLINT(readability-identifier-naming)
  std::chrono::milliseconds base_delay{200};    // NOLINT(readability-identifier-naming)
  std::chrono::milliseconds max_delay{20000};   // NOLINT(readability-identifier-naming)
  long connect_timeout_seconds{60};             // NOLINT(readability-identifier-naming)
  long read_timeout_seconds{300};               // NOLINT(readability-identifier-naming)
};

// 429 and 5xx gateway/availability statuses (500, 502, 503, 504).
[[nodiscard]] bool is_retryable_status(long http_status) noexcept;

// 429: the provider is rate limiting this client.
[[nodiscard]] bool is_throttling_status(long http_status) noexcept;

// AdaptiveBackoff computes retry delays: exponential in the number of failed attempts,
// capped at max_delay, with equal jitter, and stretched by a throttle factor that doubles
// on every throttling response (up to kMaxThrottleFactor) and halves on every success.
// The factor persists across requests on the same client, so a client that keeps being
// throttled slows down instead of hammering the provider.
class AdaptiveBackoff {
 public:
  static constexpr double kMaxThrottleFactor = 8.0;

  explicit AdaptiveBackoff(RetryPolicy policy) : policy_(policy) {}

  // failed_attempts >= 1. jitter in [0, 1); 0 yields the lower half-bound.
  [[nodiscard]] std::chrono::milliseconds next_delay(int failed_attempts, bool throttled,
                                                     double jitter);

  void on_success() noexcept;

  [[nodiscard]] double throttle_factor() const noexcept { return throttle_factor_; }
  [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }

 private:
  RetryPolicy policy_;
  double throttle_factor_{1.0};
};

}  // namespace injguard::model
