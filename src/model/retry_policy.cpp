#include "injguard/model/retry_policy.h"

#include <algorithm>
#include <cmath>

namespace injguard::model {

bool is_retryable_status(const long http_status) noexcept {
  switch (http_status) {
    case 429:
    case 500:
    case 502:
    case 503:
    case 504:
      return true;
    default:
      return false;
  }
}

bool is_throttling_status(const long http_status) noexcept {
  return http_status == 429;
}

std::chrono::milliseconds AdaptiveBackoff::next_delay(const int failed_attempts,
                                                      const bool throttled, const double jitter) {
  if (throttled) {
    throttle_factor_ = std::min(throttle_factor_ * 2.0, kMaxThrottleFactor);
  }

  const int exponent = std::max(0, failed_attempts - 1);
  const double max_ms = static_cast<double>(policy_.max_delay.count());
  double ceiling = static_cast<double>(policy_.base_delay.count()) * std::pow(2.0, exponent);
  ceiling = std::min(ceiling * throttle_factor_, max_ms);

  const double clamped_jitter = std::clamp(jitter, 0.0, 1.0);
  const double delay = (ceiling / 2.0) + (ceiling / 2.0) * clamped_jitter;
  return std::chrono::milliseconds(static_cast<long long>(delay));
}

void AdaptiveBackoff::on_success() noexcept {
  throttle_factor_ = std::max(1.0, throttle_factor_ / 2.0);
}

}  // namespace injguard::model
