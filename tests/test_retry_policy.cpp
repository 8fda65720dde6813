#include "injguard/model/retry_policy.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using namespace injguard::model;
using std::chrono::milliseconds;

TEST_CASE("is_retryable_status covers throttling and availability errors", "[retry]") {
  for (const long status : {429L, 500L, 502L, 503L, 504L}) {
    CHECK(is_retryable_status(status));
  }
  for (const long status : {0L, 200L, 400L, 401L, 403L, 404L, 413L, 501L}) {
    CHECK_FALSE(is_retryable_status(status));
  }
  CHECK(is_throttling_status(429));
  CHECK_FALSE(is_throttling_status(503));
}

TEST_CASE("RetryPolicy defaults", "[retry]") {
  const RetryPolicy policy;
  CHECK(policy.max_attempts == 5);
  CHECK(policy.connect_timeout_seconds == 60);
  CHECK(policy.read_timeout_seconds == 300);
}

TEST_CASE("AdaptiveBackoff grows exponentially within jitter bounds", "[retry]") {
  AdaptiveBackoff backoff(RetryPolicy{});

  CHECK(backoff.next_delay(1, false, 0.0) == milliseconds(100));
  CHECK(backoff.next_delay(1, false, 1.0) == milliseconds(200));
  CHECK(backoff.next_delay(2, false, 0.0) == milliseconds(200));
  CHECK(backoff.next_delay(3, false, 0.0) == milliseconds(400));
  CHECK(backoff.next_delay(3, false, 0.5) == milliseconds(600));
  CHECK(backoff.throttle_factor() == 1.0);
}

TEST_CASE("AdaptiveBackoff caps delays at max_delay", "[retry]") {
  AdaptiveBackoff backoff(RetryPolicy{});
  CHECK(backoff.next_delay(30, false, 1.0) == milliseconds(20000));
  CHECK(backoff.next_delay(30, false, 0.0) == milliseconds(10000));
}

TEST_CASE("AdaptiveBackoff slows down on throttling and recovers on success", "[retry]") {
  AdaptiveBackoff backoff(RetryPolicy{});

  CHECK(backoff.next_delay(1, true, 0.0) == milliseconds(200));
  CHECK(backoff.throttle_factor() == 2.0);
  CHECK(backoff.next_delay(1, true, 0.0) == milliseconds(400));
  (void)backoff.next_delay(1, true, 0.0);
  (void)backoff.next_delay(1, true, 0.0);
  CHECK(backoff.throttle_factor() == AdaptiveBackoff::kMaxThrottleFactor);

  // Unthrottled retries keep the current factor.
  CHECK(backoff.next_delay(1, false, 0.0) == milliseconds(800));

  backoff.on_success();
  CHECK(backoff.throttle_factor() == 4.0);
  backoff.on_success();
  backoff.on_success();
  backoff.on_success();
  CHECK(backoff.throttle_factor() == 1.0);
}

TEST_CASE("AdaptiveBackoff clamps out-of-range jitter", "[retry]") {
  AdaptiveBackoff backoff(RetryPolicy{});
  CHECK(backoff.next_delay(1, false, -3.0) == milliseconds(100));
  CHECK(backoff.next_delay(1, false, 7.0) == milliseconds(200));
}
