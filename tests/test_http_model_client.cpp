#include "injguard/core/errors.h"
#include "injguard/model/http_model_client.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <chrono>
#include <string>

using namespace injguard;
using Catch::Matchers::ContainsSubstring;

namespace {

model::HttpModelClientOptions unreachable_options(int attempts) {
  model::RetryPolicy retry;
  retry.max_attempts = attempts;
  retry.base_delay = std::chrono::milliseconds(1);
  retry.max_delay = std::chrono::milliseconds(2);
  retry.connect_timeout_seconds = 2;
  retry.read_timeout_seconds = 2;
  // Port 1 on loopback: connection refused without leaving the host.
  return model::HttpModelClientOptions{
      .endpoint = "http://127.0.0.1:1/",
      .api_key = std::nullopt,
      .retry = retry,
  };
}

}  // namespace

TEST_CASE("HttpModelClient: unreachable endpoint is a transport error after retries",
          "[model][http]") {
  model::HttpModelClient client(unreachable_options(3));
  const model::ConverseRequest request{"guard/model:1", "prompt", 16, 0.0};

  try {
    (void)client.converse(request);
    FAIL("expected TransportError");
  } catch (const core::TransportError& e) {
    CHECK_THAT(std::string(e.what()), ContainsSubstring("after 3 attempts"));
    CHECK(e.http_status() == 0);
    CHECK(e.kind() == core::ErrorKind::kTransport);
  }
}

TEST_CASE("HttpModelClient: a single-attempt policy does not retry", "[model][http]") {
  model::HttpModelClient client(unreachable_options(1));
  const model::ConverseRequest request{"m", "p", 1, 0.0};

  try {
    (void)client.converse(request);
    FAIL("expected TransportError");
  } catch (const core::TransportError& e) {
    CHECK_THAT(std::string(e.what()), ContainsSubstring("after 1 attempts"));
  }
}
