#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace injguard::model {

struct ConverseRequest {
  std::string model_id;    // NOLINT(readability-identifier-naming)
  std::string prompt;      // NOLINT(readability-identifier-naming)
  int max_tokens{0};       // NOLINT(readability-identifier-naming)
  double temperature{0.0};  // NOLINT(readability-identifier-naming)
};

// IModelClient submits one user message to the text-generation provider and returns the
// provider's response envelope untouched. Envelope interpretation belongs to
// extract_model_text() so that every backend fails the same way on a malformed envelope.
//
// Contract: blocking; retry/backoff/timeouts are the implementation's concern. Failures
// that survive them throw core::TransportError. Implementations never return a verdict.
class IModelClient {
 public:
  virtual ~IModelClient() = default;

  [[nodiscard]] virtual nlohmann::json converse(const ConverseRequest& request) = 0;
};

// StubModelClient replays scripted responses in order and records every request.
//
// push_text wraps the text in a well-formed envelope; push_envelope queues a raw envelope
// (for malformed-envelope tests). When the script runs out, the fallback text is wrapped
// and returned, so the stub can also back a demo server.
class StubModelClient final : public IModelClient {
 public:
  explicit StubModelClient(std::string fallback_text =
                               R"({"safe": false, "reasoning": "stub model backend"})");

  void push_text(const std::string& model_text);
  void push_envelope(nlohmann::json envelope);

  [[nodiscard]] nlohmann::json converse(const ConverseRequest& request) override;

  [[nodiscard]] const std::vector<ConverseRequest>& requests() const { return requests_; }
  [[nodiscard]] std::size_t call_count() const { return requests_.size(); }

 private:
  std::string fallback_text_;
  std::deque<nlohmann::json> script_;
  std::vector<ConverseRequest> requests_;
};

}  // namespace injguard::model
