#include "injguard/model/converse_envelope.h"
#include "injguard/model/model_client.h"

namespace injguard::model {

StubModelClient::StubModelClient(std::string fallback_text)
    : fallback_text_(std::move(fallback_text)) {}

void StubModelClient::push_text(const std::string& model_text) {
  script_.push_back(make_text_envelope(model_text));
}

void StubModelClient::push_envelope(nlohmann::json envelope) {
  script_.push_back(std::move(envelope));
}

nlohmann::json StubModelClient::converse(const ConverseRequest& request) {
  requests_.push_back(request);

  if (script_.empty()) {
    return make_text_envelope(fallback_text_);
  }
  nlohmann::json next = std::move(script_.front());
  script_.pop_front();
  return next;
}

}  // namespace injguard::model
