#pragma once

#include "injguard/model/model_client.h"

#include <nlohmann/json.hpp>

#include <string>

namespace injguard::model {

// build_converse_body returns the provider request body:
//   {"messages":[{"role":"user","content":[{"text":<prompt>}]}],
//    "inferenceConfig":{"maxTokens":<n>,"temperature":<t>}}
// The model id travels in the URL, not the body.
[[nodiscard]] nlohmann::json build_converse_body(const ConverseRequest& request);

// make_text_envelope wraps model text in the minimal well-formed response envelope.
[[nodiscard]] nlohmann::json make_text_envelope(const std::string& model_text);

// extract_model_text isolates the raw model text at output.message.content[0].text.
//
// This sits upstream of the response validator, so every failure here is fatal and is
// never turned into a verdict:
// - a missing key throws core::MissingFieldError naming the key
// - a value of the wrong JSON type throws core::InvalidValueError
// - an empty content list throws core::InvalidValueError("No content blocks in model response")
// Unknown envelope fields (usage, metrics, stopReason, ...) are ignored. Only the first
// content block is read.
[[nodiscard]] std::string extract_model_text(const nlohmann::json& envelope);

}  // namespace injguard::model
