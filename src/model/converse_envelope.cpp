#include "injguard/model/converse_envelope.h"

#include "injguard/core/errors.h"

#include <iostream>

namespace injguard::model {

using json = nlohmann::json;

namespace {

const json& require_object_member(const json& parent, const char* parent_name, const char* key) {
  if (!parent.is_object()) {
    throw core::InvalidValueError(std::string("Model response field '") + parent_name +
                                  "' is not an object, got " + parent.type_name());
  }
  const auto it = parent.find(key);
  if (it == parent.end()) {
    throw core::MissingFieldError(key);
  }
  return *it;
}

}  // namespace

json build_converse_body(const ConverseRequest& request) {
  return json{
      {"messages", json::array({json{
                       {"role", "user"},
                       {"content", json::array({json{{"text", request.prompt}}})},
                   }})},
      {"inferenceConfig",
       {
           {"maxTokens", request.max_tokens},
           {"temperature", request.temperature},
       }},
  };
}

json make_text_envelope(const std::string& model_text) {
  return json{
      {"output",
       {{"message",
         {
             {"role", "assistant"},
             {"content", json::array({json{{"text", model_text}}})},
         }}}},
      {"stopReason", "end_turn"},
  };
}

std::string extract_model_text(const json& envelope) {
  const json& output = require_object_member(envelope, "response", "output");
  const json& message = require_object_member(output, "output", "message");
  const json& content = require_object_member(message, "message", "content");

  if (!content.is_array()) {
    throw core::InvalidValueError(std::string("Model response field 'content' is not a list, got ") +
                                  content.type_name());
  }
  if (content.empty()) {
    std::cerr << "ERROR: No content blocks in model response\n"
              << "Full response: " << envelope.dump() << "\n";
    throw core::InvalidValueError("No content blocks in model response");
  }

  const json& text = require_object_member(content.front(), "content[0]", "text");
  if (!text.is_string()) {
    throw core::InvalidValueError(std::string("Model response field 'text' is not a string, got ") +
                                  text.type_name());
  }
  return text.get<std::string>();
}

}  // namespace injguard::model
