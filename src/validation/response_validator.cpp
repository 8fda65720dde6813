#include "injguard/validation/response_validator.h"

#include "injguard/validation/code_fence.h"

#include <nlohmann/json.hpp>

#include <string>

namespace injguard::validation {

namespace {

using ordered_json = nlohmann::ordered_json;

constexpr std::string_view kWhitespace = " \t\n\r\f\v";
constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

std::string_view trim(std::string_view text) noexcept {
  const auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

ValidationOutcome reject(RejectionCode code, std::string message) {
  return ValidationOutcome::err(Rejection{code, std::move(message)});
}

std::string describe_keys(const ordered_json& object) {
  std::string out = "[";
  bool first = true;
  for (const auto& [key, _] : object.items()) {
    if (!first) {
      out += ", ";
    }
    out += key;
    first = false;
  }
  out += "]";
  return out;
}

}  // namespace

std::string_view to_string(const RejectionCode code) noexcept {
  switch (code) {
    case RejectionCode::kInvalidJson:
      return "invalid_json";
    case RejectionCode::kNotAnObject:
      return "not_an_object";
    case RejectionCode::kWrongKeys:
      return "wrong_keys";
    case RejectionCode::kWrongType:
      return "wrong_type";
    case RejectionCode::kExtraContent:
      return "extra_content";
  }
  return "unknown";
}

ValidationOutcome validate_model_response(std::string_view raw) {
  const std::string_view trimmed = trim(raw);

  const auto fence_body = match_json_fence(trimmed);
  const bool fenced = fence_body.has_value();
  const std::string_view payload = fenced ? trim(*fence_body) : trimmed;

  // nlohmann skips a leading BOM on its own; here it is an unaccounted-for character.
  if (payload.starts_with(kUtf8Bom)) {
    return reject(RejectionCode::kInvalidJson, "Invalid JSON: unexpected UTF-8 byte-order mark");
  }

  ordered_json parsed;
  try {
    parsed = ordered_json::parse(payload.begin(), payload.end());
  } catch (const ordered_json::parse_error& e) {
    // e.what() echoes the last token read, which may end inside a multi-byte sequence.
    // The message becomes verdict reasoning and must stay valid UTF-8.
    return reject(RejectionCode::kInvalidJson,
                  "Invalid JSON: parse error " + std::to_string(e.id) + " at byte " +
                      std::to_string(e.byte));
  }

  if (!parsed.is_object()) {
    return reject(RejectionCode::kNotAnObject,
                  std::string("JSON is not an object, got ") + parsed.type_name());
  }

  if (parsed.size() != 2 || !parsed.contains("safe") || !parsed.contains("reasoning")) {
    return reject(RejectionCode::kWrongKeys, "JSON has incorrect keys: " + describe_keys(parsed) +
                                                 ". Expected exactly: safe, reasoning");
  }

  const auto& safe = parsed.at("safe");
  if (!safe.is_boolean()) {
    return reject(RejectionCode::kWrongType,
                  std::string(R"("safe" value is not a boolean, got )") + safe.type_name());
  }

  const auto& reasoning = parsed.at("reasoning");
  if (!reasoning.is_string()) {
    return reject(RejectionCode::kWrongType,
                  std::string(R"("reasoning" value is not a string, got )") +
                      reasoning.type_name());
  }

  // The parser has already refused trailing data inside the payload; this comparison
  // additionally accounts for every byte between the fence markers and the payload.
  if (fenced) {
    std::string expected;
    expected.reserve(kFenceOpen.size() + payload.size() + kFenceClose.size() + 2);
    expected += kFenceOpen;
    expected += '\n';
    expected += payload;
    expected += '\n';
    expected += kFenceClose;
    if (trim(expected) != trimmed) {
      return reject(RejectionCode::kExtraContent, "Extra text detected outside JSON code fence");
    }
  } else if (payload != trimmed) {
    return reject(RejectionCode::kExtraContent, "Extra text detected outside JSON");
  }

  return ValidationOutcome::ok(
      domain::Verdict{safe.get<bool>(), reasoning.get<std::string>()});
}

}  // namespace injguard::validation
