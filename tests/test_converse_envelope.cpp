#include "injguard/core/errors.h"
#include "injguard/model/converse_envelope.h"
#include "injguard/model/model_client.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <string>

using namespace injguard;
using json = nlohmann::json;

// ── build_converse_body ─────────────────────────────────────────────────────

TEST_CASE("build_converse_body carries prompt and inference settings", "[converse]") {
  const model::ConverseRequest request{"guard-model", "PROMPT TEXT", 256, 0.5};
  const json body = model::build_converse_body(request);

  REQUIRE(body.at("messages").size() == 1);
  CHECK(body.at("messages")[0].at("role") == "user");
  CHECK(body.at("messages")[0].at("content")[0].at("text") == "PROMPT TEXT");
  CHECK(body.at("inferenceConfig").at("maxTokens") == 256);
  CHECK(body.at("inferenceConfig").at("temperature") == 0.5);
  CHECK_FALSE(body.contains("modelId"));
}

// ── extract_model_text ──────────────────────────────────────────────────────

TEST_CASE("extract_model_text returns the first content block's text", "[converse]") {
  CHECK(model::extract_model_text(model::make_text_envelope("hello")) == "hello");
}

TEST_CASE("extract_model_text ignores unknown fields and later blocks", "[converse]") {
  const json envelope = json::parse(R"({
    "output": {"message": {"role": "assistant",
                           "content": [{"text": "first"}, {"text": "second"}]}},
    "usage": {"inputTokens": 10, "outputTokens": 3},
    "metrics": {"latencyMs": 120},
    "stopReason": "end_turn"
  })");
  CHECK(model::extract_model_text(envelope) == "first");
}

TEST_CASE("extract_model_text returns empty text as-is", "[converse]") {
  CHECK(model::extract_model_text(model::make_text_envelope("")).empty());
}

TEST_CASE("extract_model_text: missing keys raise MissingFieldError", "[converse]") {
  CHECK_THROWS_AS(model::extract_model_text(json::object()), core::MissingFieldError);
  CHECK_THROWS_AS(model::extract_model_text(json::parse(R"({"output": {}})")),
                  core::MissingFieldError);
  CHECK_THROWS_AS(model::extract_model_text(json::parse(R"({"output": {"message": {}}})")),
                  core::MissingFieldError);
  CHECK_THROWS_AS(
      model::extract_model_text(json::parse(R"({"output": {"message": {"content": [{}]}}})")),
      core::MissingFieldError);

  try {
    (void)model::extract_model_text(json::parse(R"({"output": {}})"));
    FAIL("expected MissingFieldError");
  } catch (const core::MissingFieldError& e) {
    CHECK(e.field() == "message");
  }
}

TEST_CASE("extract_model_text: empty content list raises InvalidValueError", "[converse]") {
  const json envelope = json::parse(R"({"output": {"message": {"content": []}}})");
  try {
    (void)model::extract_model_text(envelope);
    FAIL("expected InvalidValueError");
  } catch (const core::InvalidValueError& e) {
    CHECK(std::string(e.what()) == "No content blocks in model response");
  }
}

TEST_CASE("extract_model_text: wrong types raise InvalidValueError", "[converse]") {
  CHECK_THROWS_AS(model::extract_model_text(json::array()), core::InvalidValueError);
  CHECK_THROWS_AS(model::extract_model_text(json::parse(R"({"output": "text"})")),
                  core::InvalidValueError);
  CHECK_THROWS_AS(
      model::extract_model_text(json::parse(R"({"output": {"message": {"content": "x"}}})")),
      core::InvalidValueError);
  CHECK_THROWS_AS(model::extract_model_text(
                      json::parse(R"({"output": {"message": {"content": [{"text": 5}]}}})")),
                  core::InvalidValueError);
  CHECK_THROWS_AS(
      model::extract_model_text(json::parse(R"({"output": {"message": {"content": ["x"]}}})")),
      core::InvalidValueError);
}

// ── StubModelClient ─────────────────────────────────────────────────────────

TEST_CASE("StubModelClient replays its script then falls back", "[converse][stub]") {
  model::StubModelClient client("FALLBACK");
  client.push_text("one");
  client.push_envelope(json::object());

  const model::ConverseRequest request{"m", "p", 1, 0.0};
  CHECK(model::extract_model_text(client.converse(request)) == "one");
  CHECK(client.converse(request) == json::object());
  CHECK(model::extract_model_text(client.converse(request)) == "FALLBACK");
  CHECK(client.call_count() == 3);
  CHECK(client.requests().front().prompt == "p");
}
