#include "injguard/validation/verdict_resolver.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <string>

using namespace injguard;
using Catch::Matchers::StartsWith;

// ── resolve_verdict ─────────────────────────────────────────────────────────

TEST_CASE("resolve_verdict passes an accepted verdict through unchanged", "[verdict_resolver]") {
  const domain::Verdict model_said{true, "Ordinary weather question"};
  const auto verdict =
      validation::resolve_verdict(validation::ValidationOutcome::ok(model_said));
  CHECK(verdict == model_said);
  CHECK_FALSE(validation::is_fail_closed_reasoning(verdict.reasoning));
}

TEST_CASE("resolve_verdict keeps a model-produced unsafe verdict verbatim",
          "[verdict_resolver]") {
  const domain::Verdict model_said{false, "Asks to ignore previous instructions"};
  const auto verdict =
      validation::resolve_verdict(validation::ValidationOutcome::ok(model_said));
  CHECK(verdict == model_said);
}

TEST_CASE("resolve_verdict fails closed on every rejection code", "[verdict_resolver]") {
  for (const auto code :
       {validation::RejectionCode::kInvalidJson, validation::RejectionCode::kNotAnObject,
        validation::RejectionCode::kWrongKeys, validation::RejectionCode::kWrongType,
        validation::RejectionCode::kExtraContent}) {
    const auto verdict = validation::resolve_verdict(
        validation::ValidationOutcome::err(validation::Rejection{code, "bad output"}));
    CHECK_FALSE(verdict.safe);
    CHECK(verdict.reasoning == "Deterministic validation failure: bad output");
    CHECK(validation::is_fail_closed_reasoning(verdict.reasoning));
  }
}

TEST_CASE("resolve_verdict composes with the validator", "[verdict_resolver]") {
  const auto verdict =
      validation::resolve_verdict(validation::validate_model_response("I think it is safe."));
  CHECK_FALSE(verdict.safe);
  CHECK_THAT(verdict.reasoning, StartsWith("Deterministic validation failure: Invalid JSON: "));
}

// ── Verdict JSON ────────────────────────────────────────────────────────────

TEST_CASE("to_json(Verdict) emits exactly safe and reasoning", "[verdict]") {
  const auto json = domain::to_json(domain::Verdict{true, "fine"});
  REQUIRE(json.is_object());
  CHECK(json.size() == 2);
  CHECK(json.at("safe").get<bool>());
  CHECK(json.at("reasoning").get<std::string>() == "fine");
}
