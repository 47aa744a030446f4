#include "../common/assertions.hpp"
#include "../common/session_fixtures.hpp"
#include "agent/replanner.hpp"
#include "tools/testing/scripted_model.hpp"

#include <string>
#include <utility>

namespace {

using norma::tests::common::AssertContains;
using norma::tests::common::Fail;

// Marks the step at the cursor done and records it in history, as the
// dispatcher and orchestrator would after a not_found search.
void ExecuteCurrent(norma::agent::ExecutionState& state) {
  const norma::agent::Step step = *state.CurrentStep();
  std::string error;
  if (!state.RecordDispatch(error) || !state.CompleteCurrentStep(error)) {
    Fail("failed to execute fixture step: " + error);
  }
  norma::agent::HistoryEntry entry;
  entry.step_snapshot = step;
  entry.result.status = norma::agent::ResultStatus::kNotFound;
  entry.decision.verdict = norma::agent::Verdict::kReplan;
  if (!state.AppendHistory(entry, error)) {
    Fail("failed to append history: " + error);
  }
}

void Seed(norma::agent::ExecutionState& state, const char* key, norma::core::json::Value value) {
  norma::agent::ScratchpadUpdate update;
  update.Set(key, std::move(value));
  std::string error;
  if (!state.MergeScratchpad(update, error)) {
    Fail("failed to seed scratchpad: " + error);
  }
}

} // namespace

int main() {
  using norma::agent::ExpectedDocuments;
  using norma::agent::ModelCallConfig;
  using norma::agent::Replanner;
  using norma::agent::ReplanOutcome;
  using norma::agent::ReplanStrategy;
  using norma::agent::SearchKeywords;
  using norma::agent::ToolKind;
  using norma::core::errors::FailureKind;
  namespace json = norma::core::json;

  {
    // FORM_CALCULATION_STEP injects the template after the done steps.
    auto state = norma::tests::common::RequireInstalledState(
        norma::tests::common::kAxisDistancePlanJson);
    ExecuteCurrent(state);
    ExecuteCurrent(state);
    Replanner replanner(nullptr, ModelCallConfig{});
    ReplanOutcome outcome;
    std::string error;
    if (!replanner.Apply(state, {ReplanStrategy::kFormCalculationStep, "add calculation"}, outcome,
                         error)) {
      Fail("calculation replan failed: " + error);
    }
    const auto& steps = state.CurrentPlan().steps;
    if (steps.size() != 3U || steps[2].tool != ToolKind::kCalculate || steps[2].number != 3) {
      Fail("calculate step must be appended as step 3");
    }
    if (steps[2].parameters.at(norma::agent::kParamExpression).string_value !=
        "min_cover_mm + bar_diameter_mm / 2") {
      Fail("calculate step must carry the template expression");
    }
    if (outcome.steps_added != 1U || outcome.used_model || state.CurrentPlan().revision != 1 ||
        state.CurrentStep()->number != 3) {
      Fail("calculation replan outcome mismatch");
    }
  }

  {
    // REFINE_AND_RESTRICT_SEARCH reuses the keywords against priority
    // documents that were not rejected.
    auto state = norma::tests::common::RequireInstalledState(
        norma::tests::common::kCoverLookupPlanJson);
    Seed(state, norma::agent::kFactPriorityDocuments,
         json::MakeStringArray({"SP 63.13330", "SP 70.13330"}));
    Seed(state, norma::agent::kFactRejectedSources, json::MakeStringArray({"sp 70.13330.2012"}));
    ExecuteCurrent(state);
    Replanner replanner(nullptr, ModelCallConfig{});
    ReplanOutcome outcome;
    std::string error;
    if (!replanner.Apply(state, {ReplanStrategy::kRefineAndRestrictSearch, "restrict"}, outcome,
                         error)) {
      Fail("refine replan failed: " + error);
    }
    const auto* step = state.CurrentStep();
    if (step == nullptr || step->number != 2 || SearchKeywords(*step).size() != 2U) {
      Fail("refined search must reuse the last keywords");
    }
    const auto expected = ExpectedDocuments(*step);
    if (expected.size() != 1U || expected.front() != "SP 63.13330") {
      Fail("refined search must drop rejected documents");
    }
    if (*state.LastStrategy() != ReplanStrategy::kRefineAndRestrictSearch) {
      Fail("refine strategy must be recorded");
    }
  }

  {
    // A hypothesis whose step fails validation stays unused.
    auto state = norma::tests::common::RequireInstalledState(
        norma::tests::common::kCoverLookupPlanJson);
    json::Value hypothesis = json::MakeObject();
    hypothesis.object_value["hypothesis"] = json::MakeString("blank wording");
    hypothesis.object_value["keywords"] = json::MakeStringArray({" "});
    Seed(state, norma::agent::kFactSearchHypotheses, json::MakeArray({hypothesis}));
    ExecuteCurrent(state);

    Replanner replanner(nullptr, ModelCallConfig{});
    ReplanOutcome outcome;
    std::string error;
    if (replanner.Apply(state, {ReplanStrategy::kChangeKeywords, "other words"}, outcome,
                        error)) {
      Fail("blank hypothesis keywords must not produce a valid plan");
    }
    AssertContains(error, "replan failed validation twice");
    AssertContains(error, "'keywords' must be a non-empty array of strings");
    if (outcome.attempts != 2U) {
      Fail("the second attempt must retry the same hypothesis");
    }
    if (state.Facts().Has(norma::agent::kFactUsedHypotheses)) {
      Fail("a hypothesis whose steps were rejected must not be marked used");
    }
  }

  {
    // Without a model, CHANGE_KEYWORDS walks the scratchpad hypotheses once.
    auto state = norma::tests::common::RequireInstalledState(
        norma::tests::common::kCoverLookupPlanJson);
    json::Value hypothesis = json::MakeObject();
    hypothesis.object_value["hypothesis"] = json::MakeString("cover table");
    hypothesis.object_value["keywords"] = json::MakeStringArray({"minimum cover table"});
    Seed(state, norma::agent::kFactSearchHypotheses, json::MakeArray({hypothesis}));
    ExecuteCurrent(state);

    Replanner replanner(nullptr, ModelCallConfig{});
    ReplanOutcome outcome;
    std::string error;
    if (!replanner.Apply(state, {ReplanStrategy::kChangeKeywords, "other words"}, outcome,
                         error)) {
      Fail("hypothesis replan failed: " + error);
    }
    if (SearchKeywords(*state.CurrentStep()).front() != "minimum cover table") {
      Fail("hypothesis keywords must drive the new search");
    }
    if (state.Facts().GetStringList(norma::agent::kFactUsedHypotheses).size() != 1U) {
      Fail("used hypothesis must be recorded");
    }

    ExecuteCurrent(state);
    if (replanner.Apply(state, {ReplanStrategy::kChangeKeywords, "other words"}, outcome,
                        error)) {
      Fail("replan without unused hypotheses must fail");
    }
    AssertContains(error, "replan failed validation twice");
    if (outcome.failure != FailureKind::kValidationError || outcome.attempts != 2U ||
        state.ReplanFailureCount() != 2U) {
      Fail("failed replan must be retried once and counted");
    }
  }

  {
    // Model replans are stripped of rejected sources.
    auto state = norma::tests::common::RequireInstalledState(
        norma::tests::common::kCoverLookupPlanJson);
    Seed(state, norma::agent::kFactRejectedSources, json::MakeStringArray({"SP 70.13330"}));
    ExecuteCurrent(state);

    norma::tools::testing::ScriptedModel model;
    model.Push(norma::tools::ModelStage::kReplan, R"(Here is the revised plan:
```json
{"steps": [{"step_number": 1, "action": "Search cover table", "tool": "search",
  "parameters": {"keywords": ["cover", "table 10.1"],
                 "expected_documents": ["SP 70.13330", "SP 63.13330"]}}]}
```)");
    Replanner replanner(&model, ModelCallConfig{});
    ReplanOutcome outcome;
    std::string error;
    if (!replanner.Apply(state, {ReplanStrategy::kChangeKeywords, "other words"}, outcome,
                         error)) {
      Fail("model replan failed: " + error);
    }
    const auto expected = ExpectedDocuments(*state.CurrentStep());
    if (!outcome.used_model || expected.size() != 1U || expected.front() != "SP 63.13330") {
      Fail("model replan must be used with rejected sources removed");
    }
    if (model.requests().size() != 1U ||
        model.requests().front().stage != norma::tools::ModelStage::kReplan) {
      Fail("replanner must ask the model exactly once");
    }
  }

  {
    // A model that never answers is not a validation failure.
    auto state = norma::tests::common::RequireInstalledState(
        norma::tests::common::kCoverLookupPlanJson);
    ExecuteCurrent(state);
    norma::tools::testing::ScriptedModel model;
    ModelCallConfig config;
    config.parse_max_attempts = 1;
    Replanner replanner(&model, config);
    ReplanOutcome outcome;
    std::string error;
    if (replanner.Apply(state, {ReplanStrategy::kFormNewHypothesis, "new idea"}, outcome, error)) {
      Fail("replan with an unreachable model must fail");
    }
    if (outcome.failure != FailureKind::kToolError || state.ReplanFailureCount() != 0U) {
      Fail("model outage must surface as a tool error without retry");
    }
  }

  return 0;
}
