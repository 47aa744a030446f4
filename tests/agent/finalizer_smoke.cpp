#include "../common/assertions.hpp"
#include "../common/session_fixtures.hpp"
#include "agent/finalizer.hpp"
#include "tools/testing/scripted_model.hpp"

#include <string>
#include <utility>

namespace {

using norma::tests::common::AssertContains;
using norma::tests::common::Fail;

void AddEntry(norma::agent::ExecutionState& state, int number,
              norma::agent::ResultStatus status, std::string document, std::string locator,
              bool accepted = true) {
  norma::agent::HistoryEntry entry;
  entry.step_snapshot = norma::agent::MakeSearchStep(number, "Search", {"cover"}, {});
  entry.result.status = status;
  const bool usable = status == norma::agent::ResultStatus::kSuccess ||
                      status == norma::agent::ResultStatus::kPartial;
  entry.decision.evidence_accepted = accepted && usable;
  if (!document.empty()) {
    entry.result.source =
        norma::agent::SourceRef{std::move(document), std::move(locator), "concrete structures"};
  }
  std::string error;
  if (!state.AppendHistory(entry, error)) {
    Fail("AppendHistory failed: " + error);
  }
}

// Judged lookup session: one fact established from two results that share a
// source, a failed search and an off-domain result the judge rejected.
norma::agent::ExecutionState PrepareJudgedLookup() {
  auto state = norma::tests::common::RequireInstalledState(
      norma::tests::common::kCoverLookupPlanJson, "minimum cover for a slab");
  std::string error;
  norma::agent::ScratchpadUpdate update;
  update.Set("min_cover_mm", norma::core::json::MakeNumber(20));
  if (!state.MergeScratchpad(update, error)) {
    Fail("MergeScratchpad failed: " + error);
  }
  AddEntry(state, 1, norma::agent::ResultStatus::kNotFound, "", "");
  AddEntry(state, 2, norma::agent::ResultStatus::kSuccess, "SP 63.13330.2018", "clause 10.3.1");
  AddEntry(state, 3, norma::agent::ResultStatus::kPartial, "SP 63.13330.2018", "clause 10.3.1");
  AddEntry(state, 4, norma::agent::ResultStatus::kSuccess, "Fire Safety Manual", "sec. 2",
           false);
  AddEntry(state, 5, norma::agent::ResultStatus::kPartial, "Design handbook", "ch. 4");
  if (!state.SetStatus(norma::agent::SessionStatus::kJudging, error)) {
    Fail("SetStatus failed: " + error);
  }
  return state;
}

} // namespace

int main() {
  using norma::agent::FinalAnswer;
  using norma::agent::Finalizer;
  using norma::agent::FinalizeOutcome;
  using norma::agent::ModelCallConfig;
  using norma::agent::SessionStatus;

  {
    auto state = PrepareJudgedLookup();
    const auto citations = norma::agent::CollectCitations(state);
    if (citations.size() != 2U || citations[0].document_name != "SP 63.13330.2018" ||
        citations[1].document_name != "Design handbook") {
      Fail("citations must be the distinct accepted sources in order");
    }

    Finalizer finalizer(nullptr, ModelCallConfig{});
    FinalAnswer answer;
    FinalizeOutcome outcome;
    std::string error;
    if (!finalizer.Finalize(state, answer, outcome, error)) {
      Fail("Finalize failed: " + error);
    }
    if (state.Status() != SessionStatus::kCompleted || !state.Answer().has_value()) {
      Fail("finalize must complete the session and store the answer");
    }
    if (outcome.used_model || !answer.limitations.empty()) {
      Fail("deterministic answer with all facts must have no limitations");
    }
    AssertContains(answer.text, "Find the minimum protective concrete cover for a slab");
    AssertContains(answer.text, "- min_cover_mm: 20");
    AssertContains(answer.text, "Sources: SP 63.13330.2018 (clause 10.3.1); Design handbook");

    if (finalizer.Finalize(state, answer, outcome, error)) {
      Fail("a completed session must not finalize twice");
    }
  }

  {
    // Model draft is used and missing facts become limitations.
    auto state = norma::tests::common::RequireInstalledState(
        norma::tests::common::kAxisDistancePlanJson);
    std::string error;
    norma::agent::ScratchpadUpdate update;
    update.Set("min_cover_mm", norma::core::json::MakeNumber(20));
    if (!state.MergeScratchpad(update, error) ||
        !state.SetStatus(SessionStatus::kJudging, error)) {
      Fail("failed to prepare state: " + error);
    }
    AddEntry(state, 1, norma::agent::ResultStatus::kSuccess, "SP 63.13330.2018", "10.3");

    norma::tools::testing::ScriptedModel model;
    model.Push(norma::tools::ModelStage::kFinalDraft,
               R"({"final_response": {"analysis": "Cover is 20 mm per SP 63.13330.",
                   "limitations": ["bar diameter assumed"]}})");
    Finalizer finalizer(&model, ModelCallConfig{});
    FinalAnswer answer;
    FinalizeOutcome outcome;
    if (!finalizer.Finalize(state, answer, outcome, error)) {
      Fail("Finalize failed: " + error);
    }
    if (!outcome.used_model || answer.text != "Cover is 20 mm per SP 63.13330.") {
      Fail("validated model draft must become the answer text");
    }
    if (answer.limitations.size() != 2U ||
        answer.limitations[0] != "required fact 'bar_diameter_mm' was not established" ||
        answer.limitations[1] != "bar diameter assumed") {
      Fail("limitations must list missing facts before model limitations");
    }
    if (answer.citations.size() != 1U) {
      Fail("citations must come from history only");
    }
  }

  {
    // Invalid model drafts fall back to the composed text.
    auto state = PrepareJudgedLookup();
    norma::tools::testing::ScriptedModel model;
    model.Push(norma::tools::ModelStage::kFinalDraft, R"({"final_response": {}})");
    ModelCallConfig config;
    config.parse_max_attempts = 1;
    Finalizer finalizer(&model, config);
    FinalAnswer answer;
    FinalizeOutcome outcome;
    std::string error;
    if (!finalizer.Finalize(state, answer, outcome, error)) {
      Fail("Finalize must survive a bad draft: " + error);
    }
    if (outcome.used_model) {
      Fail("rejected draft must not be used");
    }
    AssertContains(outcome.model_error, "final draft requires non-empty 'analysis' or 'text'");
    AssertContains(answer.text, "- min_cover_mm: 20");
  }

  return 0;
}
