#include "../common/assertions.hpp"
#include "../common/session_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "agent/orchestrator.hpp"
#include "tools/calculator/expression_calculator.hpp"
#include "tools/testing/scripted_model.hpp"
#include "tools/testing/scripted_search.hpp"

#include <atomic>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

using norma::tests::common::AssertContains;
using norma::tests::common::AssertNotContains;
using norma::tests::common::Fail;
using norma::tests::common::NumberFact;
using norma::tools::testing::MakeDocument;
using norma::tools::testing::ScriptedModel;
using norma::tools::testing::ScriptedSearch;
using norma::tools::testing::ScriptedSearchReply;

// Replan reply that repeats the fixture's slab-cover search verbatim.
constexpr const char* kSameSearchReplan = R"({"steps": [
  {"step_number": 1, "action": "Search slab cover again", "tool": "search",
   "parameters": {"keywords": ["protective cover", "slab"],
                  "expected_documents": ["SP 63.13330"]}}]})";

ScriptedSearchReply Found(std::string document, std::string locator,
                          norma::core::json::Value::Object facts) {
  ScriptedSearchReply reply;
  reply.documents.push_back(
      MakeDocument(std::move(document), "concrete structures", std::move(locator),
                   std::move(facts)));
  return reply;
}

struct Harness {
  ScriptedSearch search;
  norma::tools::calculator::ExpressionCalculator calculator;
  ScriptedModel planner;
  std::ostringstream log_stream;
  norma::core::logging::Logger logger{norma::core::logging::LogLevel::kDebug, log_stream};
  norma::agent::OrchestratorConfig config;

  explicit Harness(std::vector<ScriptedSearchReply> script) : search(std::move(script)) {
    config.session_id = "session-scenario";
  }

  norma::agent::SessionOutcome Run(std::string_view plan_json, bool with_planner,
                                   const std::atomic<bool>* cancel = nullptr) {
    norma::agent::Collaborators collaborators;
    collaborators.search = &search;
    collaborators.calculator = &calculator;
    if (with_planner) {
      collaborators.planner = &planner;
    }
    std::optional<norma::agent::PlanProposal> plan;
    if (!plan_json.empty()) {
      plan = norma::tests::common::RequirePlanProposal(plan_json);
    }
    norma::agent::Orchestrator orchestrator(config, collaborators, logger);
    norma::agent::SessionOutcome outcome;
    std::string error;
    if (!orchestrator.Run("fixture query", plan, cancel, outcome, error)) {
      Fail("session failed: " + error + "\n" + log_stream.str());
    }
    return outcome;
  }
};

} // namespace

int main() {
  using norma::agent::SessionStatus;
  using norma::core::errors::FailureKind;
  using norma::tests::common::kAxisDistancePlanJson;
  using norma::tests::common::kCoverLookupPlanJson;
  using norma::tests::common::ReadFileToString;

  {
    // Lookup answered from the first relevant document.
    norma::tests::common::ScopedTempDir temp_dir("norma-scenario-lookup");
    Harness harness({Found("SP 63.13330.2018", "clause 10.3.1", NumberFact("min_cover_mm", 20))});
    harness.config.output_dir = temp_dir.path();
    const auto outcome = harness.Run(kCoverLookupPlanJson, false);

    if (outcome.status != SessionStatus::kCompleted || !outcome.answer.has_value() ||
        outcome.review.has_value()) {
      Fail("lookup session must complete with an answer");
    }
    if (outcome.session_id != "session-scenario" || outcome.dispatches != 1U) {
      Fail("lookup must finish in one dispatch under the configured id");
    }
    if (outcome.answer->citations.size() != 1U ||
        outcome.answer->citations.front().document_name != "SP 63.13330.2018") {
      Fail("answer must cite exactly the retrieved document");
    }
    AssertContains(outcome.answer->text, "- min_cover_mm: 20");

    const std::string events = ReadFileToString(outcome.events_path);
    AssertContains(events, "\"type\":\"session_started\"");
    AssertContains(events, "\"plan_source\":\"plan_file\"");
    AssertContains(events, "\"type\":\"plan_installed\"");
    AssertContains(events, "\"type\":\"step_dispatched\"");
    AssertContains(events, "\"verdict\":\"FINALIZE\"");
    AssertContains(events, "\"type\":\"finalized\"");
    AssertNotContains(events, "\"type\":\"escalated\"");

    const std::string snapshot = ReadFileToString(outcome.session_state_path);
    AssertContains(snapshot, "\"status\":\"completed\"");
    AssertContains(snapshot, "\"min_cover_mm\":20");

    const std::string log = harness.log_stream.str();
    AssertContains(log, "session_id=\"session-scenario\" msg=\"session started\"");
    AssertContains(log, "msg=\"session answered\" citations=\"1\"");
  }

  {
    // Off-domain evidence is rejected, the search restricted, and only the
    // document the answer rests on is cited.
    ScriptedSearchReply off_domain;
    off_domain.documents.push_back(MakeDocument("Fire Safety Manual", "fire safety", "sec. 2",
                                                NumberFact("min_cover_mm", 50)));
    Harness harness(
        {off_domain, Found("SP 63.13330.2018", "clause 10.3.1", NumberFact("min_cover_mm", 20))});
    const auto outcome = harness.Run(kCoverLookupPlanJson, false);
    if (outcome.status != SessionStatus::kCompleted || !outcome.answer.has_value() ||
        outcome.dispatches != 2U) {
      Fail("restricted search must answer on the second dispatch: " + harness.log_stream.str());
    }
    if (outcome.answer->citations.size() != 1U ||
        outcome.answer->citations.front().document_name != "SP 63.13330.2018") {
      Fail("rejected document must not be cited");
    }
    AssertContains(outcome.answer->text, "- min_cover_mm: 20");
    AssertNotContains(outcome.answer->text, "Fire Safety Manual");
    AssertContains(harness.log_stream.str(), "strategy=\"REFINE_AND_RESTRICT_SEARCH\"");
  }

  {
    // Lookup plus calculation: the missing calculate step is added by replan.
    Harness harness({Found("SP 63.13330.2018", "clause 10.3.1", NumberFact("min_cover_mm", 20)),
                     Found("SP 63.13330.2018", "table 10.2", NumberFact("bar_diameter_mm", 12))});
    const auto outcome = harness.Run(kAxisDistancePlanJson, false);
    if (outcome.status != SessionStatus::kCompleted || !outcome.answer.has_value()) {
      Fail("calculation session must complete: " + harness.log_stream.str());
    }
    if (outcome.dispatches != 3U || outcome.answer->citations.size() != 2U) {
      Fail("two searches and one calculation expected, citing both search results");
    }
    AssertContains(outcome.answer->text,
                   "Calculated axis_distance_mm = 26 (min_cover_mm + bar_diameter_mm / 2)");
    AssertContains(harness.log_stream.str(), "strategy=\"FORM_CALCULATION_STEP\"");
    if (!outcome.events_path.empty() || !outcome.session_state_path.empty()) {
      Fail("no artifacts are written without an output directory");
    }
  }

  {
    // Same search over and over: one strategy switch, then human review.
    norma::tests::common::ScopedTempDir temp_dir("norma-scenario-loop");
    Harness harness({});
    harness.config.output_dir = temp_dir.path();
    harness.planner.Push(norma::tools::ModelStage::kReplan, kSameSearchReplan);
    harness.planner.Push(norma::tools::ModelStage::kReplan, kSameSearchReplan);
    const auto outcome = harness.Run(kCoverLookupPlanJson, true);

    if (outcome.status != SessionStatus::kHumanReview || !outcome.review.has_value() ||
        outcome.answer.has_value()) {
      Fail("looping session must end in human review");
    }
    if (outcome.review->failure != FailureKind::kLoopDetected || outcome.dispatches != 4U) {
      Fail("second loop must escalate on the fourth dispatch");
    }
    AssertContains(outcome.review->reason, "second loop in session");
    if (harness.planner.remaining(norma::tools::ModelStage::kReplan) != 0U) {
      Fail("both keyword replans must have been used");
    }

    const std::string events = ReadFileToString(outcome.events_path);
    AssertContains(events, "\"strategy\":\"CHANGE_KEYWORDS\"");
    AssertContains(events, "\"is_loop_detected\":\"true\"");
    AssertContains(events, "\"strategy\":\"REFINE_AND_RESTRICT_SEARCH\"");
    AssertContains(events, "\"type\":\"escalated\"");
    AssertContains(events, "\"failure\":\"loop_detected\"");

    AssertContains(ReadFileToString(outcome.packet_path), "# Escalation Packet");
    AssertContains(ReadFileToString(outcome.session_state_path), "\"frozen\":true");
  }

  {
    // Contradicting evidence: one REPLAN, then a second contradiction escalates.
    Harness harness({Found("SP 63.13330.2018", "clause 10.3.1", NumberFact("min_cover_mm", 20))});
    harness.search.SetFallback(
        Found("SP 63.13330.2012", "clause 8.3.2", NumberFact("min_cover_mm", 15)));
    const auto outcome = harness.Run(R"({
      "plan": {
        "goal": "Confirm the protective cover quoted by the designer",
        "required_facts": ["min_cover_mm"],
        "steps": [
          {"step_number": 1, "action": "Search slab cover", "tool": "search",
           "parameters": {"keywords": ["protective cover", "slab"],
                          "expected_documents": ["SP 63.13330"]}}
        ]
      },
      "initial_scratchpad": {
        "query_domain": "concrete structures",
        "priority_documents": ["SP 63.13330"],
        "min_cover_mm": 25
      }
    })",
                                     false);
    if (outcome.status != SessionStatus::kHumanReview || outcome.dispatches != 2U) {
      Fail("repeated contradiction must escalate after the second dispatch");
    }
    AssertContains(outcome.review->reason, "repeated contradiction between sources");
    AssertContains(harness.log_stream.str(), "strategy=\"REFINE_AND_RESTRICT_SEARCH\"");
  }

  {
    // Budget: the session never runs more than max_steps dispatches.
    Harness harness({});
    harness.config.judge.max_steps = 2;
    harness.planner.Push(norma::tools::ModelStage::kReplan, R"({"steps": [
      {"step_number": 1, "action": "Search cover table", "tool": "search",
       "parameters": {"keywords": ["cover table"]}}]})");
    const auto outcome = harness.Run(kCoverLookupPlanJson, true);
    if (outcome.status != SessionStatus::kHumanReview ||
        outcome.review->failure != FailureKind::kMaxStepsExceeded || outcome.dispatches != 2U) {
      Fail("budget must stop the session at exactly max_steps dispatches");
    }
    if (harness.search.requests().size() != 2U) {
      Fail("no search may run past the budget");
    }
  }

  {
    // Cancellation before the first round.
    Harness harness({Found("SP 63.13330.2018", "clause 10.3.1", NumberFact("min_cover_mm", 20))});
    std::atomic<bool> cancel{true};
    const auto outcome = harness.Run(kCoverLookupPlanJson, false, &cancel);
    if (outcome.status != SessionStatus::kHumanReview ||
        outcome.review->failure != FailureKind::kCancelled || outcome.dispatches != 0U ||
        !harness.search.requests().empty()) {
      Fail("cancelled session must escalate without dispatching");
    }
    AssertContains(outcome.review->reason, "session cancelled");
  }

  {
    // No plan file and no planner: escalated, not crashed.
    Harness harness({});
    const auto outcome = harness.Run("", false);
    if (outcome.status != SessionStatus::kHumanReview ||
        outcome.review->failure != FailureKind::kValidationError) {
      Fail("missing plan source must escalate");
    }
    AssertContains(outcome.review->reason, "no plan file and no planner model");
  }

  {
    // The planner model supplies the plan when no file is given.
    Harness harness({Found("SP 63.13330.2018", "clause 10.3.1", NumberFact("min_cover_mm", 20))});
    harness.planner.Push(norma::tools::ModelStage::kPlan,
                         std::string("```json\n") + std::string(kCoverLookupPlanJson) + "\n```");
    const auto outcome = harness.Run("", true);
    if (outcome.status != SessionStatus::kCompleted || outcome.dispatches != 1U) {
      Fail("model-planned lookup must complete");
    }
    if (harness.planner.requests().front().stage != norma::tools::ModelStage::kPlan) {
      Fail("planner must be asked for the initial plan first");
    }
  }

  {
    // A planner that never yields valid JSON escalates with a parse error.
    Harness harness({});
    for (int i = 0; i < 3; ++i) {
      harness.planner.Push(norma::tools::ModelStage::kPlan, "I cannot plan this.");
    }
    const auto outcome = harness.Run("", true);
    if (outcome.status != SessionStatus::kHumanReview ||
        outcome.review->failure != FailureKind::kParseError) {
      Fail("unparseable planner output must escalate as a parse error");
    }
    AssertContains(outcome.review->reason, "planning failed");
  }

  return 0;
}
