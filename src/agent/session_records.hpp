#pragma once

#include "agent/plan.hpp"
#include "agent/scratchpad.hpp"
#include "agent/types.hpp"
#include "core/errors/failure_kind.hpp"
#include "core/json_dom.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace norma::agent {

// Where a piece of evidence came from. `domain` is the regulatory area the
// search backend assigns to the document (used for relevance scoring).
struct SourceRef {
  std::string document_name;
  std::string locator;
  std::string domain;
};

bool operator==(const SourceRef& a, const SourceRef& b);
bool operator<(const SourceRef& a, const SourceRef& b);

// Outcome of exactly one dispatched step. Never edited after creation.
struct StepResult {
  ResultStatus status = ResultStatus::kError;
  std::optional<SourceRef> source;
  std::optional<core::json::Value::Object> structured_output;
  std::string summary;
  std::string error_message;
  std::size_t attempts = 0;
};

struct DecisionScores {
  double source_relevance = 0.0;
  double context_consistency = 1.0;
};

struct ReplanInstructions {
  ReplanStrategy strategy = ReplanStrategy::kFormNewHypothesis;
  std::string details;
};

// Judge output. `failure` names the guard that forced the verdict (loop,
// budget, tool failure...) or kNone for an ordinary decision.
// `evidence_accepted` is set only when the result's facts passed relevance
// and consistency; only such results are cited.
struct Decision {
  Verdict verdict = Verdict::kHumanReview;
  std::string reasoning;
  DecisionScores scores;
  std::optional<std::string> contradiction_details;
  bool is_loop_detected = false;
  bool evidence_accepted = false;
  std::optional<ReplanInstructions> replan_instructions;
  std::optional<ScratchpadUpdate> scratchpad_update;
  std::optional<std::string> human_review_reason;
  core::errors::FailureKind failure = core::errors::FailureKind::kNone;
};

// Append-only audit record: the step as it was executed, what came back,
// and what the judge made of it.
struct HistoryEntry {
  Step step_snapshot;
  StepResult result;
  Decision decision;
  int plan_revision = 0;
};

struct FinalAnswer {
  std::string text;
  std::vector<SourceRef> citations;
  std::vector<std::string> limitations;
};

struct HumanReviewRequest {
  std::string reason;
  core::errors::FailureKind failure = core::errors::FailureKind::kNone;
  std::optional<Decision> triggering_decision;
  std::string state_snapshot_json;
};

core::json::Value ToJsonValue(const SourceRef& source);
core::json::Value ToJsonValue(const StepResult& result);
core::json::Value ToJsonValue(const Decision& decision);
core::json::Value ToJsonValue(const HistoryEntry& entry);
core::json::Value ToJsonValue(const FinalAnswer& answer);

} // namespace norma::agent
