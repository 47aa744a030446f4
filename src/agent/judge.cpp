#include "agent/judge.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string_view>
#include <vector>

namespace norma::agent {

namespace {

using core::errors::FailureKind;
using core::json::Value;

bool Contradicts(const Value& existing, const Value& incoming) {
  if (existing.IsNumber() && incoming.IsNumber()) {
    const double scale = std::max({1.0, std::fabs(existing.number_value),
                                   std::fabs(incoming.number_value)});
    return std::fabs(existing.number_value - incoming.number_value) > 1e-6 * scale;
  }
  if (existing.IsString() && incoming.IsString()) {
    return FoldText(existing.string_value) != FoldText(incoming.string_value);
  }
  if (existing.type != incoming.type) {
    return true;
  }
  return !core::json::Equals(existing, incoming);
}

bool CalculationSucceeded(const ExecutionState& state, const Step& step,
                          const StepResult& result) {
  if (step.tool == ToolKind::kCalculate && result.status == ResultStatus::kSuccess) {
    return true;
  }
  for (const auto& entry : state.History()) {
    if (entry.step_snapshot.tool == ToolKind::kCalculate &&
        entry.result.status == ResultStatus::kSuccess) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> MissingFacts(const GoalRequirements& requirements,
                                      const Scratchpad& facts) {
  std::vector<std::string> missing;
  for (const auto& key : requirements.required_facts) {
    if (!facts.Has(key)) {
      missing.push_back(key);
    }
  }
  return missing;
}

ReplanStrategy StrategyAfterLoop(const ExecutionState& state) {
  const std::optional<ReplanStrategy> last = state.LastStrategy();
  for (const ReplanStrategy candidate :
       {ReplanStrategy::kRefineAndRestrictSearch, ReplanStrategy::kChangeKeywords,
        ReplanStrategy::kFormNewHypothesis, ReplanStrategy::kFormCalculationStep}) {
    if (!last.has_value() || candidate != *last) {
      return candidate;
    }
  }
  return ReplanStrategy::kFormNewHypothesis;
}

void SetReplan(Decision& decision, ReplanStrategy strategy, std::string details) {
  decision.verdict = Verdict::kReplan;
  decision.replan_instructions = ReplanInstructions{strategy, std::move(details)};
}

void SetHumanReview(Decision& decision, FailureKind failure, std::string reason) {
  decision.verdict = Verdict::kHumanReview;
  decision.failure = failure;
  decision.replan_instructions.reset();
  decision.human_review_reason = std::move(reason);
}

void AppendReasoning(Decision& decision, const std::string& text) {
  if (!decision.reasoning.empty()) {
    decision.reasoning += " ";
  }
  decision.reasoning += text;
}

bool ValidateInput(const JudgeInput& input, std::string& error) {
  if (input.state == nullptr || input.step == nullptr || input.result == nullptr) {
    error = "judge input requires state, step and result";
    return false;
  }
  if (!input.state->HasPlan()) {
    error = "judge input state has no plan";
    return false;
  }
  return true;
}

} // namespace

double ConsistencyReport::Score() const {
  if (compared == 0U) {
    return 1.0;
  }
  return 1.0 - static_cast<double>(contradictions) / static_cast<double>(compared);
}

bool ValidateJudgeConfig(const JudgeConfig& config, std::string& error) {
  if (!std::isfinite(config.relevance_threshold) || config.relevance_threshold < 0.0 ||
      config.relevance_threshold > 1.0) {
    error = "relevance_threshold must be in [0,1]";
    return false;
  }
  if (!std::isfinite(config.consistency_threshold) || config.consistency_threshold < 0.0 ||
      config.consistency_threshold > 1.0) {
    error = "consistency_threshold must be in [0,1]";
    return false;
  }
  if (config.loop_window < 2U) {
    error = "loop_window must be at least 2";
    return false;
  }
  if (config.max_steps == 0U) {
    error = "max_steps must be greater than 0";
    return false;
  }
  return true;
}

double ScoreSourceRelevance(const Scratchpad& facts, const Step& step, const StepResult& result) {
  if (step.tool == ToolKind::kCalculate) {
    return result.status == ResultStatus::kSuccess ? 1.0 : 0.0;
  }
  if (!result.source.has_value() || result.source->document_name.empty()) {
    return 0.0;
  }

  const SourceRef& source = *result.source;
  if (ListsDocument(facts.GetStringList(kFactRejectedSources), source.document_name)) {
    return 0.0;
  }
  if (ListsDocument(facts.GetStringList(kFactPriorityDocuments), source.document_name)) {
    return 1.0;
  }

  const std::string query_domain = FoldText(facts.GetString(kFactQueryDomain));
  const std::string source_domain = FoldText(source.domain);
  if (query_domain.empty() || source_domain.empty()) {
    return 0.6;
  }
  if (query_domain == source_domain || query_domain.find(source_domain) != std::string::npos ||
      source_domain.find(query_domain) != std::string::npos) {
    return 0.8;
  }
  return 0.2;
}

ConsistencyReport CheckConsistency(const Scratchpad& facts, const Value::Object& incoming) {
  ConsistencyReport report;
  for (const auto& [key, value] : incoming) {
    if (IsReservedFactKey(key)) {
      continue;
    }
    const Value* existing = facts.Find(key);
    if (existing == nullptr || existing->IsNull()) {
      continue;
    }
    ++report.compared;
    if (Contradicts(*existing, value)) {
      ++report.contradictions;
      if (!report.details.empty()) {
        report.details += "; ";
      }
      report.details += "'" + key + "': scratchpad has " + core::json::ToJson(*existing) +
                        ", new result has " + core::json::ToJson(value);
    }
  }
  return report;
}

bool DetectLoop(const ExecutionState& state, const Step& step, std::size_t window) {
  if (window < 2U) {
    return false;
  }
  const auto& history = state.History();
  if (history.size() + 1U < window) {
    return false;
  }
  const std::string signature = StepSignature(step);
  for (std::size_t i = history.size() - (window - 1U); i < history.size(); ++i) {
    if (StepSignature(history[i].step_snapshot) != signature) {
      return false;
    }
  }
  return true;
}

bool EvaluateStep(const JudgeConfig& config, const JudgeInput& input, Decision& decision,
                  std::string& error) {
  decision = Decision{};
  error.clear();

  if (!ValidateJudgeConfig(config, error) || !ValidateInput(input, error)) {
    return false;
  }

  const ExecutionState& state = *input.state;
  const Step& step = *input.step;
  const StepResult& result = *input.result;
  const Plan& plan = state.CurrentPlan();
  const std::size_t dispatches = state.DispatchCount();

  // Priority 1: the ceiling was already passed; nothing else matters.
  if (dispatches > config.max_steps) {
    SetHumanReview(decision, FailureKind::kMaxStepsExceeded,
                   "step budget exceeded (dispatches=" + std::to_string(dispatches) +
                       ", max_steps=" + std::to_string(config.max_steps) + ")");
    decision.reasoning = *decision.human_review_reason;
    return true;
  }

  // Priority 2: the same (tool, parameters) filled the whole window.
  if (DetectLoop(state, step, config.loop_window)) {
    decision.is_loop_detected = true;
    decision.failure = FailureKind::kLoopDetected;
    decision.scores.source_relevance = 0.0;
    const std::string what = "step signature repeated " + std::to_string(config.loop_window) +
                             " times in a row";
    if (state.LoopCount() >= 1U) {
      SetHumanReview(decision, FailureKind::kLoopDetected,
                     "second loop in session: " + what);
      decision.reasoning = *decision.human_review_reason;
      return true;
    }
    const ReplanStrategy strategy = StrategyAfterLoop(state);
    SetReplan(decision, strategy,
              what + "; switching strategy away from " +
                  (state.LastStrategy().has_value() ? ToString(*state.LastStrategy())
                                                    : "the initial plan"));
    decision.reasoning = "loop detected: " + what + ".";
    if (dispatches >= config.max_steps) {
      SetHumanReview(decision, FailureKind::kMaxStepsExceeded,
                     "step budget reached while recovering from a loop");
    }
    return true;
  }

  // Priority 3: nothing usable came back.
  if (result.status == ResultStatus::kNotFound || result.status == ResultStatus::kError) {
    decision.scores.source_relevance = 0.0;
    if (result.status == ResultStatus::kError) {
      decision.failure = FailureKind::kToolError;
      AppendReasoning(decision, "step " + std::to_string(step.number) +
                                    " failed: " + result.error_message + ".");
    } else {
      AppendReasoning(decision, "step " + std::to_string(step.number) + " found nothing.");
    }
    if (step.tool == ToolKind::kCalculate) {
      SetReplan(decision, ReplanStrategy::kFormCalculationStep,
                "rebuild the calculation step from the gathered inputs");
    } else {
      SetReplan(decision, ReplanStrategy::kChangeKeywords,
                "search again with different keywords");
    }
  }

  Value::Object incoming;
  if (result.structured_output.has_value()) {
    incoming = *result.structured_output;
  }

  if (decision.verdict != Verdict::kReplan) {
    // Priority 4: relevance of where the evidence came from.
    decision.scores.source_relevance = ScoreSourceRelevance(state.Facts(), step, result);
    ConsistencyReport consistency = CheckConsistency(state.Facts(), incoming);
    decision.scores.context_consistency = consistency.Score();

    std::optional<std::string> contradiction;
    if (consistency.contradictions > 0U) {
      contradiction = consistency.details;
    }

    if (input.assessment != nullptr) {
      decision.scores.source_relevance = input.assessment->source_relevance;
      decision.scores.context_consistency = input.assessment->context_consistency;
      if (!contradiction.has_value() && input.assessment->contradiction_details.has_value()) {
        contradiction = input.assessment->contradiction_details;
      }
      if (!input.assessment->reasoning.empty()) {
        AppendReasoning(decision, input.assessment->reasoning);
      }
      if (input.assessment->suggested_verdict.has_value()) {
        AppendReasoning(decision, std::string("assessor suggested ") +
                                      ToString(*input.assessment->suggested_verdict) + ".");
      }
    }
    if (!contradiction.has_value() &&
        decision.scores.context_consistency < config.consistency_threshold) {
      contradiction = "consistency score below threshold";
    }

    if (decision.scores.source_relevance < config.relevance_threshold) {
      ScratchpadUpdate update;
      if (result.source.has_value() && !result.source->document_name.empty()) {
        update.Append(kFactRejectedSources, core::json::MakeString(result.source->document_name));
        decision.scratchpad_update = std::move(update);
      }
      AppendReasoning(decision, "source relevance below threshold; rejecting source.");
      SetReplan(decision, ReplanStrategy::kRefineAndRestrictSearch,
                "restrict search to priority documents and avoid rejected sources");
    } else if (contradiction.has_value()) {
      // Priority 5: new evidence disagrees with what is already known.
      decision.contradiction_details = contradiction;
      if (state.ContradictionCount() >= 1U) {
        SetHumanReview(decision, FailureKind::kNone,
                       "repeated contradiction between sources: " + *contradiction);
        AppendReasoning(decision, "contradiction seen again; a human must reconcile sources.");
        return true;
      }
      AppendReasoning(decision, "contradiction with scratchpad: " + *contradiction + ".");
      SetReplan(decision, ReplanStrategy::kRefineAndRestrictSearch,
                "verify conflicting values against priority documents: " + *contradiction);
    } else {
      // Accepted: the facts go into the scratchpad before routing. Reserved
      // keys are owned by the judge and replanner, never by tool output.
      decision.evidence_accepted = true;
      ScratchpadUpdate update;
      for (const auto& [key, value] : incoming) {
        if (!IsReservedFactKey(key)) {
          update.Set(key, value);
        }
      }
      if (!update.Empty()) {
        decision.scratchpad_update = std::move(update);
      }

      // Priority 6: goal completion against the prospective scratchpad.
      Scratchpad prospective = state.Facts();
      if (decision.scratchpad_update.has_value()) {
        std::string apply_error;
        if (!prospective.Apply(*decision.scratchpad_update, apply_error)) {
          error = "judge produced an invalid scratchpad update: " + apply_error;
          return false;
        }
      }

      const GoalRequirements& requirements = plan.requirements;
      const std::vector<std::string> missing = MissingFacts(requirements, prospective);
      const bool pending = FirstPendingIndex(plan).has_value();
      bool data_complete = missing.empty();
      if (requirements.required_facts.empty()) {
        // Without declared facts the plan itself is the checklist.
        data_complete = !pending || (requirements.requires_calculation &&
                                     !HasPendingStep(plan, ToolKind::kSearch));
      }
      const bool calculation_done =
          !requirements.requires_calculation || CalculationSucceeded(state, step, result);

      if (data_complete && calculation_done) {
        decision.verdict = Verdict::kFinalize;
        AppendReasoning(decision, "all required facts are present; finalizing.");
      } else if (data_complete) {
        if (HasPendingStep(plan, ToolKind::kCalculate)) {
          decision.verdict = Verdict::kContinue;
          AppendReasoning(decision, "data gathered; calculation step pending.");
        } else {
          AppendReasoning(decision, "data gathered but the plan has no calculation step.");
          SetReplan(decision, ReplanStrategy::kFormCalculationStep,
                    "add the calculation the goal requires");
        }
      } else if (pending) {
        // Priority 7.
        decision.verdict = Verdict::kContinue;
        AppendReasoning(decision, "evidence accepted; continuing with the next step.");
      } else {
        std::string list;
        for (const auto& key : missing) {
          list += (list.empty() ? "" : ", ") + key;
        }
        AppendReasoning(decision, "plan exhausted with facts missing: " + list + ".");
        SetReplan(decision, ReplanStrategy::kFormNewHypothesis,
                  "find the missing facts: " + list);
      }
    }
  }

  // Budget guard: another dispatch would pass the ceiling.
  if (dispatches >= config.max_steps && decision.verdict != Verdict::kFinalize) {
    SetHumanReview(decision, FailureKind::kMaxStepsExceeded,
                   "step budget exhausted (dispatches=" + std::to_string(dispatches) +
                       ", max_steps=" + std::to_string(config.max_steps) +
                       ") before the goal was met");
  }
  return true;
}

} // namespace norma::agent
