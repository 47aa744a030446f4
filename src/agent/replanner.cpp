#include "agent/replanner.hpp"

#include "agent/prompts.hpp"

#include <algorithm>
#include <utility>

namespace norma::agent {

namespace {

using core::errors::FailureKind;
using core::json::Value;

bool IsListed(const std::vector<std::string>& list, const std::string& name) {
  const std::string wanted = FoldText(name);
  return std::any_of(list.begin(), list.end(),
                     [&wanted](const std::string& item) { return FoldText(item) == wanted; });
}

std::vector<std::string> Without(const std::vector<std::string>& documents,
                                 const std::vector<std::string>& rejected) {
  std::vector<std::string> kept;
  for (const auto& document : documents) {
    if (!ListsDocument(rejected, document) && !IsListed(kept, document)) {
      kept.push_back(document);
    }
  }
  return kept;
}

std::string Join(const std::vector<std::string>& items) {
  std::string joined;
  for (const auto& item : items) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += item;
  }
  return joined;
}

void StripRejected(Step& step, const std::vector<std::string>& rejected) {
  if (step.tool != ToolKind::kSearch || rejected.empty()) {
    return;
  }
  step.parameters[kParamExpectedDocuments] =
      core::json::MakeStringArray(Without(ExpectedDocuments(step), rejected));
}

// Pending steps other than the one that was just executed.
std::vector<Step> RemainingSteps(const ExecutionState& state) {
  const int last_executed =
      state.History().empty() ? 0 : state.History().back().step_snapshot.number;
  std::vector<Step> rest;
  for (const auto& step : state.CurrentPlan().steps) {
    if (step.status == StepStatus::kPending && step.number != last_executed) {
      rest.push_back(step);
    }
  }
  return rest;
}

std::vector<std::string> LastSearchKeywords(const ExecutionState& state) {
  const auto& history = state.History();
  for (auto it = history.rbegin(); it != history.rend(); ++it) {
    if (it->step_snapshot.tool == ToolKind::kSearch) {
      return SearchKeywords(it->step_snapshot);
    }
  }
  for (const auto& step : state.CurrentPlan().steps) {
    if (step.tool == ToolKind::kSearch) {
      return SearchKeywords(step);
    }
  }
  return {};
}

void AppendAll(std::vector<Step>& steps, std::vector<Step> rest) {
  for (auto& step : rest) {
    steps.push_back(std::move(step));
  }
}

bool NextHypothesisStep(const Scratchpad& facts, const std::vector<std::string>& rejected,
                        Step& step, ScratchpadUpdate& update) {
  const Value* hypotheses = facts.Find(kFactSearchHypotheses);
  if (hypotheses == nullptr || !hypotheses->IsArray()) {
    return false;
  }
  const std::vector<std::string> used = facts.GetStringList(kFactUsedHypotheses);

  for (const auto& item : hypotheses->array_value) {
    const Value* keywords = core::json::Find(item, "keywords");
    if (keywords == nullptr) {
      continue;
    }
    const std::vector<std::string> words = core::json::StringItems(*keywords);
    if (words.empty()) {
      continue;
    }
    std::string id;
    if (const Value* text = core::json::Find(item, "hypothesis");
        text != nullptr && text->IsString() && !text->string_value.empty()) {
      id = text->string_value;
    } else {
      id = Join(words);
    }
    if (IsListed(used, id)) {
      continue;
    }

    std::vector<std::string> expected;
    if (const Value* documents = core::json::Find(item, "expected_documents");
        documents != nullptr) {
      expected = Without(core::json::StringItems(*documents), rejected);
    }
    step = MakeSearchStep(0, "Check hypothesis: " + id, words, expected);
    update.Append(kFactUsedHypotheses, core::json::MakeString(id));
    return true;
  }
  return false;
}

} // namespace

Replanner::Replanner(tools::ILanguageModel* model, ModelCallConfig config)
    : model_(model), config_(config) {}

bool Replanner::ProposeFromModel(const ExecutionState& state,
                                 const ReplanInstructions& instructions, std::vector<Step>& steps,
                                 ReplanOutcome& outcome, std::string& error) {
  std::vector<Step> parsed;
  const JsonValidator validate = [&parsed](const Value& json, std::string& why) {
    return ParseReplanStepsJson(json, parsed, why);
  };
  ModelCallResult call;
  outcome.used_model = true;
  if (!CallModelForJson(*model_, BuildReplanRequest(state, instructions), config_, validate, call,
                        error)) {
    outcome.failure = call.failure;
    return false;
  }
  steps = std::move(parsed);
  return true;
}

bool Replanner::ProposeSteps(const ExecutionState& state, const ReplanInstructions& instructions,
                             std::vector<Step>& steps, ScratchpadUpdate& update,
                             ReplanOutcome& outcome, std::string& error) {
  steps.clear();
  const Plan& plan = state.CurrentPlan();
  const Scratchpad& facts = state.Facts();
  const std::vector<std::string> rejected = facts.GetStringList(kFactRejectedSources);
  std::vector<Step> rest = RemainingSteps(state);
  for (auto& step : rest) {
    StripRejected(step, rejected);
  }

  switch (instructions.strategy) {
  case ReplanStrategy::kFormCalculationStep: {
    Step calculate;
    if (plan.requirements.calculation.has_value()) {
      const CalculationTemplate& calculation = *plan.requirements.calculation;
      calculate = MakeCalculateStep(0, "Calculate " + calculation.output_variable, calculation);
    } else if (model_ != nullptr) {
      std::vector<Step> proposed;
      if (!ProposeFromModel(state, instructions, proposed, outcome, error)) {
        return false;
      }
      const auto it = std::find_if(proposed.begin(), proposed.end(), [](const Step& step) {
        return step.tool == ToolKind::kCalculate;
      });
      if (it == proposed.end()) {
        outcome.failure = FailureKind::kValidationError;
        error = "model replan contains no calculate step";
        return false;
      }
      calculate = *it;
    } else {
      outcome.failure = FailureKind::kValidationError;
      error = "plan has no calculation template and no planner model is configured";
      return false;
    }
    steps.push_back(std::move(calculate));
    rest.erase(std::remove_if(rest.begin(), rest.end(),
                              [](const Step& step) { return step.tool == ToolKind::kCalculate; }),
               rest.end());
    AppendAll(steps, std::move(rest));
    return true;
  }

  case ReplanStrategy::kRefineAndRestrictSearch: {
    const std::vector<std::string> keywords = LastSearchKeywords(state);
    const std::vector<std::string> allowed =
        Without(facts.GetStringList(kFactPriorityDocuments), rejected);
    if (!keywords.empty() && !allowed.empty()) {
      Step refined = MakeSearchStep(0, "Search priority documents: " + Join(keywords), keywords,
                                    allowed);
      const std::string signature = StepSignature(refined);
      rest.erase(std::remove_if(rest.begin(), rest.end(),
                                [&signature](const Step& step) {
                                  return StepSignature(step) == signature;
                                }),
                 rest.end());
      steps.push_back(std::move(refined));
      AppendAll(steps, std::move(rest));
      return true;
    }
    // Nothing left to restrict to: look for new evidence instead.
    break;
  }

  case ReplanStrategy::kChangeKeywords:
  case ReplanStrategy::kFormNewHypothesis:
    break;
  }

  if (model_ != nullptr) {
    if (!ProposeFromModel(state, instructions, steps, outcome, error)) {
      return false;
    }
    for (auto& step : steps) {
      StripRejected(step, rejected);
    }
    return true;
  }

  Step hypothesis;
  if (!NextHypothesisStep(facts, rejected, hypothesis, update)) {
    outcome.failure = FailureKind::kValidationError;
    error = std::string("no unused search hypothesis left for ") + ToString(instructions.strategy);
    return false;
  }
  steps.push_back(std::move(hypothesis));
  AppendAll(steps, std::move(rest));
  return true;
}

bool Replanner::Apply(ExecutionState& state, const ReplanInstructions& instructions,
                      ReplanOutcome& outcome, std::string& error) {
  outcome = ReplanOutcome{};
  outcome.strategy = instructions.strategy;
  error.clear();

  if (!state.HasPlan()) {
    outcome.failure = FailureKind::kValidationError;
    error = "cannot replan without an installed plan";
    return false;
  }

  constexpr std::size_t kMaxAttempts = 2;
  std::string last_error;
  for (std::size_t attempt = 1; attempt <= kMaxAttempts; ++attempt) {
    outcome.attempts = attempt;
    outcome.failure = FailureKind::kNone;

    std::vector<Step> steps;
    ScratchpadUpdate update;
    if (!ProposeSteps(state, instructions, steps, update, outcome, last_error)) {
      if (outcome.failure != FailureKind::kValidationError) {
        error = last_error;
        return false;
      }
    } else {
      const std::size_t added = steps.size();
      if (state.ReplaceRemainingSteps(std::move(steps), instructions.strategy, last_error)) {
        // A hypothesis counts as used only once its steps are installed.
        if (!update.Empty() && !state.MergeScratchpad(update, last_error)) {
          outcome.failure = FailureKind::kInfrastructure;
          error = last_error;
          return false;
        }
        outcome.steps_added = added;
        return true;
      }
      outcome.failure = FailureKind::kValidationError;
    }

    std::string record_error;
    if (!state.RecordReplanFailure(record_error)) {
      outcome.failure = FailureKind::kInfrastructure;
      error = record_error;
      return false;
    }
  }

  outcome.failure = FailureKind::kValidationError;
  error = "replan failed validation twice: " + last_error;
  return false;
}

} // namespace norma::agent
