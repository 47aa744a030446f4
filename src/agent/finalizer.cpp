#include "agent/finalizer.hpp"

#include "agent/prompts.hpp"

#include <algorithm>
#include <utility>

namespace norma::agent {

namespace {

std::string FactText(const core::json::Value& value) {
  if (value.IsString()) {
    return value.string_value;
  }
  return core::json::ToJson(value);
}

} // namespace

std::vector<SourceRef> CollectCitations(const ExecutionState& state) {
  std::vector<SourceRef> citations;
  for (const auto& entry : state.History()) {
    const StepResult& result = entry.result;
    if (!entry.decision.evidence_accepted) {
      continue;
    }
    if (result.status != ResultStatus::kSuccess && result.status != ResultStatus::kPartial) {
      continue;
    }
    if (!result.source.has_value()) {
      continue;
    }
    if (std::find(citations.begin(), citations.end(), *result.source) == citations.end()) {
      citations.push_back(*result.source);
    }
  }
  return citations;
}

std::vector<std::string> UnresolvedFacts(const ExecutionState& state) {
  std::vector<std::string> missing;
  if (!state.HasPlan()) {
    return missing;
  }
  for (const auto& key : state.CurrentPlan().requirements.required_facts) {
    if (!state.Facts().Has(key)) {
      missing.push_back(key);
    }
  }
  return missing;
}

std::string ComposeAnswerText(const ExecutionState& state,
                              const std::vector<SourceRef>& citations) {
  const Plan& plan = state.CurrentPlan();
  std::string text = plan.goal.empty() ? state.Query() : plan.goal;
  text += "\n";

  const Scratchpad& facts = state.Facts();
  if (!plan.requirements.required_facts.empty()) {
    for (const auto& key : plan.requirements.required_facts) {
      if (const core::json::Value* value = facts.Find(key); value != nullptr && facts.Has(key)) {
        text += "- " + key + ": " + FactText(*value) + "\n";
      }
    }
  } else {
    for (const auto& [key, value] : facts.Entries()) {
      if (!IsReservedFactKey(key)) {
        text += "- " + key + ": " + FactText(value) + "\n";
      }
    }
  }
  if (plan.requirements.calculation.has_value()) {
    const std::string& output = plan.requirements.calculation->output_variable;
    if (const core::json::Value* value = facts.Find(output); value != nullptr) {
      text += "Calculated " + output + " = " + FactText(*value) + " (" +
              plan.requirements.calculation->expression + ")\n";
    }
  }

  if (!citations.empty()) {
    text += "Sources:";
    for (std::size_t i = 0; i < citations.size(); ++i) {
      text += (i == 0U ? " " : "; ") + citations[i].document_name;
      if (!citations[i].locator.empty()) {
        text += " (" + citations[i].locator + ")";
      }
    }
    text += "\n";
  }
  return text;
}

Finalizer::Finalizer(tools::ILanguageModel* model, ModelCallConfig config)
    : model_(model), config_(config) {}

bool Finalizer::Finalize(ExecutionState& state, FinalAnswer& answer, FinalizeOutcome& outcome,
                         std::string& error) {
  outcome = FinalizeOutcome{};
  if (!state.HasPlan()) {
    error = "cannot finalize a session without a plan";
    return false;
  }
  if (!state.SetStatus(SessionStatus::kFinalizing, error)) {
    return false;
  }

  FinalAnswer built;
  built.citations = CollectCitations(state);
  const std::vector<std::string> missing = UnresolvedFacts(state);
  for (const auto& key : missing) {
    built.limitations.push_back("required fact '" + key + "' was not established");
  }

  if (model_ != nullptr) {
    FinalDraft draft;
    const JsonValidator validate = [&draft](const core::json::Value& json, std::string& why) {
      return ParseFinalDraftJson(json, draft, why);
    };
    ModelCallResult call;
    if (CallModelForJson(*model_, BuildFinalDraftRequest(state, missing), config_, validate, call,
                         outcome.model_error)) {
      outcome.used_model = true;
      built.text = std::move(draft.text);
      for (auto& limitation : draft.limitations) {
        built.limitations.push_back(std::move(limitation));
      }
    }
  }
  if (!outcome.used_model) {
    built.text = ComposeAnswerText(state, built.citations);
  }

  if (!state.SetFinalAnswer(built, error) || !state.SetStatus(SessionStatus::kCompleted, error)) {
    return false;
  }
  answer = std::move(built);
  return true;
}

} // namespace norma::agent
