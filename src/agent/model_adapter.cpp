#include "agent/model_adapter.hpp"

#include <cmath>
#include <utility>

namespace norma::agent {

namespace {

using core::json::Value;

bool ReadScore(const Value& object, std::string_view key, double& out, std::string& error) {
  const Value* field = core::json::Find(object, key);
  if (field == nullptr) {
    error = "assessment requires numeric field '" + std::string(key) + "'";
    return false;
  }
  if (!field->IsNumber() || !std::isfinite(field->number_value) || field->number_value < 0.0 ||
      field->number_value > 1.0) {
    error = "'" + std::string(key) + "' must be a number in [0,1]";
    return false;
  }
  out = field->number_value;
  return true;
}

std::string TextOf(const Value* field) {
  if (field == nullptr) {
    return "";
  }
  if (field->IsString()) {
    return field->string_value;
  }
  if (field->IsArray()) {
    std::string joined;
    for (const auto& item : core::json::StringItems(*field)) {
      if (!joined.empty()) {
        joined += "\n";
      }
      joined += item;
    }
    return joined;
  }
  return "";
}

std::vector<std::string> ListOf(const Value* field) {
  if (field == nullptr) {
    return {};
  }
  if (field->IsString()) {
    if (field->string_value.empty()) {
      return {};
    }
    return {field->string_value};
  }
  return core::json::StringItems(*field);
}

} // namespace

bool ExtractJsonPayload(std::string_view text, std::string& payload, std::string& error) {
  const std::size_t fence = text.find("```");
  if (fence != std::string_view::npos) {
    const std::size_t body_start = text.find('\n', fence);
    if (body_start != std::string_view::npos) {
      const std::size_t close = text.find("```", body_start + 1U);
      if (close != std::string_view::npos) {
        payload = std::string(text.substr(body_start + 1U, close - body_start - 1U));
        return true;
      }
    }
    error = "unterminated fenced block in model response";
    return false;
  }

  const std::size_t start = text.find_first_of("{[");
  if (start == std::string_view::npos) {
    error = "model response contains no JSON object";
    return false;
  }
  const char closer = text[start] == '{' ? '}' : ']';
  const std::size_t end = text.find_last_of(closer);
  if (end == std::string_view::npos || end < start) {
    error = "model response JSON is not closed";
    return false;
  }
  payload = std::string(text.substr(start, end - start + 1U));
  return true;
}

bool CallModelForJson(tools::ILanguageModel& model, tools::ModelRequest request,
                      const ModelCallConfig& config, const JsonValidator& validate,
                      ModelCallResult& result, std::string& error) {
  result = ModelCallResult{};
  error.clear();

  const std::size_t max_attempts = config.parse_max_attempts == 0U ? 1U : config.parse_max_attempts;
  const std::string base_prompt = request.user_prompt;
  request.timeout = config.timeout;

  bool any_response = false;
  std::string last_error;
  for (std::size_t attempt = 1; attempt <= max_attempts; ++attempt) {
    result.attempts = attempt;
    if (!last_error.empty()) {
      request.user_prompt = base_prompt +
                            "\n\nYour previous reply was rejected: " + last_error +
                            "\nReply again with a single JSON object that fixes this.";
    }

    std::string response;
    std::string call_error;
    if (!model.Complete(request, response, call_error)) {
      last_error = "model call failed: " + call_error;
      continue;
    }
    any_response = true;

    std::string payload;
    Value json;
    if (!ExtractJsonPayload(response, payload, call_error) ||
        !core::json::Parse(payload, json, call_error)) {
      last_error = "invalid JSON: " + call_error;
      continue;
    }
    if (!validate(json, call_error)) {
      last_error = "schema violation: " + call_error;
      continue;
    }
    return true;
  }

  result.failure = any_response ? core::errors::FailureKind::kParseError
                                : core::errors::FailureKind::kToolError;
  error = std::string(tools::ToString(request.stage)) + " model output rejected after " +
          std::to_string(result.attempts) + " attempt(s): " + last_error;
  return false;
}

bool ParsePlanProposalJson(const Value& json, PlanProposal& proposal, std::string& error) {
  proposal = PlanProposal{};
  if (!json.IsObject()) {
    error = "planner output must be an object";
    return false;
  }

  const Value* plan_json = core::json::Find(json, "plan");
  if (!ParsePlanJson(plan_json != nullptr ? *plan_json : json, proposal.plan, error)) {
    return false;
  }
  if (!ValidatePlan(proposal.plan, error)) {
    return false;
  }

  if (const Value* initial = core::json::Find(json, "initial_scratchpad");
      initial != nullptr && !initial->IsNull()) {
    if (!initial->IsObject()) {
      error = "'initial_scratchpad' must be an object";
      return false;
    }
    for (const auto& [key, value] : initial->object_value) {
      proposal.initial_scratchpad.Set(key, value);
    }
  }

  proposal.context_analysis = TextOf(core::json::Find(json, "context_analysis"));
  return true;
}

bool ParseReplanStepsJson(const Value& json, std::vector<Step>& steps, std::string& error) {
  steps.clear();
  if (!json.IsObject()) {
    error = "replan output must be an object";
    return false;
  }

  const Value* list = core::json::Find(json, "steps");
  if (list == nullptr) {
    if (const Value* plan = core::json::Find(json, "plan"); plan != nullptr) {
      list = core::json::Find(*plan, "steps");
    }
  }
  if (list == nullptr || !list->IsArray() || list->array_value.empty()) {
    error = "replan output requires a non-empty 'steps' array";
    return false;
  }

  for (std::size_t i = 0; i < list->array_value.size(); ++i) {
    Step step;
    if (!ParseStepJson(list->array_value[i], step, error)) {
      error = "steps[" + std::to_string(i) + "]: " + error;
      steps.clear();
      return false;
    }
    // Numbers are reassigned when the steps are installed.
    if (step.number <= 0) {
      step.number = static_cast<int>(i) + 1;
    }
    if (!ValidateStep(step, error)) {
      error = "steps[" + std::to_string(i) + "]: " + error;
      steps.clear();
      return false;
    }
    step.status = StepStatus::kPending;
    steps.push_back(std::move(step));
  }
  return true;
}

bool ParseDocumentAnalysisJson(const Value& json, DocumentAnalysis& analysis, std::string& error) {
  analysis = DocumentAnalysis{};
  if (!json.IsObject()) {
    error = "analysis output must be an object";
    return false;
  }

  const Value* status = core::json::Find(json, "status");
  if (status == nullptr || !status->IsString() ||
      !ParseResultStatus(status->string_value, analysis.status) ||
      analysis.status == ResultStatus::kError) {
    error = "analysis requires 'status' of success|partial|not_found";
    return false;
  }

  if (const Value* facts = core::json::Find(json, "facts"); facts != nullptr && !facts->IsNull()) {
    if (!facts->IsObject()) {
      error = "'facts' must be an object";
      return false;
    }
    analysis.facts = facts->object_value;
  }
  if (analysis.status != ResultStatus::kNotFound && analysis.facts.empty()) {
    error = "analysis with status '" + std::string(ToString(analysis.status)) +
            "' must carry at least one fact";
    return false;
  }

  analysis.summary = TextOf(core::json::Find(json, "summary"));
  return true;
}

bool ParseModelAssessmentJson(const Value& json, ModelAssessment& assessment, std::string& error) {
  assessment = ModelAssessment{};
  if (!json.IsObject()) {
    error = "assessment output must be an object";
    return false;
  }

  const Value* nested = core::json::Find(json, "state_analysis");
  const Value& scores = nested != nullptr ? *nested : json;
  if (!ReadScore(scores, "source_relevance_score", assessment.source_relevance, error) ||
      !ReadScore(scores, "consistency_with_context_score", assessment.context_consistency,
                 error)) {
    return false;
  }

  const std::string contradiction = TextOf(core::json::Find(scores, "contradiction_details"));
  if (!contradiction.empty()) {
    assessment.contradiction_details = contradiction;
  }
  if (const Value* decision = core::json::Find(json, "decision"); decision != nullptr) {
    const std::string verdict_text = TextOf(core::json::Find(*decision, "verdict"));
    if (!verdict_text.empty()) {
      Verdict verdict = Verdict::kContinue;
      if (!ParseVerdict(verdict_text, verdict)) {
        error = "unknown verdict '" + verdict_text + "'";
        return false;
      }
      assessment.suggested_verdict = verdict;
    }
  }
  assessment.reasoning = TextOf(core::json::Find(json, "reasoning"));
  return true;
}

bool ParseFinalDraftJson(const Value& json, FinalDraft& draft, std::string& error) {
  draft = FinalDraft{};
  if (!json.IsObject()) {
    error = "final draft must be an object";
    return false;
  }

  const Value* response = core::json::Find(json, "final_response");
  const Value& body = response != nullptr ? *response : json;

  draft.text = TextOf(core::json::Find(body, "analysis"));
  if (draft.text.empty()) {
    draft.text = TextOf(core::json::Find(body, "text"));
  }
  if (draft.text.empty()) {
    error = "final draft requires non-empty 'analysis' or 'text'";
    return false;
  }

  const std::string recommendations = TextOf(core::json::Find(body, "recommendations"));
  if (!recommendations.empty()) {
    draft.text += "\n\nRecommendations: " + recommendations;
  }
  draft.limitations = ListOf(core::json::Find(body, "limitations"));
  return true;
}

} // namespace norma::agent
