#pragma once

#include "agent/plan.hpp"
#include "agent/scratchpad.hpp"
#include "agent/types.hpp"
#include "core/errors/failure_kind.hpp"
#include "core/json_dom.hpp"
#include "tools/tool_interfaces.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace norma::agent {

struct ModelCallConfig {
  std::size_t parse_max_attempts = 3;
  std::chrono::milliseconds timeout{30000};
};

// Planner output: the plan plus the facts it seeds the scratchpad with
// (`query_domain`, `priority_documents`, `search_hypotheses`...).
struct PlanProposal {
  Plan plan;
  ScratchpadUpdate initial_scratchpad;
  std::string context_analysis;
};

// Facts the analyzer extracted from one retrieved document.
struct DocumentAnalysis {
  ResultStatus status = ResultStatus::kNotFound;
  core::json::Value::Object facts;
  std::string summary;
};

// Model-side judgment of the latest result. Only the scores and the
// contradiction text are used; the verdict stays with the judge.
struct ModelAssessment {
  double source_relevance = 0.0;
  double context_consistency = 1.0;
  std::string reasoning;
  std::optional<std::string> contradiction_details;
  // Advisory only; the judge pipeline owns the verdict.
  std::optional<Verdict> suggested_verdict;
};

struct FinalDraft {
  std::string text;
  std::vector<std::string> limitations;
};

struct ModelCallResult {
  std::size_t attempts = 0;
  core::errors::FailureKind failure = core::errors::FailureKind::kNone;
};

using JsonValidator = std::function<bool(const core::json::Value&, std::string&)>;

// Pulls the JSON payload out of free-form model text: the body of the first
// fenced block when there is one, otherwise the span from the first `{` or
// `[` to the last matching closer.
bool ExtractJsonPayload(std::string_view text, std::string& payload, std::string& error);

// Calls the model until `validate` accepts the parsed payload or
// `parse_max_attempts` is used up. Each retry appends the previous error to
// the user prompt. On failure `result.failure` is kParseError when the model
// answered but never validly, kToolError when every call itself failed.
bool CallModelForJson(tools::ILanguageModel& model, tools::ModelRequest request,
                      const ModelCallConfig& config, const JsonValidator& validate,
                      ModelCallResult& result, std::string& error);

bool ParsePlanProposalJson(const core::json::Value& json, PlanProposal& proposal,
                           std::string& error);

// Replacement steps for a replan: `{"steps": [...]}` or `{"plan": {"steps": [...]}}`.
bool ParseReplanStepsJson(const core::json::Value& json, std::vector<Step>& steps,
                          std::string& error);

bool ParseDocumentAnalysisJson(const core::json::Value& json, DocumentAnalysis& analysis,
                               std::string& error);
bool ParseModelAssessmentJson(const core::json::Value& json, ModelAssessment& assessment,
                              std::string& error);
bool ParseFinalDraftJson(const core::json::Value& json, FinalDraft& draft, std::string& error);

} // namespace norma::agent
