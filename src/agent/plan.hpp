#pragma once

#include "agent/types.hpp"
#include "core/json_dom.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace norma::agent {

using Parameters = core::json::Value::Object;

// Parameter keys understood by the dispatcher.
inline constexpr const char* kParamKeywords = "keywords";
inline constexpr const char* kParamExpectedDocuments = "expected_documents";
inline constexpr const char* kParamExpression = "expression";
inline constexpr const char* kParamOutputVariable = "output_variable";
inline constexpr const char* kParamInputs = "inputs";

// One unit of work. `number` is unique and increasing within a plan; steps
// marked kDone are never edited again.
struct Step {
  int number = 0;
  std::string action;
  ToolKind tool = ToolKind::kOther;
  Parameters parameters;
  StepStatus status = StepStatus::kPending;
};

// Formula the goal needs evaluated once its inputs are gathered. Inputs are
// literal numbers or references (`{step_2.cover_mm}`, `{scratchpad.d_bar}`).
struct CalculationTemplate {
  std::string expression;
  std::string output_variable = "result";
  Parameters inputs;
};

// What the planner says must hold before the session may finalize.
struct GoalRequirements {
  std::vector<std::string> required_facts;
  bool requires_calculation = false;
  std::optional<CalculationTemplate> calculation;
};

// Ordered task list with a cursor. `current_step_index` is either the index
// of a pending step or empty ("exhausted"); `revision` counts replans.
struct Plan {
  std::string goal;
  GoalRequirements requirements;
  std::vector<Step> steps;
  std::optional<std::size_t> current_step_index;
  int revision = 0;
};

// Index of the first pending step at or after `from`, or nullopt.
std::optional<std::size_t> FirstPendingIndex(const Plan& plan, std::size_t from = 0);

bool HasPendingStep(const Plan& plan, ToolKind tool);

int NextStepNumber(const Plan& plan);

// Structural checks applied to every plan before it is installed:
// non-empty goal, at least one pending step, unique increasing step numbers,
// executable tools only, and tool-specific required parameters.
bool ValidatePlan(const Plan& plan, std::string& error);
bool ValidateStep(const Step& step, std::string& error);

// Canonical `(tool, normalized parameters)` text used for loop detection.
// Case, surrounding whitespace and keyword order do not change the signature.
std::string StepSignature(const Step& step);

std::vector<std::string> SearchKeywords(const Step& step);
std::vector<std::string> ExpectedDocuments(const Step& step);

Step MakeSearchStep(int number, std::string action, const std::vector<std::string>& keywords,
                    const std::vector<std::string>& expected_documents);
Step MakeCalculateStep(int number, std::string action, const CalculationTemplate& calculation);

// JSON boundary. Steps accept either a `parameters` object or the flat
// field layout (`semantic_keywords`, `expected_documents`, `expression`,
// `output_variable`, `input_variables`) emitted by older planner prompts.
bool ParseStepJson(const core::json::Value& json, Step& step, std::string& error);
bool ParseCalculationJson(const core::json::Value& json, CalculationTemplate& calculation,
                          std::string& error);
bool ParsePlanJson(const core::json::Value& json, Plan& plan, std::string& error);

core::json::Value ToJsonValue(const Step& step);
core::json::Value ToJsonValue(const Plan& plan);

} // namespace norma::agent
