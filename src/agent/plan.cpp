#include "agent/plan.hpp"

#include "agent/scratchpad.hpp"

#include <algorithm>
#include <utility>

namespace norma::agent {

namespace {

using core::json::Value;

Value NormalizeValue(const Value& value) {
  switch (value.type) {
  case Value::Type::kString:
    return core::json::MakeString(FoldText(value.string_value));
  case Value::Type::kArray: {
    Value normalized = core::json::MakeArray();
    bool all_strings = true;
    for (const auto& item : value.array_value) {
      all_strings = all_strings && item.IsString();
      normalized.array_value.push_back(NormalizeValue(item));
    }
    // Keyword lists are sets for loop-detection purposes.
    if (all_strings) {
      std::sort(normalized.array_value.begin(), normalized.array_value.end(),
                [](const Value& a, const Value& b) { return a.string_value < b.string_value; });
      normalized.array_value.erase(
          std::unique(normalized.array_value.begin(), normalized.array_value.end(),
                      [](const Value& a, const Value& b) {
                        return a.string_value == b.string_value;
                      }),
          normalized.array_value.end());
    }
    return normalized;
  }
  case Value::Type::kObject: {
    Value normalized = core::json::MakeObject();
    for (const auto& [key, member] : value.object_value) {
      normalized.object_value[key] = NormalizeValue(member);
    }
    return normalized;
  }
  default:
    return value;
  }
}

bool ReadString(const Value& json, std::string_view key, std::string& out) {
  const Value* member = core::json::Find(json, key);
  if (member == nullptr || !member->IsString()) {
    return false;
  }
  out = member->string_value;
  return true;
}

std::vector<std::string> ReadStringList(const Value& parameters, std::string_view key) {
  const Value* member = core::json::Find(parameters, key);
  if (member == nullptr) {
    return {};
  }
  if (member->IsString()) {
    return {member->string_value};
  }
  return core::json::StringItems(*member);
}

// Maps the flat planner layout onto the `parameters` object.
void CopyFlatParameters(const Value& json, Parameters& parameters) {
  static const std::pair<const char*, const char*> kAliases[] = {
      {"semantic_keywords", kParamKeywords},
      {"keywords", kParamKeywords},
      {"expected_documents", kParamExpectedDocuments},
      {"expression", kParamExpression},
      {"formula", kParamExpression},
      {"output_variable", kParamOutputVariable},
      {"input_variables", kParamInputs},
      {"inputs", kParamInputs},
  };
  for (const auto& [flat_key, param_key] : kAliases) {
    const Value* member = core::json::Find(json, flat_key);
    if (member != nullptr && !member->IsNull() && parameters.count(param_key) == 0U) {
      parameters[param_key] = *member;
    }
  }
}

} // namespace

std::optional<std::size_t> FirstPendingIndex(const Plan& plan, std::size_t from) {
  for (std::size_t i = from; i < plan.steps.size(); ++i) {
    if (plan.steps[i].status == StepStatus::kPending) {
      return i;
    }
  }
  return std::nullopt;
}

bool HasPendingStep(const Plan& plan, ToolKind tool) {
  return std::any_of(plan.steps.begin(), plan.steps.end(), [tool](const Step& step) {
    return step.status == StepStatus::kPending && step.tool == tool;
  });
}

int NextStepNumber(const Plan& plan) {
  int highest = 0;
  for (const auto& step : plan.steps) {
    highest = std::max(highest, step.number);
  }
  return highest + 1;
}

bool ValidateStep(const Step& step, std::string& error) {
  const std::string label = "step " + std::to_string(step.number);
  if (step.number <= 0) {
    error = label + ": step number must be positive";
    return false;
  }
  if (step.action.empty()) {
    error = label + ": action cannot be empty";
    return false;
  }

  switch (step.tool) {
  case ToolKind::kSearch: {
    const Value parameters = core::json::MakeObject(step.parameters);
    const Value* keywords = core::json::Find(parameters, kParamKeywords);
    if (keywords == nullptr || !keywords->IsArray()) {
      error = label + ": search step requires a 'keywords' array";
      return false;
    }
    const auto items = core::json::StringItems(*keywords);
    const bool blank = std::any_of(items.begin(), items.end(), [](const std::string& item) {
      return FoldText(item).empty();
    });
    if (items.empty() || blank || items.size() != keywords->array_value.size()) {
      error = label + ": 'keywords' must be a non-empty array of strings";
      return false;
    }
    const Value* expected = core::json::Find(parameters, kParamExpectedDocuments);
    if (expected != nullptr && !expected->IsArray()) {
      error = label + ": 'expected_documents' must be an array";
      return false;
    }
    return true;
  }
  case ToolKind::kCalculate: {
    const Value parameters = core::json::MakeObject(step.parameters);
    std::string expression;
    if (!ReadString(parameters, kParamExpression, expression) || expression.empty()) {
      error = label + ": calculate step requires a non-empty 'expression'";
      return false;
    }
    const Value* inputs = core::json::Find(parameters, kParamInputs);
    if (inputs != nullptr && !inputs->IsObject()) {
      error = label + ": 'inputs' must be an object";
      return false;
    }
    return true;
  }
  case ToolKind::kOther:
    error = label + ": tool 'other' has no executable capability";
    return false;
  }

  error = label + ": unknown tool";
  return false;
}

bool ValidatePlan(const Plan& plan, std::string& error) {
  if (plan.goal.empty()) {
    error = "plan goal cannot be empty";
    return false;
  }
  if (plan.steps.empty()) {
    error = "plan must contain at least one step";
    return false;
  }

  int previous_number = 0;
  for (const auto& step : plan.steps) {
    if (step.number <= previous_number) {
      error = "step numbers must be unique and increasing (step " + std::to_string(step.number) +
              " follows " + std::to_string(previous_number) + ")";
      return false;
    }
    previous_number = step.number;
    if (step.status == StepStatus::kPending && !ValidateStep(step, error)) {
      return false;
    }
  }

  if (!FirstPendingIndex(plan).has_value()) {
    error = "plan has no pending step";
    return false;
  }

  if (plan.current_step_index.has_value()) {
    const std::size_t index = *plan.current_step_index;
    if (index >= plan.steps.size() || plan.steps[index].status != StepStatus::kPending) {
      error = "current_step_index must reference a pending step";
      return false;
    }
  }

  if (plan.requirements.calculation.has_value() &&
      plan.requirements.calculation->expression.empty()) {
    error = "calculation template requires a non-empty expression";
    return false;
  }

  return true;
}

std::string StepSignature(const Step& step) {
  const Value normalized = NormalizeValue(core::json::MakeObject(step.parameters));
  return std::string(ToString(step.tool)) + "|" + core::json::ToJson(normalized);
}

std::vector<std::string> SearchKeywords(const Step& step) {
  return ReadStringList(core::json::MakeObject(step.parameters), kParamKeywords);
}

std::vector<std::string> ExpectedDocuments(const Step& step) {
  return ReadStringList(core::json::MakeObject(step.parameters), kParamExpectedDocuments);
}

Step MakeSearchStep(int number, std::string action, const std::vector<std::string>& keywords,
                    const std::vector<std::string>& expected_documents) {
  Step step;
  step.number = number;
  step.action = std::move(action);
  step.tool = ToolKind::kSearch;
  step.parameters[kParamKeywords] = core::json::MakeStringArray(keywords);
  step.parameters[kParamExpectedDocuments] = core::json::MakeStringArray(expected_documents);
  return step;
}

Step MakeCalculateStep(int number, std::string action, const CalculationTemplate& calculation) {
  Step step;
  step.number = number;
  step.action = std::move(action);
  step.tool = ToolKind::kCalculate;
  step.parameters[kParamExpression] = core::json::MakeString(calculation.expression);
  step.parameters[kParamOutputVariable] = core::json::MakeString(calculation.output_variable);
  step.parameters[kParamInputs] = core::json::MakeObject(calculation.inputs);
  return step;
}

bool ParseCalculationJson(const Value& json, CalculationTemplate& calculation,
                          std::string& error) {
  calculation = CalculationTemplate{};
  if (!json.IsObject()) {
    error = "calculation must be an object";
    return false;
  }
  if (!ReadString(json, "expression", calculation.expression) &&
      !ReadString(json, "formula", calculation.expression)) {
    error = "calculation requires string field 'expression'";
    return false;
  }
  if (calculation.expression.empty()) {
    error = "calculation expression cannot be empty";
    return false;
  }
  std::string output_variable;
  if (ReadString(json, "output_variable", output_variable) && !output_variable.empty()) {
    calculation.output_variable = output_variable;
  }
  const Value* inputs = core::json::Find(json, "inputs");
  if (inputs == nullptr) {
    inputs = core::json::Find(json, "input_variables");
  }
  if (inputs != nullptr) {
    if (!inputs->IsObject()) {
      error = "calculation inputs must be an object";
      return false;
    }
    calculation.inputs = inputs->object_value;
  }
  return true;
}

bool ParseStepJson(const Value& json, Step& step, std::string& error) {
  step = Step{};
  if (!json.IsObject()) {
    error = "step must be an object";
    return false;
  }

  const Value* number = core::json::Find(json, "step_number");
  if (number == nullptr) {
    number = core::json::Find(json, "number");
  }
  if (number == nullptr || !number->IsNumber()) {
    error = "step requires numeric field 'step_number'";
    return false;
  }
  step.number = static_cast<int>(number->number_value);

  if (!ReadString(json, "action", step.action)) {
    error = "step " + std::to_string(step.number) + " requires string field 'action'";
    return false;
  }

  std::string tool_text;
  if (!ReadString(json, "tool", tool_text)) {
    error = "step " + std::to_string(step.number) + " requires string field 'tool'";
    return false;
  }
  if (!ParseToolKind(tool_text, step.tool)) {
    error = "step " + std::to_string(step.number) + " names unknown tool '" + tool_text + "'";
    return false;
  }

  const Value* parameters = core::json::Find(json, "parameters");
  if (parameters != nullptr) {
    if (!parameters->IsObject()) {
      error = "step " + std::to_string(step.number) + " 'parameters' must be an object";
      return false;
    }
    step.parameters = parameters->object_value;
  }
  CopyFlatParameters(json, step.parameters);

  std::string status_text;
  if (ReadString(json, "status", status_text) && status_text == ToString(StepStatus::kDone)) {
    step.status = StepStatus::kDone;
  }
  return true;
}

bool ParsePlanJson(const Value& json, Plan& plan, std::string& error) {
  plan = Plan{};
  if (!json.IsObject()) {
    error = "plan must be an object";
    return false;
  }
  if (!ReadString(json, "goal", plan.goal)) {
    error = "plan requires string field 'goal'";
    return false;
  }

  const Value* steps = core::json::Find(json, "steps");
  if (steps == nullptr || !steps->IsArray()) {
    error = "plan requires array field 'steps'";
    return false;
  }
  for (std::size_t i = 0; i < steps->array_value.size(); ++i) {
    Step step;
    if (!ParseStepJson(steps->array_value[i], step, error)) {
      error = "steps[" + std::to_string(i) + "]: " + error;
      return false;
    }
    plan.steps.push_back(std::move(step));
  }

  const Value* required = core::json::Find(json, "required_facts");
  if (required != nullptr) {
    if (!required->IsArray()) {
      error = "'required_facts' must be an array of strings";
      return false;
    }
    plan.requirements.required_facts = core::json::StringItems(*required);
  }

  const Value* requires_calculation = core::json::Find(json, "requires_calculation");
  if (requires_calculation != nullptr) {
    if (!requires_calculation->IsBool()) {
      error = "'requires_calculation' must be a boolean";
      return false;
    }
    plan.requirements.requires_calculation = requires_calculation->bool_value;
  }

  const Value* calculation = core::json::Find(json, "calculation");
  if (calculation != nullptr && !calculation->IsNull()) {
    CalculationTemplate parsed;
    if (!ParseCalculationJson(*calculation, parsed, error)) {
      return false;
    }
    plan.requirements.calculation = std::move(parsed);
  }

  plan.current_step_index = FirstPendingIndex(plan);
  return true;
}

Value ToJsonValue(const Step& step) {
  Value json = core::json::MakeObject();
  json.object_value["step_number"] = core::json::MakeNumber(step.number);
  json.object_value["action"] = core::json::MakeString(step.action);
  json.object_value["tool"] = core::json::MakeString(ToString(step.tool));
  json.object_value["parameters"] = core::json::MakeObject(step.parameters);
  json.object_value["status"] = core::json::MakeString(ToString(step.status));
  return json;
}

Value ToJsonValue(const Plan& plan) {
  Value json = core::json::MakeObject();
  json.object_value["goal"] = core::json::MakeString(plan.goal);
  json.object_value["revision"] = core::json::MakeNumber(plan.revision);
  json.object_value["required_facts"] =
      core::json::MakeStringArray(plan.requirements.required_facts);
  json.object_value["requires_calculation"] =
      core::json::MakeBool(plan.requirements.requires_calculation);
  if (plan.requirements.calculation.has_value()) {
    Value calculation = core::json::MakeObject();
    calculation.object_value["expression"] =
        core::json::MakeString(plan.requirements.calculation->expression);
    calculation.object_value["output_variable"] =
        core::json::MakeString(plan.requirements.calculation->output_variable);
    calculation.object_value["inputs"] =
        core::json::MakeObject(plan.requirements.calculation->inputs);
    json.object_value["calculation"] = std::move(calculation);
  }

  Value steps = core::json::MakeArray();
  for (const auto& step : plan.steps) {
    steps.array_value.push_back(ToJsonValue(step));
  }
  json.object_value["steps"] = std::move(steps);

  if (plan.current_step_index.has_value()) {
    json.object_value["current_step_index"] =
        core::json::MakeNumber(static_cast<double>(*plan.current_step_index));
  } else {
    json.object_value["current_step_index"] = core::json::MakeString("exhausted");
  }
  return json;
}

} // namespace norma::agent
