#include "agent/dispatcher.hpp"

#include "agent/prompts.hpp"

#include <cctype>
#include <cstdlib>
#include <optional>
#include <utility>
#include <vector>

namespace norma::agent {

namespace {

using core::json::Value;
using Clock = std::chrono::steady_clock;

bool NumberOf(const Value& value, double& number) {
  if (value.IsNumber()) {
    number = value.number_value;
    return true;
  }
  if (value.IsString() && !value.string_value.empty()) {
    const char* begin = value.string_value.c_str();
    char* end = nullptr;
    number = std::strtod(begin, &end);
    while (end != nullptr && std::isspace(static_cast<unsigned char>(*end)) != 0) {
      ++end;
    }
    return end != begin && end != nullptr && *end == '\0';
  }
  return false;
}

bool IsIdentifier(const std::string& name) {
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
    return false;
  }
  for (const char c : name) {
    if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
      return false;
    }
  }
  return true;
}

// `path` is a key of `root` or a dotted walk through nested objects.
const Value* FindPath(const Value::Object& root, const std::string& path) {
  const auto direct = root.find(path);
  if (direct != root.end()) {
    return &direct->second;
  }
  const Value::Object* level = &root;
  const Value* current = nullptr;
  std::size_t start = 0;
  while (level != nullptr) {
    const std::size_t dot = path.find('.', start);
    const auto it = level->find(path.substr(start, dot == std::string::npos ? std::string::npos
                                                                             : dot - start));
    if (it == level->end()) {
      return nullptr;
    }
    current = &it->second;
    if (dot == std::string::npos) {
      return current;
    }
    level = current->IsObject() ? &current->object_value : nullptr;
    start = dot + 1;
  }
  return nullptr;
}

bool ResolveReference(const ExecutionState& state, const std::string& reference, double& value,
                      std::string& error) {
  const std::string scratchpad_prefix = "scratchpad.";
  if (reference.rfind(scratchpad_prefix, 0) == 0) {
    const std::optional<Value> fact = state.Get(reference);
    if (!fact.has_value() || !NumberOf(*fact, value)) {
      error = "reference {" + reference + "} does not resolve to a number";
      return false;
    }
    return true;
  }

  if (reference.rfind("step_", 0) == 0) {
    const std::size_t dot = reference.find('.');
    if (dot == std::string::npos || dot == 5U) {
      error = "reference {" + reference + "} must name a fact of the step";
      return false;
    }
    const int number = std::atoi(reference.substr(5, dot - 5).c_str());
    std::string fact = reference.substr(dot + 1);
    const std::string output_prefix = "structured_output.";
    if (fact.rfind(output_prefix, 0) == 0) {
      fact = fact.substr(output_prefix.size());
    }

    const auto& history = state.History();
    for (auto it = history.rbegin(); it != history.rend(); ++it) {
      if (it->step_snapshot.number != number || !it->result.structured_output.has_value()) {
        continue;
      }
      const Value* found = FindPath(*it->result.structured_output, fact);
      if (found != nullptr && NumberOf(*found, value)) {
        return true;
      }
    }
    error = "reference {" + reference + "} has no numeric value in step " +
            std::to_string(number) + " output";
    return false;
  }

  error = "unsupported reference {" + reference + "}";
  return false;
}

} // namespace

bool ResolveCalculationVariables(const ExecutionState& state, const Step& step,
                                 std::map<std::string, double>& variables, std::string& error) {
  variables.clear();
  for (const auto& [key, fact] : state.Facts().Entries()) {
    double number = 0.0;
    if (IsIdentifier(key) && fact.IsNumber() && NumberOf(fact, number)) {
      variables[key] = number;
    }
  }

  const auto inputs = step.parameters.find(kParamInputs);
  if (inputs == step.parameters.end() || inputs->second.IsNull()) {
    return true;
  }
  if (!inputs->second.IsObject()) {
    error = "calculate inputs must be an object";
    return false;
  }

  for (const auto& [name, raw] : inputs->second.object_value) {
    if (!IsIdentifier(name)) {
      error = "calculate input name '" + name + "' is not an identifier";
      return false;
    }
    double number = 0.0;
    if (raw.IsString() && raw.string_value.size() > 2U && raw.string_value.front() == '{' &&
        raw.string_value.back() == '}') {
      const std::string reference = raw.string_value.substr(1, raw.string_value.size() - 2);
      if (!ResolveReference(state, reference, number, error)) {
        return false;
      }
    } else if (!NumberOf(raw, number)) {
      error = "calculate input '" + name + "' is neither a number nor a reference";
      return false;
    }
    variables[name] = number;
  }
  return true;
}

bool SubstituteReferences(const ExecutionState& state, const std::string& expression,
                          std::string& resolved, std::string& error) {
  resolved.clear();
  std::size_t pos = 0;
  while (pos < expression.size()) {
    const std::size_t open = expression.find('{', pos);
    if (open == std::string::npos) {
      resolved += expression.substr(pos);
      break;
    }
    const std::size_t close = expression.find('}', open);
    if (close == std::string::npos) {
      error = "unterminated reference in expression";
      return false;
    }
    resolved += expression.substr(pos, open - pos);
    double number = 0.0;
    if (!ResolveReference(state, expression.substr(open + 1, close - open - 1), number, error)) {
      return false;
    }
    resolved += "(" + core::json::FormatNumber(number) + ")";
    pos = close + 1;
  }
  return true;
}

Dispatcher::Dispatcher(tools::ISearchTool* search, tools::ICalculationTool* calculator,
                       tools::ILanguageModel* analyzer, DispatcherConfig config,
                       ModelCallConfig analyzer_config)
    : search_(search), calculator_(calculator), analyzer_(analyzer), config_(config),
      analyzer_config_(analyzer_config) {}

bool Dispatcher::DispatchCurrent(ExecutionState& state, Step& executed, StepResult& result,
                                 std::string& error) {
  const Step* current = state.CurrentStep();
  if (current == nullptr) {
    error = "plan is exhausted; no step to dispatch";
    return false;
  }
  executed = *current;

  if (!state.RecordDispatch(error)) {
    return false;
  }

  switch (executed.tool) {
  case ToolKind::kSearch:
    result = RunSearch(state, executed);
    break;
  case ToolKind::kCalculate:
    result = RunCalculation(state, executed);
    break;
  case ToolKind::kOther:
    result = StepResult{};
    result.status = ResultStatus::kError;
    result.error_message = "unsupported tool 'other'";
    break;
  }

  if (result.status != ResultStatus::kError) {
    return state.CompleteCurrentStep(error);
  }
  return true;
}

StepResult Dispatcher::RunSearch(const ExecutionState& state, const Step& step) {
  StepResult result;
  if (search_ == nullptr) {
    result.error_message = "no search tool configured";
    return result;
  }

  tools::SearchRequest request;
  request.keywords = SearchKeywords(step);
  request.expected_documents = ExpectedDocuments(step);
  request.max_results = config_.max_search_results;
  request.timeout = config_.tool_timeout;

  const std::size_t max_attempts = config_.tool_max_attempts == 0U ? 1U : config_.tool_max_attempts;
  std::vector<tools::DocumentRef> documents;
  bool ok = false;
  std::string last_error;
  for (std::size_t attempt = 1; attempt <= max_attempts && !ok; ++attempt) {
    result.attempts = attempt;
    documents.clear();
    const auto started = Clock::now();
    std::string call_error;
    const bool returned = search_->Search(request, documents, call_error);
    const auto elapsed = Clock::now() - started;
    if (!returned) {
      last_error = "search failed: " + call_error;
    } else if (elapsed > config_.tool_timeout) {
      last_error = "search exceeded timeout of " + std::to_string(config_.tool_timeout.count()) +
                   "ms";
    } else {
      ok = true;
    }
  }
  if (!ok) {
    result.status = ResultStatus::kError;
    result.error_message = last_error;
    return result;
  }

  const std::vector<std::string> rejected = state.Facts().GetStringList(kFactRejectedSources);
  const tools::DocumentRef* best = nullptr;
  for (const auto& document : documents) {
    if (!ListsDocument(rejected, document.document_name)) {
      best = &document;
      break;
    }
  }
  if (best == nullptr) {
    result.status = ResultStatus::kNotFound;
    result.summary = documents.empty() ? "no document matched the keywords"
                                       : "only rejected sources matched the keywords";
    return result;
  }

  result.source = SourceRef{best->document_name, best->locator, best->domain};

  if (analyzer_ != nullptr) {
    DocumentAnalysis analysis;
    const JsonValidator validate = [&analysis](const Value& json, std::string& why) {
      return ParseDocumentAnalysisJson(json, analysis, why);
    };
    ModelCallResult call;
    std::string analysis_error;
    if (!CallModelForJson(*analyzer_, BuildAnalysisRequest(step, *best), analyzer_config_,
                          validate, call, analysis_error)) {
      result.status = ResultStatus::kError;
      result.error_message = analysis_error;
      return result;
    }
    result.status = analysis.status;
    result.summary = analysis.summary;
    if (!analysis.facts.empty()) {
      result.structured_output = std::move(analysis.facts);
    }
    return result;
  }

  result.summary = best->excerpt;
  if (best->facts.empty()) {
    result.status = ResultStatus::kPartial;
  } else {
    result.status = ResultStatus::kSuccess;
    result.structured_output = best->facts;
  }
  return result;
}

StepResult Dispatcher::RunCalculation(const ExecutionState& state, const Step& step) {
  StepResult result;
  if (calculator_ == nullptr) {
    result.error_message = "no calculation tool configured";
    return result;
  }

  tools::CalculationRequest request;
  const auto expression = step.parameters.find(kParamExpression);
  if (expression == step.parameters.end() || !expression->second.IsString()) {
    result.error_message = "calculate step has no expression";
    return result;
  }
  if (const auto output = step.parameters.find(kParamOutputVariable);
      output != step.parameters.end() && output->second.IsString() &&
      !output->second.string_value.empty()) {
    request.output_variable = output->second.string_value;
  }

  std::string error;
  if (!SubstituteReferences(state, expression->second.string_value, request.expression, error) ||
      !ResolveCalculationVariables(state, step, request.variables, error)) {
    result.error_message = error;
    return result;
  }

  const std::size_t max_attempts = config_.tool_max_attempts == 0U ? 1U : config_.tool_max_attempts;
  tools::CalculationResult calculation;
  for (std::size_t attempt = 1; attempt <= max_attempts; ++attempt) {
    result.attempts = attempt;
    const auto started = Clock::now();
    std::string call_error;
    const bool returned = calculator_->Calculate(request, calculation, call_error);
    if (!returned) {
      result.error_message = call_error;
      continue;
    }
    if (Clock::now() - started > config_.tool_timeout) {
      result.error_message = "calculation exceeded timeout of " +
                             std::to_string(config_.tool_timeout.count()) + "ms";
      continue;
    }

    result.status = ResultStatus::kSuccess;
    result.error_message.clear();
    Value::Object output;
    output[calculation.output_variable] = core::json::MakeNumber(calculation.value);
    result.structured_output = std::move(output);
    result.summary = calculation.output_variable + " = " +
                     core::json::FormatNumber(calculation.value);
    return result;
  }
  return result;
}

} // namespace norma::agent
