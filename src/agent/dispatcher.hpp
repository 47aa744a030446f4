#pragma once

#include "agent/execution_state.hpp"
#include "agent/model_adapter.hpp"
#include "tools/tool_interfaces.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <string>

namespace norma::agent {

struct DispatcherConfig {
  std::chrono::milliseconds tool_timeout{10000};
  std::size_t tool_max_attempts = 2;
  std::size_t max_search_results = 5;
};

// Turns calculate-step inputs into calculator variables. Values are numbers,
// numeric strings or references: `{step_N.fact}` (the structured output of
// step N in history, `structured_output.` prefix optional) and
// `{scratchpad.key}`. Numeric scratchpad facts are visible by name too;
// explicit inputs win.
bool ResolveCalculationVariables(const ExecutionState& state, const Step& step,
                                 std::map<std::string, double>& variables, std::string& error);

// Replaces inline `{...}` references in an expression by their values.
bool SubstituteReferences(const ExecutionState& state, const std::string& expression,
                          std::string& resolved, std::string& error);

// Executes the step at the cursor against the matching tool.
//
// Every call counts one dispatch against the session budget. Tool calls are
// retried up to `tool_max_attempts`; a call that returns after
// `tool_timeout` counts as failed. success, partial and not_found mark the
// step done and advance the cursor; error leaves the cursor where it is.
class Dispatcher {
public:
  Dispatcher(tools::ISearchTool* search, tools::ICalculationTool* calculator,
             tools::ILanguageModel* analyzer, DispatcherConfig config,
             ModelCallConfig analyzer_config);

  // Returns false only when nothing can be dispatched (no current step,
  // frozen state); tool failures are reported inside `result`.
  bool DispatchCurrent(ExecutionState& state, Step& executed, StepResult& result,
                       std::string& error);

private:
  StepResult RunSearch(const ExecutionState& state, const Step& step);
  StepResult RunCalculation(const ExecutionState& state, const Step& step);

  tools::ISearchTool* search_ = nullptr;
  tools::ICalculationTool* calculator_ = nullptr;
  tools::ILanguageModel* analyzer_ = nullptr;
  DispatcherConfig config_;
  ModelCallConfig analyzer_config_;
};

} // namespace norma::agent
