#pragma once

#include "agent/execution_state.hpp"
#include "agent/model_adapter.hpp"
#include "tools/tool_interfaces.hpp"

#include <string>
#include <vector>

namespace norma::agent {

// Distinct sources of successful and partial results the judge accepted, in
// first-seen order. Rejected and contradicting results are never cited.
std::vector<SourceRef> CollectCitations(const ExecutionState& state);

// Required facts of the goal still absent from the scratchpad.
std::vector<std::string> UnresolvedFacts(const ExecutionState& state);

// Model-free answer: goal, the established facts and where they came from.
std::string ComposeAnswerText(const ExecutionState& state,
                              const std::vector<SourceRef>& citations);

struct FinalizeOutcome {
  bool used_model = false;
  std::string model_error;
};

// Produces the FinalAnswer and moves the session to `completed`. When the
// drafting model fails validation the deterministic text is used instead and
// the reason is reported in `outcome.model_error`.
class Finalizer {
public:
  Finalizer(tools::ILanguageModel* model, ModelCallConfig config);

  bool Finalize(ExecutionState& state, FinalAnswer& answer, FinalizeOutcome& outcome,
                std::string& error);

private:
  tools::ILanguageModel* model_ = nullptr;
  ModelCallConfig config_;
};

} // namespace norma::agent
