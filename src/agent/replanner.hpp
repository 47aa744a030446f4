#pragma once

#include "agent/execution_state.hpp"
#include "agent/model_adapter.hpp"
#include "tools/tool_interfaces.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace norma::agent {

struct ReplanOutcome {
  ReplanStrategy strategy = ReplanStrategy::kFormNewHypothesis;
  std::size_t steps_added = 0;
  std::size_t attempts = 0;
  bool used_model = false;
  core::errors::FailureKind failure = core::errors::FailureKind::kNone;
};

// Rewrites the remaining plan after a REPLAN verdict.
//
// FORM_CALCULATION_STEP injects exactly one calculate step from the plan's
// calculation template (or the first calculate step a model replan offers).
// REFINE_AND_RESTRICT_SEARCH reissues the last search against
// priority_documents minus rejected_sources. CHANGE_KEYWORDS and
// FORM_NEW_HYPOTHESIS ask the model when there is one, otherwise take the
// next unused scratchpad search hypothesis. Rejected sources are stripped
// from every new search step.
//
// A candidate that fails validation is retried once; the second failure
// returns false with `outcome.failure` set.
class Replanner {
public:
  Replanner(tools::ILanguageModel* model, ModelCallConfig config);

  bool Apply(ExecutionState& state, const ReplanInstructions& instructions,
             ReplanOutcome& outcome, std::string& error);

private:
  bool ProposeSteps(const ExecutionState& state, const ReplanInstructions& instructions,
                    std::vector<Step>& steps, ScratchpadUpdate& update, ReplanOutcome& outcome,
                    std::string& error);
  bool ProposeFromModel(const ExecutionState& state, const ReplanInstructions& instructions,
                        std::vector<Step>& steps, ReplanOutcome& outcome, std::string& error);

  tools::ILanguageModel* model_ = nullptr;
  ModelCallConfig config_;
};

} // namespace norma::agent
