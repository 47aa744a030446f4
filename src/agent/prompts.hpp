#pragma once

#include "agent/execution_state.hpp"
#include "tools/tool_interfaces.hpp"

#include <string>

namespace norma::agent {

// Prompt builders for each model stage. Every prompt states the exact JSON
// shape the model adapter will accept for that stage.
tools::ModelRequest BuildPlanRequest(const std::string& query);
tools::ModelRequest BuildReplanRequest(const ExecutionState& state,
                                       const ReplanInstructions& instructions);
tools::ModelRequest BuildAnalysisRequest(const Step& step, const tools::DocumentRef& document);
tools::ModelRequest BuildAssessmentRequest(const ExecutionState& state, const Step& step,
                                           const StepResult& result);
tools::ModelRequest BuildFinalDraftRequest(const ExecutionState& state,
                                           const std::vector<std::string>& missing_facts);

} // namespace norma::agent
