#pragma once

#include "agent/model_adapter.hpp"
#include "tools/tool_interfaces.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace norma::agent {

// Asks the planner model for the initial plan and validates it. A model that
// never yields a valid plan leaves `result.failure` set (parse or tool error)
// so the caller can escalate.
bool ProposeInitialPlan(tools::ILanguageModel& model, const std::string& query,
                        const ModelCallConfig& config, PlanProposal& proposal,
                        ModelCallResult& result, std::string& error);

// Static plan file with the planner output layout (`plan`, optional
// `initial_scratchpad`) or a bare plan object.
bool ParsePlanProposalText(std::string_view text, PlanProposal& proposal, std::string& error);
bool LoadPlanFile(const std::filesystem::path& path, PlanProposal& proposal, std::string& error);

} // namespace norma::agent
