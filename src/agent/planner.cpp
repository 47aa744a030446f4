#include "agent/planner.hpp"

#include "agent/prompts.hpp"
#include "core/fs_utils.hpp"

#include <utility>

namespace norma::agent {

bool ProposeInitialPlan(tools::ILanguageModel& model, const std::string& query,
                        const ModelCallConfig& config, PlanProposal& proposal,
                        ModelCallResult& result, std::string& error) {
  if (query.find_first_not_of(" \t\r\n") == std::string::npos) {
    result = ModelCallResult{};
    result.failure = core::errors::FailureKind::kValidationError;
    error = "query cannot be empty";
    return false;
  }

  PlanProposal parsed;
  const JsonValidator validate = [&parsed](const core::json::Value& json, std::string& why) {
    return ParsePlanProposalJson(json, parsed, why);
  };
  if (!CallModelForJson(model, BuildPlanRequest(query), config, validate, result, error)) {
    error = "planning failed: " + error;
    return false;
  }
  proposal = std::move(parsed);
  return true;
}

bool ParsePlanProposalText(std::string_view text, PlanProposal& proposal, std::string& error) {
  core::json::Value root;
  if (!core::json::Parse(text, root, error)) {
    error = "plan is not valid JSON: " + error;
    return false;
  }
  return ParsePlanProposalJson(root, proposal, error);
}

bool LoadPlanFile(const std::filesystem::path& path, PlanProposal& proposal, std::string& error) {
  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }
  if (!ParsePlanProposalText(text, proposal, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

} // namespace norma::agent
