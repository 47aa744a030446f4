#ifndef NORMA_TESTS_COMMON_SESSION_FIXTURES_HPP_
#define NORMA_TESTS_COMMON_SESSION_FIXTURES_HPP_

#include "agent/execution_state.hpp"
#include "agent/planner.hpp"
#include "assertions.hpp"
#include "core/json_dom.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace norma::tests::common {

// Lookup-only question: one search step, one required fact.
inline constexpr std::string_view kCoverLookupPlanJson = R"({
  "plan": {
    "goal": "Find the minimum protective concrete cover for a slab",
    "required_facts": ["min_cover_mm"],
    "steps": [
      {"step_number": 1, "action": "Search slab cover requirements", "tool": "search",
       "parameters": {"keywords": ["protective cover", "slab"],
                      "expected_documents": ["SP 63.13330"]}}
    ]
  },
  "initial_scratchpad": {
    "query_domain": "concrete structures",
    "priority_documents": ["SP 63.13330"]
  }
})";

// Lookup + computation whose plan forgot the calculation step.
inline constexpr std::string_view kAxisDistancePlanJson = R"({
  "plan": {
    "goal": "Distance from the slab surface to the bar axis",
    "required_facts": ["min_cover_mm", "bar_diameter_mm"],
    "requires_calculation": true,
    "calculation": {"expression": "min_cover_mm + bar_diameter_mm / 2",
                    "output_variable": "axis_distance_mm"},
    "steps": [
      {"step_number": 1, "action": "Search slab cover requirements", "tool": "search",
       "parameters": {"keywords": ["protective cover", "slab"],
                      "expected_documents": ["SP 63.13330"]}},
      {"step_number": 2, "action": "Search reinforcement bar diameter", "tool": "search",
       "parameters": {"keywords": ["bar diameter", "slab reinforcement"],
                      "expected_documents": ["SP 63.13330"]}}
    ]
  },
  "initial_scratchpad": {
    "query_domain": "concrete structures",
    "priority_documents": ["SP 63.13330"]
  }
})";

inline void WriteFixtureFile(const std::filesystem::path& file_path, std::string_view content) {
  std::error_code ec;
  if (!file_path.parent_path().empty()) {
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
      Fail("failed to create fixture directory: " + file_path.parent_path().string());
    }
  }
  std::ofstream out(file_path, std::ios::binary);
  if (!out) {
    Fail("failed to open fixture file: " + file_path.string());
  }
  out << content;
  if (!out) {
    Fail("failed to write fixture file: " + file_path.string());
  }
}

inline agent::PlanProposal RequirePlanProposal(std::string_view json_text) {
  agent::PlanProposal proposal;
  std::string error;
  if (!agent::ParsePlanProposalText(json_text, proposal, error)) {
    Fail("fixture plan rejected: " + error);
  }
  return proposal;
}

// Fresh state with the fixture plan installed and its scratchpad seeded,
// status `executing`.
inline agent::ExecutionState RequireInstalledState(std::string_view plan_json,
                                                   std::string query = "fixture query") {
  agent::PlanProposal proposal = RequirePlanProposal(plan_json);
  agent::ExecutionState state("session-fixture", std::move(query));
  std::string error;
  if (!state.InstallPlan(proposal.plan, error) ||
      !state.MergeScratchpad(proposal.initial_scratchpad, error) ||
      !state.SetStatus(agent::SessionStatus::kExecuting, error)) {
    Fail("failed to prepare fixture state: " + error);
  }
  return state;
}

inline core::json::Value::Object NumberFact(std::string key, double value) {
  core::json::Value::Object facts;
  facts[std::move(key)] = core::json::MakeNumber(value);
  return facts;
}

} // namespace norma::tests::common

#endif // NORMA_TESTS_COMMON_SESSION_FIXTURES_HPP_
