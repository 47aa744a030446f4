#pragma once

#include "agent/dispatcher.hpp"
#include "agent/escalation_gate.hpp"
#include "agent/execution_state.hpp"
#include "agent/judge.hpp"
#include "agent/model_adapter.hpp"
#include "core/logging/logger.hpp"
#include "tools/tool_interfaces.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace norma::agent {

struct OrchestratorConfig {
  JudgeConfig judge;
  DispatcherConfig dispatcher;
  ModelCallConfig model;
  // Session artifacts (events.jsonl, session_state.json,
  // escalation_packet.md). Empty disables all of them.
  std::filesystem::path output_dir;
  // Fixed id for reproducible runs; generated from the clock when empty.
  std::string session_id;
};

// Borrowed collaborators. Every model slot is optional: without a planner a
// static plan is required, without an analyzer document facts are taken as
// retrieved, without an assessor the judge uses its heuristics only, and
// without a drafter the answer text is composed deterministically.
struct Collaborators {
  tools::ISearchTool* search = nullptr;
  tools::ICalculationTool* calculator = nullptr;
  tools::ILanguageModel* planner = nullptr;
  tools::ILanguageModel* analyzer = nullptr;
  tools::ILanguageModel* assessor = nullptr;
  tools::ILanguageModel* drafter = nullptr;
};

// What one session produced. Exactly one of `answer` / `review` is set unless
// `status` is kError.
struct SessionOutcome {
  std::string session_id;
  SessionStatus status = SessionStatus::kError;
  std::optional<FinalAnswer> answer;
  std::optional<HumanReviewRequest> review;
  std::string error_message;
  std::size_t dispatches = 0;
  std::filesystem::path events_path;
  std::filesystem::path session_state_path;
  std::filesystem::path packet_path;
};

// Runs the control loop of one query session:
//
//   planning -> (executing -> judging)* -> finalizing -> completed
//                          \-> planning (replan) -> executing
//   any stage -> human_review | error
//
// The orchestrator owns the ExecutionState of the session and holds nothing
// between Run calls, so one instance may serve sessions one after another.
// `cancel` is polled between stages; a cancelled session is escalated.
//
// Contract:
// - true: the session ended with a FinalAnswer or a HumanReviewRequest.
// - false: infrastructure failure (state mutation or artifact I/O); status is
//   error and `error` explains why.
class Orchestrator {
public:
  Orchestrator(OrchestratorConfig config, Collaborators collaborators,
               core::logging::Logger& logger);

  bool Run(const std::string& query, const std::optional<PlanProposal>& static_plan,
           const std::atomic<bool>* cancel, SessionOutcome& outcome, std::string& error);

private:
  OrchestratorConfig config_;
  Collaborators collaborators_;
  core::logging::Logger* logger_ = nullptr;
};

} // namespace norma::agent
