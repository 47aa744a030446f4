#pragma once

#include "agent/execution_state.hpp"

#include <filesystem>
#include <string>

namespace norma::agent {

// Inputs for the human handoff note of an escalated session.
struct EscalationPacketInput {
  const ExecutionState* state = nullptr;
  const HumanReviewRequest* request = nullptr;
  std::filesystem::path session_state_path;
  std::filesystem::path events_jsonl_path;
};

// Writes `escalation_packet.md` for the reviewer:
// - why the session stopped and the decision that stopped it
// - the steps tried and what each returned
// - facts established so far and sources ruled out
// - how to rerun the session
//
// Contract:
// - creates `output_dir` as needed
// - writes `<output_dir>/escalation_packet.md`
// - returns false with actionable `error` on invalid input or I/O failure
bool WriteEscalationPacketMarkdown(const EscalationPacketInput& input,
                                   const std::filesystem::path& output_dir,
                                   std::filesystem::path& written_path, std::string& error);

} // namespace norma::agent
