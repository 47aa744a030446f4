#pragma once

#include "agent/execution_state.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace norma::agent {

struct EscalationArtifacts {
  std::filesystem::path session_state_path;
  std::filesystem::path packet_path;
};

// Hands a session to a human. The state is frozen first (status becomes
// human_review and later mutations fail), then the request is built with a
// snapshot of the frozen state. With a non-empty `output_dir` the snapshot
// and the handoff packet are also written there; `events_jsonl_path` is only
// referenced from the packet. There is no automatic resumption.
//
// Returns false only when writing the artifacts fails; the state stays
// frozen and `request` is filled in either way.
bool Escalate(ExecutionState& state, std::string reason, core::errors::FailureKind failure,
              const std::optional<Decision>& decision, const std::filesystem::path& output_dir,
              const std::filesystem::path& events_jsonl_path, HumanReviewRequest& request,
              EscalationArtifacts& artifacts, std::string& error);

} // namespace norma::agent
