#include "agent/escalation_gate.hpp"

#include "agent/escalation_packet_writer.hpp"
#include "agent/state_writer.hpp"

#include <utility>

namespace norma::agent {

bool Escalate(ExecutionState& state, std::string reason, core::errors::FailureKind failure,
              const std::optional<Decision>& decision, const std::filesystem::path& output_dir,
              const std::filesystem::path& events_jsonl_path, HumanReviewRequest& request,
              EscalationArtifacts& artifacts, std::string& error) {
  if (reason.empty()) {
    reason = "human review requested";
  }
  state.Freeze(reason);

  request = HumanReviewRequest{};
  request.reason = std::move(reason);
  request.failure = failure;
  request.triggering_decision = decision;
  request.state_snapshot_json = ToJson(state);

  artifacts = EscalationArtifacts{};
  if (output_dir.empty()) {
    return true;
  }

  if (!WriteSessionStateJson(state, output_dir, artifacts.session_state_path, error)) {
    return false;
  }

  EscalationPacketInput packet;
  packet.state = &state;
  packet.request = &request;
  packet.session_state_path = artifacts.session_state_path;
  packet.events_jsonl_path = events_jsonl_path;
  return WriteEscalationPacketMarkdown(packet, output_dir, artifacts.packet_path, error);
}

} // namespace norma::agent
