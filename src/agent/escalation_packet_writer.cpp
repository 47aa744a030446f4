#include "agent/escalation_packet_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace fs = std::filesystem;

namespace norma::agent {

namespace {

bool ValidateInput(const EscalationPacketInput& input, std::string& error) {
  if (input.state == nullptr) {
    error = "escalation packet input state cannot be null";
    return false;
  }
  if (input.request == nullptr) {
    error = "escalation packet input request cannot be null";
    return false;
  }
  return true;
}

std::string Cell(std::string text) {
  for (char& c : text) {
    if (c == '|' || c == '\n' || c == '\r') {
      c = ' ';
    }
  }
  return text;
}

void WriteTriggeringDecision(std::ostringstream& out, const HumanReviewRequest& request) {
  out << "## Triggering Decision\n\n";
  if (!request.triggering_decision.has_value()) {
    out << "- No judge decision; the session stopped outside the judge.\n\n";
    return;
  }
  const Decision& decision = *request.triggering_decision;
  out << "- verdict: `" << ToString(decision.verdict) << "`\n";
  out << "- reasoning: " << decision.reasoning << "\n";
  out << "- source_relevance: " << core::FormatFixedDouble(decision.scores.source_relevance, 3)
      << ", context_consistency: "
      << core::FormatFixedDouble(decision.scores.context_consistency, 3) << "\n";
  out << "- is_loop_detected: `" << (decision.is_loop_detected ? "true" : "false") << "`\n";
  if (decision.contradiction_details.has_value()) {
    out << "- contradiction: " << *decision.contradiction_details << "\n";
  }
  out << '\n';
}

void WriteStepsTried(std::ostringstream& out, const ExecutionState& state) {
  out << "## Steps Tried\n\n";
  if (state.History().empty()) {
    out << "- No steps were dispatched.\n\n";
    return;
  }
  out << "| step | plan_rev | tool | action | result | source | verdict | strategy |\n";
  out << "| --- | --- | --- | --- | --- | --- | --- | --- |\n";
  for (const auto& entry : state.History()) {
    const std::string source =
        entry.result.source.has_value() ? entry.result.source->document_name : "";
    const std::string strategy = entry.decision.replan_instructions.has_value()
                                     ? ToString(entry.decision.replan_instructions->strategy)
                                     : "";
    out << "| " << entry.step_snapshot.number << " | " << entry.plan_revision << " | `"
        << ToString(entry.step_snapshot.tool) << "` | " << Cell(entry.step_snapshot.action)
        << " | `" << ToString(entry.result.status) << "` | " << Cell(source) << " | `"
        << ToString(entry.decision.verdict) << "` | " << strategy << " |\n";
  }
  out << '\n';
}

void WriteKnownFacts(std::ostringstream& out, const ExecutionState& state) {
  out << "## Known Facts\n\n";
  const auto& entries = state.Facts().Entries();
  if (entries.empty()) {
    out << "- Scratchpad is empty.\n\n";
    return;
  }
  for (const auto& [key, value] : entries) {
    out << "- `" << key << "`: `" << core::json::ToJson(value) << "`\n";
  }
  out << '\n';
}

void WriteRuledOut(std::ostringstream& out, const ExecutionState& state) {
  out << "## Ruled-Out Sources\n\n";
  const auto rejected = state.Facts().GetStringList(kFactRejectedSources);
  if (rejected.empty()) {
    out << "- No sources have been rejected.\n\n";
    return;
  }
  for (const auto& name : rejected) {
    out << "- " << name << "\n";
  }
  out << '\n';
}

void WriteRerun(std::ostringstream& out, const EscalationPacketInput& input) {
  out << "## Evidence\n\n";
  if (!input.session_state_path.empty()) {
    out << "- session_state: `" << input.session_state_path.string() << "`\n";
  }
  if (!input.events_jsonl_path.empty()) {
    out << "- events_jsonl: `" << input.events_jsonl_path.string() << "`\n";
  }
  out << "- rerun: `norma run --query \"" << input.state->Query()
      << "\" --corpus <corpus.json> --plan <reviewed_plan.json>`\n";
}

} // namespace

bool WriteEscalationPacketMarkdown(const EscalationPacketInput& input, const fs::path& output_dir,
                                   fs::path& written_path, std::string& error) {
  if (!ValidateInput(input, error) || !core::EnsureDirectory(output_dir, error)) {
    return false;
  }

  const ExecutionState& state = *input.state;
  std::ostringstream out;
  out << "# Escalation Packet\n\n";
  out << "## Session\n\n";
  out << "- session_id: `" << state.SessionId() << "`\n";
  out << "- query: " << state.Query() << "\n";
  out << "- status: `" << ToString(state.Status()) << "`\n";
  out << "- reason: " << input.request->reason << "\n";
  out << "- failure: `" << core::errors::ToString(input.request->failure) << "`\n";
  out << "- dispatches: " << state.DispatchCount() << ", loops: " << state.LoopCount()
      << ", contradictions: " << state.ContradictionCount() << "\n";
  if (state.HasPlan()) {
    out << "- goal: " << state.CurrentPlan().goal << "\n";
    out << "- plan_revision: " << state.CurrentPlan().revision << "\n";
  }
  out << '\n';

  WriteTriggeringDecision(out, *input.request);
  WriteStepsTried(out, state);
  WriteKnownFacts(out, state);
  WriteRuledOut(out, state);
  WriteRerun(out, input);

  written_path = output_dir / "escalation_packet.md";
  return core::WriteTextFileAtomic(written_path, out.str(), error);
}

} // namespace norma::agent
