#include "events/emitter.hpp"

#include "core/time_utils.hpp"
#include "events/jsonl_writer.hpp"

#include <utility>

namespace norma::events {

namespace {

const char* Flag(bool value) {
  return value ? "true" : "false";
}

} // namespace

Emitter::Emitter(std::filesystem::path output_dir) : output_dir_(std::move(output_dir)) {}

bool Emitter::EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
                      std::map<std::string, std::string> payload, std::string& error) {
  if (!Enabled()) {
    return true;
  }
  Event event;
  event.ts = ts;
  event.type = type;
  event.payload = std::move(payload);
  return AppendEventJsonl(event, output_dir_, events_path_, error);
}

bool Emitter::EmitSessionStarted(const SessionStartedEvent& event, std::string& error) {
  return EmitRaw(EventType::kSessionStarted, event.ts,
                 {
                     {"session_id", event.session_id},
                     {"query", event.query},
                     {"plan_source", event.plan_source},
                 },
                 error);
}

bool Emitter::EmitPlanInstalled(const PlanInstalledEvent& event, std::string& error) {
  return EmitRaw(EventType::kPlanInstalled, event.ts,
                 {
                     {"session_id", event.session_id},
                     {"goal", event.goal},
                     {"step_count", std::to_string(event.step_count)},
                     {"revision", std::to_string(event.revision)},
                     {"requires_calculation", Flag(event.requires_calculation)},
                 },
                 error);
}

bool Emitter::EmitStepDispatched(const StepDispatchedEvent& event, std::string& error) {
  std::map<std::string, std::string> payload = {
      {"session_id", event.session_id},
      {"step_number", std::to_string(event.step_number)},
      {"tool", event.tool},
      {"action", event.action},
      {"status", event.status},
      {"attempts", std::to_string(event.attempts)},
      {"dispatch_count", std::to_string(event.dispatch_count)},
  };
  if (!event.source.empty()) {
    payload["source"] = event.source;
  }
  if (!event.error_message.empty()) {
    payload["error"] = event.error_message;
  }
  return EmitRaw(EventType::kStepDispatched, event.ts, std::move(payload), error);
}

bool Emitter::EmitStepJudged(const StepJudgedEvent& event, std::string& error) {
  std::map<std::string, std::string> payload = {
      {"session_id", event.session_id},
      {"step_number", std::to_string(event.step_number)},
      {"verdict", event.verdict},
      {"source_relevance", core::FormatFixedDouble(event.source_relevance, 3)},
      {"context_consistency", core::FormatFixedDouble(event.context_consistency, 3)},
      {"is_loop_detected", Flag(event.is_loop_detected)},
      {"failure", event.failure},
  };
  if (!event.strategy.empty()) {
    payload["strategy"] = event.strategy;
  }
  return EmitRaw(EventType::kStepJudged, event.ts, std::move(payload), error);
}

bool Emitter::EmitReplanned(const ReplannedEvent& event, std::string& error) {
  return EmitRaw(EventType::kReplanned, event.ts,
                 {
                     {"session_id", event.session_id},
                     {"strategy", event.strategy},
                     {"revision", std::to_string(event.revision)},
                     {"steps_added", std::to_string(event.steps_added)},
                     {"attempts", std::to_string(event.attempts)},
                     {"used_model", Flag(event.used_model)},
                 },
                 error);
}

bool Emitter::EmitFinalized(const FinalizedEvent& event, std::string& error) {
  return EmitRaw(EventType::kFinalized, event.ts,
                 {
                     {"session_id", event.session_id},
                     {"citation_count", std::to_string(event.citation_count)},
                     {"limitation_count", std::to_string(event.limitation_count)},
                     {"used_model", Flag(event.used_model)},
                 },
                 error);
}

bool Emitter::EmitEscalated(const EscalatedEvent& event, std::string& error) {
  return EmitRaw(EventType::kEscalated, event.ts,
                 {
                     {"session_id", event.session_id},
                     {"reason", event.reason},
                     {"failure", event.failure},
                 },
                 error);
}

bool Emitter::EmitSessionError(const SessionErrorEvent& event, std::string& error) {
  return EmitRaw(EventType::kSessionError, event.ts,
                 {
                     {"session_id", event.session_id},
                     {"stage", event.stage},
                     {"error", event.error},
                 },
                 error);
}

} // namespace norma::events
