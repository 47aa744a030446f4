#pragma once

#include "events/event_model.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

namespace norma::events {

// Typed facade over the JSONL writer so every session event carries the
// same payload keys. An emitter built with an empty output directory is
// disabled: every Emit call succeeds without writing.
class Emitter {
public:
  struct SessionStartedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string session_id;
    std::string query;
    std::string plan_source;
  };

  struct PlanInstalledEvent {
    std::chrono::system_clock::time_point ts{};
    std::string session_id;
    std::string goal;
    std::size_t step_count = 0;
    int revision = 0;
    bool requires_calculation = false;
  };

  struct StepDispatchedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string session_id;
    int step_number = 0;
    std::string tool;
    std::string action;
    std::string status;
    std::size_t attempts = 0;
    std::string source;
    std::size_t dispatch_count = 0;
    std::string error_message;
  };

  struct StepJudgedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string session_id;
    int step_number = 0;
    std::string verdict;
    double source_relevance = 0.0;
    double context_consistency = 0.0;
    bool is_loop_detected = false;
    std::string strategy;
    std::string failure;
  };

  struct ReplannedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string session_id;
    std::string strategy;
    int revision = 0;
    std::size_t steps_added = 0;
    std::size_t attempts = 0;
    bool used_model = false;
  };

  struct FinalizedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string session_id;
    std::size_t citation_count = 0;
    std::size_t limitation_count = 0;
    bool used_model = false;
  };

  struct EscalatedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string session_id;
    std::string reason;
    std::string failure;
  };

  struct SessionErrorEvent {
    std::chrono::system_clock::time_point ts{};
    std::string session_id;
    std::string stage;
    std::string error;
  };

  explicit Emitter(std::filesystem::path output_dir);

  bool Enabled() const {
    return !output_dir_.empty();
  }

  // `<output_dir>/events.jsonl` once the first event was written.
  const std::filesystem::path& events_path() const {
    return events_path_;
  }

  bool EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
               std::map<std::string, std::string> payload, std::string& error);

  bool EmitSessionStarted(const SessionStartedEvent& event, std::string& error);
  bool EmitPlanInstalled(const PlanInstalledEvent& event, std::string& error);
  bool EmitStepDispatched(const StepDispatchedEvent& event, std::string& error);
  bool EmitStepJudged(const StepJudgedEvent& event, std::string& error);
  bool EmitReplanned(const ReplannedEvent& event, std::string& error);
  bool EmitFinalized(const FinalizedEvent& event, std::string& error);
  bool EmitEscalated(const EscalatedEvent& event, std::string& error);
  bool EmitSessionError(const SessionErrorEvent& event, std::string& error);

private:
  std::filesystem::path output_dir_;
  std::filesystem::path events_path_;
};

} // namespace norma::events
