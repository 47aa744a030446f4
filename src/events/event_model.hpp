#pragma once

#include <chrono>
#include <map>
#include <string>

namespace norma::events {

// Session trace categories. One line per control-loop transition; consumers
// key off these names so they stay stable.
enum class EventType {
  kSessionStarted,
  kPlanInstalled,
  kStepDispatched,
  kStepJudged,
  kReplanned,
  kFinalized,
  kEscalated,
  kSessionError,
};

// Canonical trace event.
//
// - `ts`: UTC timestamp when the event occurred.
// - `type`: normalized category.
// - `payload`: flat string attributes.
struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kSessionStarted;
  std::map<std::string, std::string> payload;
};

std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

} // namespace norma::events
