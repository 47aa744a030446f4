#include "events/event_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace norma::events {

std::string ToJson(EventType event_type) {
  switch (event_type) {
  case EventType::kSessionStarted:
    return "session_started";
  case EventType::kPlanInstalled:
    return "plan_installed";
  case EventType::kStepDispatched:
    return "step_dispatched";
  case EventType::kStepJudged:
    return "step_judged";
  case EventType::kReplanned:
    return "replanned";
  case EventType::kFinalized:
    return "finalized";
  case EventType::kEscalated:
    return "escalated";
  case EventType::kSessionError:
    return "session_error";
  }

  return "unknown";
}

std::string ToJson(const Event& event) {
  std::ostringstream out;
  out << "{"
      << "\"ts_utc\":\"" << core::FormatUtcTimestamp(event.ts) << "\","
      << "\"type\":\"" << ToJson(event.type) << "\","
      << "\"payload\":{";

  // `payload` is a std::map, so key order is stable across runs.
  bool first = true;
  for (const auto& [key, value] : event.payload) {
    if (!first) {
      out << ',';
    }
    out << "\"" << core::EscapeJson(key) << "\":\"" << core::EscapeJson(value) << "\"";
    first = false;
  }

  out << "}}";
  return out.str();
}

} // namespace norma::events
