#pragma once

#include <initializer_list>
#include <string_view>

namespace norma::core::errors {

// Failure taxonomy of the control loop. None of these escape a session as an
// exception; each is routed to REPLAN or HUMAN_REVIEW, except
// kInfrastructure which ends the session with status `error`.
enum class FailureKind {
  kNone,
  kParseError,
  kToolError,
  kLoopDetected,
  kMaxStepsExceeded,
  kValidationError,
  kInfrastructure,
  kCancelled,
};

inline const char* ToString(FailureKind kind) {
  switch (kind) {
  case FailureKind::kNone:
    return "none";
  case FailureKind::kParseError:
    return "parse_error";
  case FailureKind::kToolError:
    return "tool_error";
  case FailureKind::kLoopDetected:
    return "loop_detected";
  case FailureKind::kMaxStepsExceeded:
    return "max_steps_exceeded";
  case FailureKind::kValidationError:
    return "validation_error";
  case FailureKind::kInfrastructure:
    return "infrastructure";
  case FailureKind::kCancelled:
    return "cancelled";
  }
  return "none";
}

inline bool ParseFailureKind(std::string_view text, FailureKind& kind) {
  for (const FailureKind candidate :
       {FailureKind::kNone, FailureKind::kParseError, FailureKind::kToolError,
        FailureKind::kLoopDetected, FailureKind::kMaxStepsExceeded,
        FailureKind::kValidationError, FailureKind::kInfrastructure, FailureKind::kCancelled}) {
    if (text == ToString(candidate)) {
      kind = candidate;
      return true;
    }
  }
  return false;
}

} // namespace norma::core::errors
