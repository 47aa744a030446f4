#pragma once

#include <string_view>

namespace norma::agent {

// Closed vocabularies of the control loop. Model output and plan files are
// parsed into these at the boundary; free text never reaches the judge.

enum class ToolKind {
  kSearch,
  kCalculate,
  kOther,
};

enum class StepStatus {
  kPending,
  kDone,
};

enum class ResultStatus {
  kSuccess,
  kPartial,
  kNotFound,
  kError,
};

enum class Verdict {
  kContinue,
  kReplan,
  kFinalize,
  kHumanReview,
};

// Order is the fallback preference when the judge must pick a strategy that
// differs from the one that produced a loop.
enum class ReplanStrategy {
  kRefineAndRestrictSearch,
  kChangeKeywords,
  kFormNewHypothesis,
  kFormCalculationStep,
};

enum class SessionStatus {
  kPlanning,
  kExecuting,
  kJudging,
  kFinalizing,
  kCompleted,
  kError,
  kHumanReview,
};

const char* ToString(ToolKind tool);
const char* ToString(StepStatus status);
const char* ToString(ResultStatus status);
const char* ToString(Verdict verdict);
const char* ToString(ReplanStrategy strategy);
const char* ToString(SessionStatus status);

// Boundary parsers. Matching is case-insensitive; the original tool names
// (`search_documents`) and verdict spelling (`REQUEST_HUMAN_REVIEW`) are
// accepted as aliases.
bool ParseToolKind(std::string_view text, ToolKind& tool);
bool ParseResultStatus(std::string_view text, ResultStatus& status);
bool ParseVerdict(std::string_view text, Verdict& verdict);
bool ParseReplanStrategy(std::string_view text, ReplanStrategy& strategy);
bool ParseSessionStatus(std::string_view text, SessionStatus& status);

// completed / error / human_review accept no further transitions.
bool IsTerminal(SessionStatus status);

} // namespace norma::agent
