#include "agent/types.hpp"

#include <cctype>
#include <string>

namespace norma::agent {

namespace {

std::string Normalize(std::string_view text) {
  std::string normalized;
  normalized.reserve(text.size());
  for (const char c : text) {
    if (c == '-' || c == ' ') {
      normalized.push_back('_');
      continue;
    }
    normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  const auto first = normalized.find_first_not_of('_');
  if (first == std::string::npos) {
    return "";
  }
  const auto last = normalized.find_last_not_of('_');
  return normalized.substr(first, last - first + 1);
}

template <typename Enum, std::size_t N>
bool ParseByName(std::string_view text, const Enum (&candidates)[N], Enum& out) {
  const std::string normalized = Normalize(text);
  for (const Enum candidate : candidates) {
    if (Normalize(ToString(candidate)) == normalized) {
      out = candidate;
      return true;
    }
  }
  return false;
}

} // namespace

const char* ToString(ToolKind tool) {
  switch (tool) {
  case ToolKind::kSearch:
    return "search";
  case ToolKind::kCalculate:
    return "calculate";
  case ToolKind::kOther:
    return "other";
  }
  return "other";
}

const char* ToString(StepStatus status) {
  switch (status) {
  case StepStatus::kPending:
    return "pending";
  case StepStatus::kDone:
    return "done";
  }
  return "pending";
}

const char* ToString(ResultStatus status) {
  switch (status) {
  case ResultStatus::kSuccess:
    return "success";
  case ResultStatus::kPartial:
    return "partial";
  case ResultStatus::kNotFound:
    return "not_found";
  case ResultStatus::kError:
    return "error";
  }
  return "error";
}

const char* ToString(Verdict verdict) {
  switch (verdict) {
  case Verdict::kContinue:
    return "CONTINUE";
  case Verdict::kReplan:
    return "REPLAN";
  case Verdict::kFinalize:
    return "FINALIZE";
  case Verdict::kHumanReview:
    return "HUMAN_REVIEW";
  }
  return "HUMAN_REVIEW";
}

const char* ToString(ReplanStrategy strategy) {
  switch (strategy) {
  case ReplanStrategy::kRefineAndRestrictSearch:
    return "REFINE_AND_RESTRICT_SEARCH";
  case ReplanStrategy::kChangeKeywords:
    return "CHANGE_KEYWORDS";
  case ReplanStrategy::kFormNewHypothesis:
    return "FORM_NEW_HYPOTHESIS";
  case ReplanStrategy::kFormCalculationStep:
    return "FORM_CALCULATION_STEP";
  }
  return "FORM_NEW_HYPOTHESIS";
}

const char* ToString(SessionStatus status) {
  switch (status) {
  case SessionStatus::kPlanning:
    return "planning";
  case SessionStatus::kExecuting:
    return "executing";
  case SessionStatus::kJudging:
    return "judging";
  case SessionStatus::kFinalizing:
    return "finalizing";
  case SessionStatus::kCompleted:
    return "completed";
  case SessionStatus::kError:
    return "error";
  case SessionStatus::kHumanReview:
    return "human_review";
  }
  return "error";
}

bool ParseToolKind(std::string_view text, ToolKind& tool) {
  const std::string normalized = Normalize(text);
  if (normalized == "search_documents" || normalized == "search_documents_with_images") {
    tool = ToolKind::kSearch;
    return true;
  }
  static constexpr ToolKind kAll[] = {ToolKind::kSearch, ToolKind::kCalculate, ToolKind::kOther};
  return ParseByName(text, kAll, tool);
}

bool ParseResultStatus(std::string_view text, ResultStatus& status) {
  const std::string normalized = Normalize(text);
  if (normalized == "failure") {
    status = ResultStatus::kError;
    return true;
  }
  static constexpr ResultStatus kAll[] = {ResultStatus::kSuccess, ResultStatus::kPartial,
                                          ResultStatus::kNotFound, ResultStatus::kError};
  return ParseByName(text, kAll, status);
}

bool ParseVerdict(std::string_view text, Verdict& verdict) {
  if (Normalize(text) == "request_human_review") {
    verdict = Verdict::kHumanReview;
    return true;
  }
  static constexpr Verdict kAll[] = {Verdict::kContinue, Verdict::kReplan, Verdict::kFinalize,
                                     Verdict::kHumanReview};
  return ParseByName(text, kAll, verdict);
}

bool ParseReplanStrategy(std::string_view text, ReplanStrategy& strategy) {
  static constexpr ReplanStrategy kAll[] = {
      ReplanStrategy::kRefineAndRestrictSearch, ReplanStrategy::kChangeKeywords,
      ReplanStrategy::kFormNewHypothesis, ReplanStrategy::kFormCalculationStep};
  return ParseByName(text, kAll, strategy);
}

bool ParseSessionStatus(std::string_view text, SessionStatus& status) {
  static constexpr SessionStatus kAll[] = {
      SessionStatus::kPlanning,   SessionStatus::kExecuting, SessionStatus::kJudging,
      SessionStatus::kFinalizing, SessionStatus::kCompleted, SessionStatus::kError,
      SessionStatus::kHumanReview};
  return ParseByName(text, kAll, status);
}

bool IsTerminal(SessionStatus status) {
  return status == SessionStatus::kCompleted || status == SessionStatus::kError ||
         status == SessionStatus::kHumanReview;
}

} // namespace norma::agent
