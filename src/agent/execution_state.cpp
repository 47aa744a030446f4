#include "agent/execution_state.hpp"

#include <utility>

namespace norma::agent {

namespace {

using core::json::Value;

bool IsAllowedTransition(SessionStatus from, SessionStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == SessionStatus::kHumanReview || to == SessionStatus::kError) {
    return true;
  }
  switch (from) {
  case SessionStatus::kPlanning:
    return to == SessionStatus::kExecuting;
  case SessionStatus::kExecuting:
    return to == SessionStatus::kJudging;
  case SessionStatus::kJudging:
    return to == SessionStatus::kExecuting || to == SessionStatus::kPlanning ||
           to == SessionStatus::kFinalizing;
  case SessionStatus::kFinalizing:
    return to == SessionStatus::kCompleted;
  default:
    return false;
  }
}

std::vector<std::string> SplitPath(std::string_view path) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (start <= path.size()) {
    const std::size_t dot = path.find('.', start);
    const std::size_t end = dot == std::string_view::npos ? path.size() : dot;
    parts.emplace_back(path.substr(start, end - start));
    if (dot == std::string_view::npos) {
      break;
    }
    start = dot + 1;
  }
  return parts;
}

} // namespace

ExecutionState::ExecutionState(std::string session_id, std::string query)
    : session_id_(std::move(session_id)), query_(std::move(query)),
      created_at_(std::chrono::system_clock::now()), updated_at_(created_at_) {}

const Step* ExecutionState::CurrentStep() const {
  if (!has_plan_ || !plan_.current_step_index.has_value()) {
    return nullptr;
  }
  return &plan_.steps[*plan_.current_step_index];
}

std::optional<ReplanStrategy> ExecutionState::LastStrategy() const {
  if (strategies_used_.empty()) {
    return std::nullopt;
  }
  return strategies_used_.back();
}

std::optional<Value> ExecutionState::Get(std::string_view path) const {
  if (path == "query") {
    return core::json::MakeString(query_);
  }
  if (path == "session_id") {
    return core::json::MakeString(session_id_);
  }
  if (path == "status") {
    return core::json::MakeString(ToString(status_));
  }
  if (path == "history.size") {
    return core::json::MakeNumber(static_cast<double>(history_.size()));
  }
  if (path == "counters.dispatches") {
    return core::json::MakeNumber(static_cast<double>(dispatch_count_));
  }
  if (path == "counters.loops") {
    return core::json::MakeNumber(static_cast<double>(loop_count_));
  }
  if (path.rfind("plan.", 0) == 0) {
    if (!has_plan_) {
      return std::nullopt;
    }
    if (path == "plan.goal") {
      return core::json::MakeString(plan_.goal);
    }
    if (path == "plan.revision") {
      return core::json::MakeNumber(plan_.revision);
    }
    if (path == "plan.steps.size") {
      return core::json::MakeNumber(static_cast<double>(plan_.steps.size()));
    }
    if (path == "plan.current_step_index") {
      if (!plan_.current_step_index.has_value()) {
        return core::json::MakeString("exhausted");
      }
      return core::json::MakeNumber(static_cast<double>(*plan_.current_step_index));
    }
    return std::nullopt;
  }
  if (path.rfind("scratchpad.", 0) == 0) {
    const auto parts = SplitPath(path.substr(std::string_view("scratchpad.").size()));
    const Value* current = scratchpad_.Find(parts.front());
    for (std::size_t i = 1; current != nullptr && i < parts.size(); ++i) {
      current = core::json::Find(*current, parts[i]);
    }
    if (current == nullptr) {
      return std::nullopt;
    }
    return *current;
  }
  return std::nullopt;
}

bool ExecutionState::CheckMutable(std::string& error) const {
  if (frozen_) {
    error = "execution state is frozen for human review: " + freeze_reason_;
    return false;
  }
  return true;
}

void ExecutionState::Touch() {
  updated_at_ = std::chrono::system_clock::now();
}

bool ExecutionState::SetStatus(SessionStatus status, std::string& error) {
  if (!CheckMutable(error)) {
    return false;
  }
  if (!IsAllowedTransition(status_, status)) {
    error = std::string("illegal session status transition ") + ToString(status_) + " -> " +
            ToString(status);
    return false;
  }
  status_ = status;
  Touch();
  return true;
}

bool ExecutionState::InstallPlan(Plan plan, std::string& error) {
  if (!CheckMutable(error)) {
    return false;
  }
  if (has_plan_) {
    error = "a plan is already installed; use ReplaceRemainingSteps to replan";
    return false;
  }
  plan.current_step_index = FirstPendingIndex(plan);
  if (!ValidatePlan(plan, error)) {
    return false;
  }
  plan_ = std::move(plan);
  has_plan_ = true;
  Touch();
  return true;
}

bool ExecutionState::ReplaceRemainingSteps(std::vector<Step> steps, ReplanStrategy strategy,
                                           std::string& error) {
  if (!CheckMutable(error)) {
    return false;
  }
  if (!has_plan_) {
    error = "cannot replan before a plan is installed";
    return false;
  }
  if (steps.empty()) {
    error = "replan must provide at least one step";
    return false;
  }

  Plan candidate;
  candidate.goal = plan_.goal;
  candidate.requirements = plan_.requirements;
  candidate.revision = plan_.revision + 1;
  for (const auto& step : plan_.steps) {
    if (step.status == StepStatus::kDone) {
      candidate.steps.push_back(step);
    }
  }

  int next_number = NextStepNumber(candidate);
  for (auto& step : steps) {
    step.number = next_number++;
    step.status = StepStatus::kPending;
    candidate.steps.push_back(std::move(step));
  }
  candidate.current_step_index = FirstPendingIndex(candidate);

  if (!ValidatePlan(candidate, error)) {
    return false;
  }

  plan_ = std::move(candidate);
  strategies_used_.push_back(strategy);
  Touch();
  return true;
}

bool ExecutionState::MergeScratchpad(const ScratchpadUpdate& update, std::string& error) {
  if (!CheckMutable(error)) {
    return false;
  }
  if (!scratchpad_.Apply(update, error)) {
    return false;
  }
  Touch();
  return true;
}

bool ExecutionState::AppendHistory(HistoryEntry entry, std::string& error) {
  if (!CheckMutable(error)) {
    return false;
  }
  if (entry.step_snapshot.number <= 0) {
    error = "history entry requires the executed step snapshot";
    return false;
  }
  history_.push_back(std::move(entry));
  Touch();
  return true;
}

bool ExecutionState::CompleteCurrentStep(std::string& error) {
  if (!CheckMutable(error)) {
    return false;
  }
  if (!has_plan_ || !plan_.current_step_index.has_value()) {
    error = "no current step to complete";
    return false;
  }
  plan_.steps[*plan_.current_step_index].status = StepStatus::kDone;
  plan_.current_step_index = FirstPendingIndex(plan_, *plan_.current_step_index + 1);
  Touch();
  return true;
}

bool ExecutionState::AdvanceStep(std::string& error) {
  if (!CheckMutable(error)) {
    return false;
  }
  if (!has_plan_) {
    error = "cannot advance without a plan";
    return false;
  }
  if (!plan_.current_step_index.has_value()) {
    return true;
  }
  plan_.current_step_index = FirstPendingIndex(plan_, *plan_.current_step_index + 1);
  Touch();
  return true;
}

bool ExecutionState::RecordDispatch(std::string& error) {
  if (!CheckMutable(error)) {
    return false;
  }
  ++dispatch_count_;
  Touch();
  return true;
}

bool ExecutionState::RecordLoop(std::string& error) {
  if (!CheckMutable(error)) {
    return false;
  }
  ++loop_count_;
  return true;
}

bool ExecutionState::RecordContradiction(std::string& error) {
  if (!CheckMutable(error)) {
    return false;
  }
  ++contradiction_count_;
  return true;
}

bool ExecutionState::RecordReplanFailure(std::string& error) {
  if (!CheckMutable(error)) {
    return false;
  }
  ++replan_failure_count_;
  return true;
}

bool ExecutionState::SetFinalAnswer(FinalAnswer answer, std::string& error) {
  if (!CheckMutable(error)) {
    return false;
  }
  if (final_answer_.has_value()) {
    error = "final answer already set for this session";
    return false;
  }
  final_answer_ = std::move(answer);
  Touch();
  return true;
}

bool ExecutionState::SetErrorMessage(std::string message, std::string& error) {
  if (!CheckMutable(error)) {
    return false;
  }
  error_message_ = std::move(message);
  Touch();
  return true;
}

void ExecutionState::Freeze(std::string reason) {
  if (frozen_) {
    return;
  }
  status_ = SessionStatus::kHumanReview;
  freeze_reason_ = std::move(reason);
  frozen_ = true;
  Touch();
}

} // namespace norma::agent
