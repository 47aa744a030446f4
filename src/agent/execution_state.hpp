#pragma once

#include "agent/plan.hpp"
#include "agent/scratchpad.hpp"
#include "agent/session_records.hpp"
#include "agent/types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace norma::agent {

// The single mutable record of one query session.
//
// Every stage reads it through const accessors and changes it only through
// the mutation methods below. Each mutator either applies fully or returns
// false with `error` set and leaves the state untouched. Once frozen by the
// escalation gate, every mutator fails.
class ExecutionState {
public:
  ExecutionState(std::string session_id, std::string query);

  const std::string& SessionId() const {
    return session_id_;
  }
  const std::string& Query() const {
    return query_;
  }
  SessionStatus Status() const {
    return status_;
  }
  bool HasPlan() const {
    return has_plan_;
  }
  const Plan& CurrentPlan() const {
    return plan_;
  }
  const Scratchpad& Facts() const {
    return scratchpad_;
  }
  const std::vector<HistoryEntry>& History() const {
    return history_;
  }

  // Step at the cursor, or nullptr when the plan is exhausted.
  const Step* CurrentStep() const;

  std::size_t DispatchCount() const {
    return dispatch_count_;
  }
  std::size_t LoopCount() const {
    return loop_count_;
  }
  std::size_t ContradictionCount() const {
    return contradiction_count_;
  }
  std::size_t ReplanFailureCount() const {
    return replan_failure_count_;
  }
  const std::vector<ReplanStrategy>& StrategiesUsed() const {
    return strategies_used_;
  }
  std::optional<ReplanStrategy> LastStrategy() const;

  bool IsFrozen() const {
    return frozen_;
  }
  const std::string& FreezeReason() const {
    return freeze_reason_;
  }
  const std::optional<FinalAnswer>& Answer() const {
    return final_answer_;
  }
  const std::string& ErrorMessage() const {
    return error_message_;
  }

  std::chrono::system_clock::time_point CreatedAt() const {
    return created_at_;
  }
  std::chrono::system_clock::time_point UpdatedAt() const {
    return updated_at_;
  }

  // Dotted read access for prompts and diagnostics: `query`, `session_id`,
  // `status`, `plan.goal`, `plan.revision`, `plan.current_step_index`,
  // `plan.steps.size`, `history.size`, `counters.dispatches`,
  // `counters.loops`, `scratchpad.<key>[.<member>...]`.
  std::optional<core::json::Value> Get(std::string_view path) const;

  bool SetStatus(SessionStatus status, std::string& error);

  // Installs the first plan of the session. The plan is validated and its
  // cursor moved to the first pending step.
  bool InstallPlan(Plan plan, std::string& error);

  // Replan: done steps stay as they are, pending steps are replaced by
  // `steps` (renumbered after the last done step), `revision` is bumped and
  // `strategy` is recorded.
  bool ReplaceRemainingSteps(std::vector<Step> steps, ReplanStrategy strategy,
                             std::string& error);

  bool MergeScratchpad(const ScratchpadUpdate& update, std::string& error);
  bool AppendHistory(HistoryEntry entry, std::string& error);

  // Marks the step at the cursor done, then advances the cursor.
  bool CompleteCurrentStep(std::string& error);

  // Moves the cursor to the next pending step after the current one, or to
  // "exhausted".
  bool AdvanceStep(std::string& error);

  // Counts one dispatcher invocation against the session budget.
  bool RecordDispatch(std::string& error);
  bool RecordLoop(std::string& error);
  bool RecordContradiction(std::string& error);
  bool RecordReplanFailure(std::string& error);

  bool SetFinalAnswer(FinalAnswer answer, std::string& error);
  bool SetErrorMessage(std::string message, std::string& error);

  // Escalation: status becomes human_review and no further mutation is
  // accepted.
  void Freeze(std::string reason);

private:
  bool CheckMutable(std::string& error) const;
  void Touch();

  std::string session_id_;
  std::string query_;
  SessionStatus status_ = SessionStatus::kPlanning;
  bool has_plan_ = false;
  Plan plan_;
  Scratchpad scratchpad_;
  std::vector<HistoryEntry> history_;
  std::size_t dispatch_count_ = 0;
  std::size_t loop_count_ = 0;
  std::size_t contradiction_count_ = 0;
  std::size_t replan_failure_count_ = 0;
  std::vector<ReplanStrategy> strategies_used_;
  std::optional<FinalAnswer> final_answer_;
  std::string error_message_;
  bool frozen_ = false;
  std::string freeze_reason_;
  std::chrono::system_clock::time_point created_at_{};
  std::chrono::system_clock::time_point updated_at_{};
};

} // namespace norma::agent
