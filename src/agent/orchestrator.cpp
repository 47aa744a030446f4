#include "agent/orchestrator.hpp"

#include "agent/finalizer.hpp"
#include "agent/planner.hpp"
#include "agent/prompts.hpp"
#include "agent/replanner.hpp"
#include "agent/state_writer.hpp"
#include "events/emitter.hpp"

#include <chrono>
#include <utility>

namespace norma::agent {

namespace {

using core::errors::FailureKind;

std::chrono::system_clock::time_point Now() {
  return std::chrono::system_clock::now();
}

std::string MakeSessionId(std::chrono::system_clock::time_point now) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  return "session-" + std::to_string(millis);
}

std::string SourceName(const StepResult& result) {
  return result.source.has_value() ? result.source->document_name : "";
}

// Per-run wiring. Lives for one Run call; everything durable is in `state`.
class Session {
public:
  Session(const OrchestratorConfig& config, const Collaborators& collaborators,
          core::logging::Logger& logger, const std::string& query)
      : config_(config), collaborators_(collaborators), logger_(logger),
        state_(config.session_id.empty() ? MakeSessionId(Now()) : config.session_id, query),
        emitter_(config.output_dir),
        dispatcher_(collaborators.search, collaborators.calculator, collaborators.analyzer,
                    config.dispatcher, config.model),
        replanner_(collaborators.planner, config.model),
        finalizer_(collaborators.drafter, config.model) {}

  bool Run(const std::optional<PlanProposal>& static_plan, const std::atomic<bool>* cancel,
           SessionOutcome& outcome, std::string& error);

private:
  bool InstallInitialPlan(const std::optional<PlanProposal>& static_plan, bool& escalated,
                          std::string& error);
  bool RunRound(bool& done, std::string& error);
  bool ApplyReplan(const Decision& decision, bool& escalated, std::string& error);
  bool Finish(std::string& error);
  bool EscalateSession(std::string reason, FailureKind failure,
                       const std::optional<Decision>& decision, std::string& error);
  std::optional<ModelAssessment> Assess(const Step& step, const StepResult& result);
  bool Fail(const std::string& stage, const std::string& cause, std::string& error);
  void FillOutcome(SessionOutcome& outcome) const;

  const OrchestratorConfig& config_;
  const Collaborators& collaborators_;
  core::logging::Logger& logger_;
  ExecutionState state_;
  events::Emitter emitter_;
  Dispatcher dispatcher_;
  Replanner replanner_;
  Finalizer finalizer_;
  std::optional<FinalAnswer> answer_;
  std::optional<HumanReviewRequest> review_;
  EscalationArtifacts artifacts_;
};

bool Session::Fail(const std::string& stage, const std::string& cause, std::string& error) {
  const std::string message = cause;
  error = stage + ": " + message;
  logger_.Error("session error", {{"stage", stage}, {"error", message}});

  std::string secondary;
  if (!state_.IsFrozen()) {
    if (!state_.SetErrorMessage(error, secondary) ||
        !state_.SetStatus(SessionStatus::kError, secondary)) {
      logger_.Warn("could not record session error in state", {{"error", secondary}});
    }
  }

  events::Emitter::SessionErrorEvent event;
  event.ts = Now();
  event.session_id = state_.SessionId();
  event.stage = stage;
  event.error = message;
  if (!emitter_.EmitSessionError(event, secondary)) {
    logger_.Warn("could not append session_error event", {{"error", secondary}});
  }

  if (!config_.output_dir.empty()) {
    if (!WriteSessionStateJson(state_, config_.output_dir, artifacts_.session_state_path,
                               secondary)) {
      logger_.Warn("could not write session state", {{"error", secondary}});
    }
  }
  return false;
}

bool Session::EscalateSession(std::string reason, FailureKind failure,
                              const std::optional<Decision>& decision, std::string& error) {
  HumanReviewRequest request;
  std::string write_error;
  const bool written = Escalate(state_, std::move(reason), failure, decision, config_.output_dir,
                                emitter_.events_path(), request, artifacts_, write_error);
  logger_.Warn("session escalated to human review",
               {{"reason", request.reason}, {"failure", core::errors::ToString(failure)}});
  review_ = request;

  events::Emitter::EscalatedEvent event;
  event.ts = Now();
  event.session_id = state_.SessionId();
  event.reason = request.reason;
  event.failure = core::errors::ToString(failure);
  if (!emitter_.EmitEscalated(event, error)) {
    return Fail("escalate", error, error);
  }
  if (!written) {
    return Fail("escalate", write_error, error);
  }
  return true;
}

bool Session::InstallInitialPlan(const std::optional<PlanProposal>& static_plan,
                                 bool& escalated, std::string& error) {
  escalated = false;
  PlanProposal proposal;
  if (static_plan.has_value()) {
    proposal = *static_plan;
  } else if (collaborators_.planner != nullptr) {
    ModelCallResult call;
    std::string planning_error;
    if (!ProposeInitialPlan(*collaborators_.planner, state_.Query(), config_.model, proposal, call,
                            planning_error)) {
      escalated = true;
      return EscalateSession(planning_error, call.failure, std::nullopt, error);
    }
    logger_.Debug("planner model produced a plan",
                  {{"attempts", std::to_string(call.attempts)}});
  } else {
    escalated = true;
    return EscalateSession("planning failed: no plan file and no planner model",
                           FailureKind::kValidationError, std::nullopt, error);
  }

  std::string install_error;
  if (!state_.InstallPlan(proposal.plan, install_error)) {
    escalated = true;
    return EscalateSession("planning failed: " + install_error, FailureKind::kValidationError,
                           std::nullopt, error);
  }
  if (!state_.MergeScratchpad(proposal.initial_scratchpad, error)) {
    return Fail("planning", error, error);
  }

  const Plan& plan = state_.CurrentPlan();
  logger_.Info("plan installed", {{"goal", plan.goal},
                                  {"steps", std::to_string(plan.steps.size())},
                                  {"revision", std::to_string(plan.revision)}});
  events::Emitter::PlanInstalledEvent event;
  event.ts = Now();
  event.session_id = state_.SessionId();
  event.goal = plan.goal;
  event.step_count = plan.steps.size();
  event.revision = plan.revision;
  event.requires_calculation = plan.requirements.requires_calculation;
  if (!emitter_.EmitPlanInstalled(event, error)) {
    return Fail("planning", error, error);
  }

  if (!state_.SetStatus(SessionStatus::kExecuting, error)) {
    return Fail("planning", error, error);
  }
  return true;
}

std::optional<ModelAssessment> Session::Assess(const Step& step, const StepResult& result) {
  if (collaborators_.assessor == nullptr ||
      (result.status != ResultStatus::kSuccess && result.status != ResultStatus::kPartial)) {
    return std::nullopt;
  }
  ModelAssessment assessment;
  const JsonValidator validate = [&assessment](const core::json::Value& json, std::string& why) {
    return ParseModelAssessmentJson(json, assessment, why);
  };
  ModelCallResult call;
  std::string assess_error;
  if (!CallModelForJson(*collaborators_.assessor, BuildAssessmentRequest(state_, step, result),
                        config_.model, validate, call, assess_error)) {
    logger_.Warn("assessment ignored; judging on heuristics", {{"error", assess_error}});
    return std::nullopt;
  }
  return assessment;
}

bool Session::ApplyReplan(const Decision& decision, bool& escalated, std::string& error) {
  escalated = false;
  ReplanInstructions instructions;
  if (decision.replan_instructions.has_value()) {
    instructions = *decision.replan_instructions;
  }

  if (!state_.SetStatus(SessionStatus::kPlanning, error)) {
    return Fail("replan", error, error);
  }

  ReplanOutcome replan;
  std::string replan_error;
  if (!replanner_.Apply(state_, instructions, replan, replan_error)) {
    if (replan.failure == FailureKind::kInfrastructure) {
      return Fail("replan", replan_error, error);
    }
    escalated = true;
    return EscalateSession("replan failed: " + replan_error, replan.failure, decision, error);
  }

  logger_.Info("plan revised", {{"strategy", ToString(replan.strategy)},
                                {"revision", std::to_string(state_.CurrentPlan().revision)},
                                {"steps_added", std::to_string(replan.steps_added)}});
  events::Emitter::ReplannedEvent event;
  event.ts = Now();
  event.session_id = state_.SessionId();
  event.strategy = ToString(replan.strategy);
  event.revision = state_.CurrentPlan().revision;
  event.steps_added = replan.steps_added;
  event.attempts = replan.attempts;
  event.used_model = replan.used_model;
  if (!emitter_.EmitReplanned(event, error)) {
    return Fail("replan", error, error);
  }

  if (!state_.SetStatus(SessionStatus::kExecuting, error)) {
    return Fail("replan", error, error);
  }
  return true;
}

bool Session::Finish(std::string& error) {
  FinalAnswer answer;
  FinalizeOutcome finalize;
  if (!finalizer_.Finalize(state_, answer, finalize, error)) {
    return Fail("finalize", error, error);
  }
  if (!finalize.model_error.empty()) {
    logger_.Warn("final draft rejected; composed answer used", {{"error", finalize.model_error}});
  }
  logger_.Info("session answered", {{"citations", std::to_string(answer.citations.size())},
                                    {"limitations", std::to_string(answer.limitations.size())}});

  events::Emitter::FinalizedEvent event;
  event.ts = Now();
  event.session_id = state_.SessionId();
  event.citation_count = answer.citations.size();
  event.limitation_count = answer.limitations.size();
  event.used_model = finalize.used_model;
  answer_ = std::move(answer);
  if (!emitter_.EmitFinalized(event, error)) {
    return Fail("finalize", error, error);
  }

  if (!config_.output_dir.empty() &&
      !WriteSessionStateJson(state_, config_.output_dir, artifacts_.session_state_path, error)) {
    return Fail("finalize", error, error);
  }
  return true;
}

// One dispatch + judgment + routing round. `done` turns true once the
// session reached a terminal outcome.
bool Session::RunRound(bool& done, std::string& error) {
  done = false;

  if (state_.DispatchCount() >= config_.judge.max_steps) {
    done = true;
    return EscalateSession("step budget of " + std::to_string(config_.judge.max_steps) +
                               " dispatches exhausted",
                           FailureKind::kMaxStepsExceeded, std::nullopt, error);
  }

  Step executed;
  StepResult result;
  if (!dispatcher_.DispatchCurrent(state_, executed, result, error)) {
    return Fail("dispatch", error, error);
  }

  logger_.Info("step dispatched", {{"step", std::to_string(executed.number)},
                                   {"tool", ToString(executed.tool)},
                                   {"status", ToString(result.status)},
                                   {"source", SourceName(result)}});
  if (!result.error_message.empty()) {
    logger_.Warn("tool call failed", {{"step", std::to_string(executed.number)},
                                      {"error", result.error_message}});
  }
  events::Emitter::StepDispatchedEvent dispatched;
  dispatched.ts = Now();
  dispatched.session_id = state_.SessionId();
  dispatched.step_number = executed.number;
  dispatched.tool = ToString(executed.tool);
  dispatched.action = executed.action;
  dispatched.status = ToString(result.status);
  dispatched.attempts = result.attempts;
  dispatched.source = SourceName(result);
  dispatched.dispatch_count = state_.DispatchCount();
  dispatched.error_message = result.error_message;
  if (!emitter_.EmitStepDispatched(dispatched, error)) {
    return Fail("dispatch", error, error);
  }

  if (!state_.SetStatus(SessionStatus::kJudging, error)) {
    return Fail("judge", error, error);
  }

  const std::optional<ModelAssessment> assessment = Assess(executed, result);
  JudgeInput input;
  input.state = &state_;
  input.step = &executed;
  input.result = &result;
  input.assessment = assessment.has_value() ? &*assessment : nullptr;
  Decision decision;
  if (!EvaluateStep(config_.judge, input, decision, error)) {
    return Fail("judge", error, error);
  }

  HistoryEntry entry;
  entry.step_snapshot = executed;
  entry.result = result;
  entry.decision = decision;
  entry.plan_revision = state_.CurrentPlan().revision;
  if (!state_.AppendHistory(std::move(entry), error)) {
    return Fail("judge", error, error);
  }
  if (decision.scratchpad_update.has_value() &&
      !state_.MergeScratchpad(*decision.scratchpad_update, error)) {
    return Fail("judge", error, error);
  }
  if (decision.is_loop_detected && !state_.RecordLoop(error)) {
    return Fail("judge", error, error);
  }
  if (decision.contradiction_details.has_value() && !state_.RecordContradiction(error)) {
    return Fail("judge", error, error);
  }

  const std::string strategy = decision.replan_instructions.has_value()
                                   ? ToString(decision.replan_instructions->strategy)
                                   : "";
  logger_.Info("step judged",
               {{"step", std::to_string(executed.number)},
                {"verdict", ToString(decision.verdict)},
                {"relevance", core::FormatFixedDouble(decision.scores.source_relevance, 3)},
                {"consistency", core::FormatFixedDouble(decision.scores.context_consistency, 3)},
                {"strategy", strategy}});
  logger_.Debug("judge reasoning", {{"reasoning", decision.reasoning}});
  events::Emitter::StepJudgedEvent judged;
  judged.ts = Now();
  judged.session_id = state_.SessionId();
  judged.step_number = executed.number;
  judged.verdict = ToString(decision.verdict);
  judged.source_relevance = decision.scores.source_relevance;
  judged.context_consistency = decision.scores.context_consistency;
  judged.is_loop_detected = decision.is_loop_detected;
  judged.strategy = strategy;
  judged.failure = core::errors::ToString(decision.failure);
  if (!emitter_.EmitStepJudged(judged, error)) {
    return Fail("judge", error, error);
  }

  switch (decision.verdict) {
  case Verdict::kContinue:
    if (state_.CurrentStep() == nullptr) {
      // Nothing left to run although the goal is open: look for new evidence.
      Decision exhausted = decision;
      exhausted.replan_instructions =
          ReplanInstructions{ReplanStrategy::kFormNewHypothesis, "plan exhausted"};
      bool escalated = false;
      if (!ApplyReplan(exhausted, escalated, error)) {
        done = true;
        return false;
      }
      done = escalated;
      return true;
    }
    if (!state_.SetStatus(SessionStatus::kExecuting, error)) {
      return Fail("judge", error, error);
    }
    return true;

  case Verdict::kReplan: {
    bool escalated = false;
    if (!ApplyReplan(decision, escalated, error)) {
      done = true;
      return false;
    }
    done = escalated;
    return true;
  }

  case Verdict::kFinalize:
    done = true;
    return Finish(error);

  case Verdict::kHumanReview:
    done = true;
    return EscalateSession(decision.human_review_reason.value_or(decision.reasoning),
                           decision.failure, decision, error);
  }

  done = true;
  return Fail("judge", "unhandled verdict", error);
}

bool Session::Run(const std::optional<PlanProposal>& static_plan, const std::atomic<bool>* cancel,
                  SessionOutcome& outcome, std::string& error) {
  logger_.SetSessionId(state_.SessionId());
  logger_.Info("session started", {{"query", state_.Query()}});

  events::Emitter::SessionStartedEvent started;
  started.ts = Now();
  started.session_id = state_.SessionId();
  started.query = state_.Query();
  started.plan_source = static_plan.has_value() ? "plan_file" : "model";
  bool ok = emitter_.EmitSessionStarted(started, error);
  if (!ok) {
    ok = Fail("start", error, error);
  }

  bool done = false;
  if (ok) {
    bool escalated = false;
    ok = InstallInitialPlan(static_plan, escalated, error);
    done = escalated;
  }

  while (ok && !done) {
    if (cancel != nullptr && cancel->load()) {
      logger_.Warn("cancellation requested");
      done = true;
      ok = EscalateSession("session cancelled", FailureKind::kCancelled, std::nullopt, error);
      break;
    }
    ok = RunRound(done, error);
  }

  FillOutcome(outcome);
  if (!ok) {
    outcome.status = SessionStatus::kError;
    outcome.error_message = error;
  }
  return ok;
}

void Session::FillOutcome(SessionOutcome& outcome) const {
  outcome = SessionOutcome{};
  outcome.session_id = state_.SessionId();
  outcome.status = state_.Status();
  outcome.answer = answer_;
  outcome.review = review_;
  outcome.error_message = state_.ErrorMessage();
  outcome.dispatches = state_.DispatchCount();
  outcome.events_path = emitter_.events_path();
  outcome.session_state_path = artifacts_.session_state_path;
  outcome.packet_path = artifacts_.packet_path;
}

} // namespace

Orchestrator::Orchestrator(OrchestratorConfig config, Collaborators collaborators,
                           core::logging::Logger& logger)
    : config_(std::move(config)), collaborators_(collaborators), logger_(&logger) {}

bool Orchestrator::Run(const std::string& query, const std::optional<PlanProposal>& static_plan,
                       const std::atomic<bool>* cancel, SessionOutcome& outcome,
                       std::string& error) {
  error.clear();
  Session session(config_, collaborators_, *logger_, query);
  return session.Run(static_plan, cancel, outcome, error);
}

} // namespace norma::agent
