#pragma once

#include "agent/execution_state.hpp"
#include "agent/model_adapter.hpp"

#include <cstddef>
#include <string>

namespace norma::agent {

// Judge policy. Thresholds are inclusive lower bounds; `loop_window` counts
// the step being judged.
struct JudgeConfig {
  double relevance_threshold = 0.5;
  double consistency_threshold = 0.5;
  std::size_t loop_window = 3;
  std::size_t max_steps = 12;
};

// Inputs of one judgment. `step` is the snapshot of the step that was just
// dispatched; `state` does not yet contain its history entry.
struct JudgeInput {
  const ExecutionState* state = nullptr;
  const Step* step = nullptr;
  const StepResult* result = nullptr;
  const ModelAssessment* assessment = nullptr;
};

struct ConsistencyReport {
  std::size_t compared = 0;
  std::size_t contradictions = 0;
  std::string details;

  double Score() const;
};

bool ValidateJudgeConfig(const JudgeConfig& config, std::string& error);

// Heuristic relevance of the result's source in [0,1]: 1.0 for calculation
// results and priority documents, 0.0 for rejected or missing sources,
// otherwise by agreement with `query_domain`.
double ScoreSourceRelevance(const Scratchpad& facts, const Step& step, const StepResult& result);

// Compares every fact of `incoming` already present in `facts`. Numbers
// contradict when they differ beyond a relative 1e-6, strings when they
// differ after case and whitespace folding.
ConsistencyReport CheckConsistency(const Scratchpad& facts,
                                   const core::json::Value::Object& incoming);

// True when the last `window - 1` history steps and `step` share one
// signature.
bool DetectLoop(const ExecutionState& state, const Step& step, std::size_t window);

// Decides what happens after one dispatched step. Evaluation order:
// 1) budget ceiling exceeded
// 2) loop over the signature window
// 3) result status (not_found / error)
// 4) source relevance
// 5) consistency against the scratchpad
// 6) goal completion, including the calculation requirement
// 7) remaining pending steps
// then the budget guard again: at the ceiling anything but FINALIZE becomes
// HUMAN_REVIEW.
//
// Pure and deterministic: identical inputs give an identical decision.
// Contract:
// - true: decision is valid and `error` is empty.
// - false: input/config invalid; `error` explains why.
bool EvaluateStep(const JudgeConfig& config, const JudgeInput& input, Decision& decision,
                  std::string& error);

} // namespace norma::agent
