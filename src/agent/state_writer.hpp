#pragma once

#include "agent/execution_state.hpp"

#include <filesystem>
#include <string>

namespace norma::agent {

// Full snapshot of one session as a single JSON object: identity, status,
// plan, scratchpad, history, counters and (when present) the final answer.
std::string ToJson(const ExecutionState& state);

// Writes the session snapshot artifact.
//
// Contract:
// - creates `output_dir` if missing
// - writes `<output_dir>/session_state.json` atomically
// - returns written path on success
bool WriteSessionStateJson(const ExecutionState& state, const std::filesystem::path& output_dir,
                           std::filesystem::path& written_path, std::string& error);

} // namespace norma::agent
