#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace norma::cli {

// Options of `norma run`. Flags given on the command line win over the
// matching config file fields.
struct RunOptions {
  std::string query;
  std::filesystem::path corpus_path;
  std::optional<std::filesystem::path> plan_path;
  std::optional<std::filesystem::path> config_path;
  std::optional<std::filesystem::path> output_dir;
  std::optional<std::string> model_command;
  std::string session_id;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Runs one session with the local corpus search, the expression calculator
// and (when configured) the external model command, then prints the answer
// or the human-review request to stdout. Returns a process exit code.
int ExecuteSession(const RunOptions& options);

// Routes `norma` subcommands and returns process exit codes with a stable
// contract for scripts and CI:
//   0  => answered / success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => config or plan file invalid
//   40 => session handed to human review
//   50 => session ended with an infrastructure error
int Dispatch(int argc, char** argv);

} // namespace norma::cli
