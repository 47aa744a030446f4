#pragma once

#include "agent/dispatcher.hpp"
#include "agent/judge.hpp"
#include "agent/model_adapter.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace norma::config {

struct ModelSettings {
  std::size_t parse_max_attempts = 3;
  std::chrono::milliseconds timeout{30000};
  // Shell command of the external model; empty means "no model".
  std::string command;
};

// Everything one `norma run` session is tuned by. Defaults are the shipped
// policy; a config file only overrides the fields it names.
struct SessionConfig {
  agent::JudgeConfig judge;
  agent::DispatcherConfig dispatcher;
  ModelSettings model;
  std::filesystem::path output_dir;
};

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

agent::ModelCallConfig ToModelCallConfig(const ModelSettings& settings);

// Parses and validates session config JSON.
//
// Contract:
// - Returns true when validation completed (even if the config is invalid).
// - Returns false only for internal failures outside the validation flow.
// - Populates `report.valid` and `report.issues`; issue paths are dotted
//   field paths (`judge.loop_window`), `$` for the document itself.
// - `config` holds the parsed values only when `report.valid` is true.
bool ParseSessionConfigText(std::string_view json_text, SessionConfig& config,
                            ValidationReport& report, std::string& error);

// Loads and validates a config file.
//
// Contract:
// - Returns false if file I/O fails and sets `error`.
// - Otherwise returns true and populates `report`.
bool LoadSessionConfigFile(const std::filesystem::path& path, SessionConfig& config,
                           ValidationReport& report, std::string& error);

} // namespace norma::config
