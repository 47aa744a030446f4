#include "config/session_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <set>
#include <utility>

namespace norma::config {

namespace {

using JsonValue = core::json::Value;

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

bool TryGetNonNegativeInteger(const JsonValue& value, std::uint64_t& out) {
  if (!value.IsNumber()) {
    return false;
  }
  if (!std::isfinite(value.number_value) || value.number_value < 0.0) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value) {
    return false;
  }
  if (floored > static_cast<double>(std::numeric_limits<std::uint32_t>::max())) {
    return false;
  }
  out = static_cast<std::uint64_t>(floored);
  return true;
}

// Section must be an object whose keys are all known. Returns nullptr when the
// section is absent or not an object.
const JsonValue* ReadSection(const JsonValue& root, std::string_view name,
                             const std::set<std::string>& known, ValidationReport& report) {
  const JsonValue* section = core::json::Find(root, name);
  if (section == nullptr) {
    return nullptr;
  }
  if (!section->IsObject()) {
    AddIssue(report, std::string(name), "must be an object");
    return nullptr;
  }
  for (const auto& [key, value] : section->object_value) {
    (void)value;
    if (known.count(key) == 0U) {
      AddIssue(report, std::string(name) + "." + key, "is not a known field");
    }
  }
  return section;
}

void ReadUnitInterval(const JsonValue& section, std::string_view section_name,
                      std::string_view key, double& out, ValidationReport& report) {
  const JsonValue* field = core::json::Find(section, key);
  if (field == nullptr) {
    return;
  }
  const std::string path = std::string(section_name) + "." + std::string(key);
  if (!field->IsNumber() || !std::isfinite(field->number_value)) {
    AddIssue(report, path, "must be a number");
    return;
  }
  if (field->number_value < 0.0 || field->number_value > 1.0) {
    AddIssue(report, path, "must be within [0, 1]");
    return;
  }
  out = field->number_value;
}

// Integer field with an inclusive lower bound.
bool ReadInteger(const JsonValue& section, std::string_view section_name, std::string_view key,
                 std::uint64_t minimum, std::uint64_t& out, ValidationReport& report) {
  const JsonValue* field = core::json::Find(section, key);
  if (field == nullptr) {
    return false;
  }
  const std::string path = std::string(section_name) + "." + std::string(key);
  std::uint64_t parsed = 0;
  if (!TryGetNonNegativeInteger(*field, parsed)) {
    AddIssue(report, path, "must be a non-negative integer");
    return false;
  }
  if (parsed < minimum) {
    AddIssue(report, path, "must be at least " + std::to_string(minimum));
    return false;
  }
  out = parsed;
  return true;
}

void ValidateJudge(const JsonValue& root, agent::JudgeConfig& judge, ValidationReport& report) {
  const JsonValue* section =
      ReadSection(root, "judge",
                  {"relevance_threshold", "consistency_threshold", "loop_window", "max_steps"},
                  report);
  if (section == nullptr) {
    return;
  }
  ReadUnitInterval(*section, "judge", "relevance_threshold", judge.relevance_threshold, report);
  ReadUnitInterval(*section, "judge", "consistency_threshold", judge.consistency_threshold,
                   report);
  std::uint64_t value = 0;
  if (ReadInteger(*section, "judge", "loop_window", 2, value, report)) {
    judge.loop_window = static_cast<std::size_t>(value);
  }
  if (ReadInteger(*section, "judge", "max_steps", 1, value, report)) {
    judge.max_steps = static_cast<std::size_t>(value);
  }
}

void ValidateDispatcher(const JsonValue& root, agent::DispatcherConfig& dispatcher,
                        ValidationReport& report) {
  const JsonValue* section = ReadSection(
      root, "dispatcher", {"tool_timeout_ms", "tool_max_attempts", "max_search_results"}, report);
  if (section == nullptr) {
    return;
  }
  std::uint64_t value = 0;
  if (ReadInteger(*section, "dispatcher", "tool_timeout_ms", 1, value, report)) {
    dispatcher.tool_timeout = std::chrono::milliseconds(static_cast<std::int64_t>(value));
  }
  if (ReadInteger(*section, "dispatcher", "tool_max_attempts", 1, value, report)) {
    dispatcher.tool_max_attempts = static_cast<std::size_t>(value);
  }
  if (ReadInteger(*section, "dispatcher", "max_search_results", 1, value, report)) {
    dispatcher.max_search_results = static_cast<std::size_t>(value);
  }
}

void ValidateModel(const JsonValue& root, ModelSettings& model, ValidationReport& report) {
  const JsonValue* section =
      ReadSection(root, "model", {"parse_max_attempts", "timeout_ms", "command"}, report);
  if (section == nullptr) {
    return;
  }
  std::uint64_t value = 0;
  if (ReadInteger(*section, "model", "parse_max_attempts", 1, value, report)) {
    model.parse_max_attempts = static_cast<std::size_t>(value);
  }
  if (ReadInteger(*section, "model", "timeout_ms", 1, value, report)) {
    model.timeout = std::chrono::milliseconds(static_cast<std::int64_t>(value));
  }
  if (const JsonValue* command = core::json::Find(*section, "command"); command != nullptr) {
    if (!command->IsString()) {
      AddIssue(report, "model.command", "must be a string");
    } else {
      model.command = command->string_value;
    }
  }
}

} // namespace

agent::ModelCallConfig ToModelCallConfig(const ModelSettings& settings) {
  agent::ModelCallConfig config;
  config.parse_max_attempts = settings.parse_max_attempts;
  config.timeout = settings.timeout;
  return config;
}

bool ParseSessionConfigText(std::string_view json_text, SessionConfig& config,
                            ValidationReport& report, std::string& error) {
  report = ValidationReport{};
  error.clear();

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$", "invalid JSON: " + parse_error);
    return true;
  }
  if (!root.IsObject()) {
    AddIssue(report, "$", "config must be a JSON object");
    return true;
  }

  const std::set<std::string> known_sections = {"judge", "dispatcher", "model", "output_dir"};
  for (const auto& [key, value] : root.object_value) {
    (void)value;
    if (known_sections.count(key) == 0U) {
      AddIssue(report, key, "is not a known field");
    }
  }

  SessionConfig parsed;
  ValidateJudge(root, parsed.judge, report);
  ValidateDispatcher(root, parsed.dispatcher, report);
  ValidateModel(root, parsed.model, report);
  if (const JsonValue* output_dir = core::json::Find(root, "output_dir"); output_dir != nullptr) {
    if (!output_dir->IsString()) {
      AddIssue(report, "output_dir", "must be a string");
    } else {
      parsed.output_dir = output_dir->string_value;
    }
  }

  report.valid = report.issues.empty();
  if (report.valid) {
    config = std::move(parsed);
  }
  return true;
}

bool LoadSessionConfigFile(const std::filesystem::path& path, SessionConfig& config,
                           ValidationReport& report, std::string& error) {
  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }
  return ParseSessionConfigText(text, config, report, error);
}

} // namespace norma::config
