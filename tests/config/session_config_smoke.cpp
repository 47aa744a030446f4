#include "../common/assertions.hpp"
#include "../common/session_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "config/session_config.hpp"

#include <string>
#include <string_view>

namespace {

using norma::tests::common::Fail;

bool HasIssue(const norma::config::ValidationReport& report, std::string_view path,
              std::string_view message) {
  for (const auto& issue : report.issues) {
    if (issue.path == path && issue.message.find(message) != std::string::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

int main() {
  using norma::config::ParseSessionConfigText;
  using norma::config::SessionConfig;
  using norma::config::ValidationReport;

  {
    SessionConfig config;
    ValidationReport report;
    std::string error;
    if (!ParseSessionConfigText("{}", config, report, error) || !report.valid) {
      Fail("empty config must be valid");
    }
    if (config.judge.loop_window != 3U || config.judge.max_steps != 12U ||
        config.model.parse_max_attempts != 3U || !config.model.command.empty() ||
        !config.output_dir.empty()) {
      Fail("empty config must keep the shipped defaults");
    }
  }

  {
    SessionConfig config;
    ValidationReport report;
    std::string error;
    const bool ok = ParseSessionConfigText(R"({
      "judge": {"relevance_threshold": 0.4, "loop_window": 4, "max_steps": 20},
      "dispatcher": {"tool_timeout_ms": 2500, "tool_max_attempts": 3, "max_search_results": 7},
      "model": {"parse_max_attempts": 2, "timeout_ms": 9000, "command": "./model.sh"},
      "output_dir": "out/sessions"
    })",
                                           config, report, error);
    if (!ok || !report.valid) {
      Fail("full config must be valid");
    }
    if (config.judge.relevance_threshold != 0.4 || config.judge.loop_window != 4U ||
        config.judge.max_steps != 20U || config.judge.consistency_threshold != 0.5) {
      Fail("judge section must override only the named fields");
    }
    if (config.dispatcher.tool_timeout.count() != 2500 ||
        config.dispatcher.tool_max_attempts != 3U || config.dispatcher.max_search_results != 7U) {
      Fail("dispatcher section not applied");
    }
    const auto call_config = norma::config::ToModelCallConfig(config.model);
    if (call_config.parse_max_attempts != 2U || call_config.timeout.count() != 9000 ||
        config.model.command != "./model.sh" || config.output_dir != "out/sessions") {
      Fail("model section or output_dir not applied");
    }
  }

  {
    SessionConfig config;
    config.judge.max_steps = 99;
    ValidationReport report;
    std::string error;
    if (!ParseSessionConfigText(R"({
      "judge": {"relevance_threshold": 1.5, "loop_window": 1, "max_steps": 2.5, "mood": 1},
      "dispatcher": {"tool_max_attempts": 0},
      "model": {"command": 42},
      "output_dir": [],
      "plugins": {}
    })",
                                config, report, error)) {
      Fail("validation must complete for an invalid config: " + error);
    }
    if (report.valid || config.judge.max_steps != 99U) {
      Fail("invalid config must be reported and must not touch the output");
    }
    if (!HasIssue(report, "judge.relevance_threshold", "must be within [0, 1]") ||
        !HasIssue(report, "judge.loop_window", "must be at least 2") ||
        !HasIssue(report, "judge.max_steps", "must be a non-negative integer") ||
        !HasIssue(report, "judge.mood", "is not a known field") ||
        !HasIssue(report, "dispatcher.tool_max_attempts", "must be at least 1") ||
        !HasIssue(report, "model.command", "must be a string") ||
        !HasIssue(report, "output_dir", "must be a string") ||
        !HasIssue(report, "plugins", "is not a known field")) {
      Fail("expected one issue per invalid field");
    }
  }

  {
    SessionConfig config;
    ValidationReport report;
    std::string error;
    if (!ParseSessionConfigText("[1, 2]", config, report, error) ||
        !HasIssue(report, "$", "config must be a JSON object")) {
      Fail("non-object config must be reported at '$'");
    }
    if (!ParseSessionConfigText("{\"judge\": ", config, report, error) ||
        !HasIssue(report, "$", "invalid JSON")) {
      Fail("malformed config must be reported at '$'");
    }
  }

  {
    norma::tests::common::ScopedTempDir temp_dir("norma-config");
    const auto config_path = temp_dir.path() / "norma.json";
    norma::tests::common::WriteFixtureFile(config_path, R"({"judge": {"max_steps": 5}})");
    SessionConfig config;
    ValidationReport report;
    std::string error;
    if (!norma::config::LoadSessionConfigFile(config_path, config, report, error) ||
        !report.valid || config.judge.max_steps != 5U) {
      Fail("config file must load: " + error);
    }
    if (norma::config::LoadSessionConfigFile(temp_dir.path() / "missing.json", config, report,
                                             error) ||
        error.empty()) {
      Fail("missing config file must be an I/O error");
    }
  }

  return 0;
}
