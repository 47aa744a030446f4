#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "events/emitter.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using norma::tests::common::AssertContains;
using norma::tests::common::AssertNotContains;
using norma::tests::common::Fail;

std::vector<std::string> ReadNonEmptyLines(const fs::path& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    Fail("failed to open events output");
  }

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(input, line)) {
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  return lines;
}

std::chrono::system_clock::time_point AtMillis(long long millis) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
}

} // namespace

int main() {
  using norma::events::Emitter;

  norma::tests::common::ScopedTempDir temp_dir("norma-emitter-smoke");
  const fs::path out_dir = temp_dir.path() / "session-1";

  std::string error;
  Emitter emitter(out_dir);
  if (!emitter.Enabled() || !emitter.events_path().empty()) {
    Fail("emitter with a directory must be enabled and have written nothing yet");
  }

  if (!emitter.EmitSessionStarted(
          {
              .ts = AtMillis(1'000),
              .session_id = "session-1",
              .query = "minimum cover for a \"dry\" slab",
              .plan_source = "model",
          },
          error)) {
    Fail("EmitSessionStarted failed: " + error);
  }

  if (!emitter.EmitPlanInstalled(
          {
              .ts = AtMillis(1'100),
              .session_id = "session-1",
              .goal = "Find the minimum protective cover",
              .step_count = 2,
              .revision = 0,
              .requires_calculation = true,
          },
          error)) {
    Fail("EmitPlanInstalled failed: " + error);
  }

  if (!emitter.EmitStepDispatched(
          {
              .ts = AtMillis(1'200),
              .session_id = "session-1",
              .step_number = 1,
              .tool = "search",
              .action = "Search slab cover requirements",
              .status = "not_found",
              .attempts = 2,
              .dispatch_count = 1,
              .error_message = "index offline",
          },
          error)) {
    Fail("EmitStepDispatched failed: " + error);
  }

  if (!emitter.EmitStepJudged(
          {
              .ts = AtMillis(1'300),
              .session_id = "session-1",
              .step_number = 1,
              .verdict = "REPLAN",
              .source_relevance = 0.0,
              .context_consistency = 1.0,
              .is_loop_detected = false,
              .strategy = "CHANGE_KEYWORDS",
              .failure = "none",
          },
          error)) {
    Fail("EmitStepJudged failed: " + error);
  }

  if (!emitter.EmitReplanned(
          {
              .ts = AtMillis(1'400),
              .session_id = "session-1",
              .strategy = "CHANGE_KEYWORDS",
              .revision = 1,
              .steps_added = 1,
              .attempts = 1,
              .used_model = true,
          },
          error)) {
    Fail("EmitReplanned failed: " + error);
  }

  if (!emitter.EmitEscalated(
          {
              .ts = AtMillis(1'500),
              .session_id = "session-1",
              .reason = "second loop in session",
              .failure = "loop_detected",
          },
          error)) {
    Fail("EmitEscalated failed: " + error);
  }

  if (emitter.events_path() != out_dir / "events.jsonl") {
    Fail("events path must be <output_dir>/events.jsonl");
  }

  const std::vector<std::string> lines = ReadNonEmptyLines(emitter.events_path());
  if (lines.size() != 6U) {
    Fail("expected exactly six event lines");
  }

  AssertContains(lines[0], "\"ts_utc\":\"1970-01-01T00:00:01.000Z\"");
  AssertContains(lines[0], "\"type\":\"session_started\"");
  AssertContains(lines[0], "\"query\":\"minimum cover for a \\\"dry\\\" slab\"");
  AssertContains(lines[0], "\"plan_source\":\"model\"");

  AssertContains(lines[1], "\"type\":\"plan_installed\"");
  AssertContains(lines[1], "\"step_count\":\"2\"");
  AssertContains(lines[1], "\"requires_calculation\":\"true\"");

  AssertContains(lines[2], "\"type\":\"step_dispatched\"");
  AssertContains(lines[2], "\"attempts\":\"2\"");
  AssertContains(lines[2], "\"error\":\"index offline\"");
  AssertNotContains(lines[2], "\"source\"");

  AssertContains(lines[3], "\"type\":\"step_judged\"");
  AssertContains(lines[3], "\"source_relevance\":\"0.000\"");
  AssertContains(lines[3], "\"context_consistency\":\"1.000\"");
  AssertContains(lines[3], "\"is_loop_detected\":\"false\"");
  AssertContains(lines[3], "\"strategy\":\"CHANGE_KEYWORDS\"");

  AssertContains(lines[4], "\"type\":\"replanned\"");
  AssertContains(lines[4], "\"used_model\":\"true\"");

  AssertContains(lines[5], "\"type\":\"escalated\"");
  AssertContains(lines[5], "\"failure\":\"loop_detected\"");

  {
    // A judged FINALIZE carries no strategy key.
    if (!emitter.EmitStepJudged({.ts = AtMillis(1'600),
                                 .session_id = "session-1",
                                 .step_number = 2,
                                 .verdict = "FINALIZE",
                                 .failure = "none"},
                                error)) {
      Fail("EmitStepJudged(FINALIZE) failed: " + error);
    }
    const auto all = ReadNonEmptyLines(emitter.events_path());
    AssertNotContains(all.back(), "\"strategy\"");
  }

  {
    Emitter disabled(fs::path{});
    if (disabled.Enabled()) {
      Fail("empty output dir must disable the emitter");
    }
    if (!disabled.EmitSessionError(
            {.ts = AtMillis(2'000), .session_id = "s", .stage = "plan", .error = "x"}, error) ||
        !disabled.events_path().empty()) {
      Fail("disabled emitter must accept events without writing");
    }
  }

  return 0;
}
