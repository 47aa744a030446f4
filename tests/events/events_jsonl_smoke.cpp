#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "events/event_model.hpp"
#include "events/jsonl_writer.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int main() {
  using norma::events::Event;
  using norma::events::EventType;
  using norma::tests::common::AssertContains;
  using norma::tests::common::Fail;

  norma::tests::common::ScopedTempDir temp_dir("norma-events-jsonl-smoke");
  const fs::path out_dir = temp_dir.path() / "nested" / "out";

  Event first;
  first.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(1'250));
  first.type = EventType::kSessionStarted;
  first.payload = {{"session_id", "session-1"}, {"query", "line one\nline two"}};

  Event second;
  second.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(2'000));
  second.type = EventType::kSessionError;
  second.payload = {{"stage", "dispatch"}, {"error", "tab\there"}};

  fs::path written_path;
  std::string error;
  if (!norma::events::AppendEventJsonl(first, out_dir, written_path, error) ||
      !norma::events::AppendEventJsonl(second, out_dir, written_path, error)) {
    Fail("AppendEventJsonl failed: " + error);
  }
  if (written_path != out_dir / "events.jsonl") {
    Fail("events must be appended to events.jsonl");
  }

  std::ifstream input(written_path, std::ios::binary);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(input, line)) {
    lines.push_back(line);
  }
  if (lines.size() != 2U) {
    Fail("expected one line per event, escapes keeping payload newlines out");
  }
  if (lines[0] != R"({"ts_utc":"1970-01-01T00:00:01.250Z","type":"session_started","payload":{"query":"line one\nline two","session_id":"session-1"}})") {
    Fail("unexpected first line: " + lines[0]);
  }
  AssertContains(lines[1], "\"type\":\"session_error\"");
  AssertContains(lines[1], "\"error\":\"tab\\there\"");

  // A regular file where the directory should be is an I/O error.
  const fs::path blocker = temp_dir.path() / "blocker";
  {
    std::ofstream out(blocker);
    out << "x";
  }
  if (norma::events::AppendEventJsonl(first, blocker / "dir", written_path, error)) {
    Fail("writing below a regular file must fail");
  }
  if (error.empty()) {
    Fail("failure must carry an error message");
  }

  return 0;
}
