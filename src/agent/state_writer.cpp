#include "agent/state_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

namespace fs = std::filesystem;

namespace norma::agent {

namespace {

std::string StrategiesJson(const std::vector<ReplanStrategy>& strategies) {
  core::json::Value array = core::json::MakeArray();
  for (const ReplanStrategy strategy : strategies) {
    array.array_value.push_back(core::json::MakeString(ToString(strategy)));
  }
  return core::json::ToJson(array);
}

std::string HistoryJson(const std::vector<HistoryEntry>& history) {
  core::json::Value array = core::json::MakeArray();
  for (const auto& entry : history) {
    array.array_value.push_back(ToJsonValue(entry));
  }
  return core::json::ToJson(array);
}

} // namespace

std::string ToJson(const ExecutionState& state) {
  core::JsonObjectWriter counters;
  counters.Integer("dispatches", static_cast<long long>(state.DispatchCount()))
      .Integer("loops", static_cast<long long>(state.LoopCount()))
      .Integer("contradictions", static_cast<long long>(state.ContradictionCount()))
      .Integer("replan_failures", static_cast<long long>(state.ReplanFailureCount()))
      .Raw("strategies_used", StrategiesJson(state.StrategiesUsed()));

  core::JsonObjectWriter out;
  out.String("session_id", state.SessionId())
      .String("query", state.Query())
      .String("status", ToString(state.Status()))
      .String("created_at_utc", core::FormatUtcTimestamp(state.CreatedAt()))
      .String("updated_at_utc", core::FormatUtcTimestamp(state.UpdatedAt()));

  if (state.HasPlan()) {
    out.Raw("plan", core::json::ToJson(ToJsonValue(state.CurrentPlan())));
  } else {
    out.Null("plan");
  }

  out.Raw("scratchpad", core::json::ToJson(core::json::MakeObject(state.Facts().Entries())))
      .Raw("history", HistoryJson(state.History()))
      .Raw("counters", counters.Finish())
      .Bool("frozen", state.IsFrozen());

  if (state.IsFrozen()) {
    out.String("freeze_reason", state.FreezeReason());
  } else {
    out.Null("freeze_reason");
  }

  if (state.Answer().has_value()) {
    out.Raw("final_answer", core::json::ToJson(ToJsonValue(*state.Answer())));
  } else {
    out.Null("final_answer");
  }

  if (state.ErrorMessage().empty()) {
    out.Null("error_message");
  } else {
    out.String("error_message", state.ErrorMessage());
  }
  return out.Finish();
}

bool WriteSessionStateJson(const ExecutionState& state, const fs::path& output_dir,
                           fs::path& written_path, std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }

  written_path = output_dir / "session_state.json";
  // Keep newline termination so shell inspection (`cat`, `tail`) is clean.
  return core::WriteTextFileAtomic(written_path, ToJson(state) + "\n", error);
}

} // namespace norma::agent
