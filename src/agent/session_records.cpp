#include "agent/session_records.hpp"

#include "core/time_utils.hpp"

#include <tuple>
#include <utility>

namespace norma::agent {

namespace {

using core::json::Value;

Value OptionalString(const std::optional<std::string>& text) {
  return text.has_value() ? core::json::MakeString(*text) : Value{};
}

// Scores are rounded to three decimals so snapshots compare cleanly.
Value Score(double value) {
  return core::json::MakeNumber(std::stod(core::FormatFixedDouble(value, 3)));
}

} // namespace

bool operator==(const SourceRef& a, const SourceRef& b) {
  return a.document_name == b.document_name && a.locator == b.locator && a.domain == b.domain;
}

bool operator<(const SourceRef& a, const SourceRef& b) {
  return std::tie(a.document_name, a.locator, a.domain) <
         std::tie(b.document_name, b.locator, b.domain);
}

Value ToJsonValue(const SourceRef& source) {
  Value json = core::json::MakeObject();
  json.object_value["document_name"] = core::json::MakeString(source.document_name);
  json.object_value["locator"] = core::json::MakeString(source.locator);
  json.object_value["domain"] = core::json::MakeString(source.domain);
  return json;
}

Value ToJsonValue(const StepResult& result) {
  Value json = core::json::MakeObject();
  json.object_value["status"] = core::json::MakeString(ToString(result.status));
  json.object_value["source"] = result.source.has_value() ? ToJsonValue(*result.source) : Value{};
  json.object_value["structured_output"] = result.structured_output.has_value()
                                               ? core::json::MakeObject(*result.structured_output)
                                               : Value{};
  json.object_value["summary"] = core::json::MakeString(result.summary);
  json.object_value["error_message"] = core::json::MakeString(result.error_message);
  json.object_value["attempts"] = core::json::MakeNumber(static_cast<double>(result.attempts));
  return json;
}

Value ToJsonValue(const Decision& decision) {
  Value json = core::json::MakeObject();
  json.object_value["verdict"] = core::json::MakeString(ToString(decision.verdict));
  json.object_value["reasoning"] = core::json::MakeString(decision.reasoning);

  Value scores = core::json::MakeObject();
  scores.object_value["source_relevance"] = Score(decision.scores.source_relevance);
  scores.object_value["context_consistency"] = Score(decision.scores.context_consistency);
  json.object_value["scores"] = std::move(scores);

  json.object_value["contradiction_details"] = OptionalString(decision.contradiction_details);
  json.object_value["is_loop_detected"] = core::json::MakeBool(decision.is_loop_detected);
  json.object_value["evidence_accepted"] = core::json::MakeBool(decision.evidence_accepted);

  if (decision.replan_instructions.has_value()) {
    Value instructions = core::json::MakeObject();
    instructions.object_value["strategy"] =
        core::json::MakeString(ToString(decision.replan_instructions->strategy));
    instructions.object_value["details"] =
        core::json::MakeString(decision.replan_instructions->details);
    json.object_value["replan_instructions"] = std::move(instructions);
  } else {
    json.object_value["replan_instructions"] = Value{};
  }

  json.object_value["scratchpad_update"] = decision.scratchpad_update.has_value()
                                               ? ToJsonValue(*decision.scratchpad_update)
                                               : Value{};
  json.object_value["human_review_reason"] = OptionalString(decision.human_review_reason);
  json.object_value["failure"] = core::json::MakeString(core::errors::ToString(decision.failure));
  return json;
}

Value ToJsonValue(const HistoryEntry& entry) {
  Value json = core::json::MakeObject();
  json.object_value["step"] = ToJsonValue(entry.step_snapshot);
  json.object_value["result"] = ToJsonValue(entry.result);
  json.object_value["decision"] = ToJsonValue(entry.decision);
  json.object_value["plan_revision"] = core::json::MakeNumber(entry.plan_revision);
  return json;
}

Value ToJsonValue(const FinalAnswer& answer) {
  Value json = core::json::MakeObject();
  json.object_value["text"] = core::json::MakeString(answer.text);
  Value citations = core::json::MakeArray();
  for (const auto& source : answer.citations) {
    citations.array_value.push_back(ToJsonValue(source));
  }
  json.object_value["citations"] = std::move(citations);
  json.object_value["limitations"] = core::json::MakeStringArray(answer.limitations);
  return json;
}

} // namespace norma::agent
