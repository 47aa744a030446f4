#include "agent/prompts.hpp"

#include "core/json_dom.hpp"

namespace norma::agent {

namespace {

constexpr const char* kRole =
    "You are an assistant for engineers working with building codes and regulatory "
    "documents. Answer only from retrieved evidence. Reply with one JSON object and "
    "nothing else.";

std::string ScratchpadJson(const ExecutionState& state) {
  return core::json::ToJson(core::json::MakeObject(state.Facts().Entries()));
}

std::string HistoryDigest(const ExecutionState& state) {
  std::string digest;
  for (const auto& entry : state.History()) {
    digest += "- step " + std::to_string(entry.step_snapshot.number) + " [" +
              ToString(entry.step_snapshot.tool) + "] " + entry.step_snapshot.action + " -> " +
              ToString(entry.result.status) + ", verdict " + ToString(entry.decision.verdict) +
              "\n";
  }
  return digest.empty() ? "(none)\n" : digest;
}

} // namespace

tools::ModelRequest BuildPlanRequest(const std::string& query) {
  tools::ModelRequest request;
  request.stage = tools::ModelStage::kPlan;
  request.system_prompt = std::string(kRole) +
      "\nProduce a research plan. Schema:\n"
      "{\"initial_scratchpad\": {\"query_domain\": str, \"priority_documents\": [str],"
      " \"search_hypotheses\": [{\"hypothesis\": str, \"keywords\": [str],"
      " \"expected_documents\": [str]}]},\n"
      " \"context_analysis\": str,\n"
      " \"plan\": {\"goal\": str, \"required_facts\": [str], \"requires_calculation\": bool,"
      " \"calculation\": {\"expression\": str, \"output_variable\": str, \"inputs\": {}} | null,"
      " \"steps\": [{\"step_number\": int, \"action\": str, \"tool\": \"search\"|\"calculate\","
      " \"parameters\": {...}}]}}\n"
      "Search parameters: keywords, expected_documents. Calculate parameters: expression,"
      " output_variable, inputs ({step_N.fact} or {scratchpad.key} references).";
  request.user_prompt = "Question: " + query;
  return request;
}

tools::ModelRequest BuildReplanRequest(const ExecutionState& state,
                                       const ReplanInstructions& instructions) {
  tools::ModelRequest request;
  request.stage = tools::ModelStage::kReplan;
  request.system_prompt = std::string(kRole) +
      "\nReplace the remaining steps of the plan. Schema: {\"steps\": [step, ...]} using the"
      " same step layout as the original plan. Never target a document listed in"
      " rejected_sources.";
  request.user_prompt = "Question: " + state.Query() + "\nGoal: " + state.CurrentPlan().goal +
                        "\nStrategy: " + ToString(instructions.strategy) +
                        "\nDetails: " + instructions.details +
                        "\nScratchpad: " + ScratchpadJson(state) +
                        "\nHistory:\n" + HistoryDigest(state);
  return request;
}

tools::ModelRequest BuildAnalysisRequest(const Step& step, const tools::DocumentRef& document) {
  tools::ModelRequest request;
  request.stage = tools::ModelStage::kAnalysis;
  request.system_prompt = std::string(kRole) +
      "\nExtract the facts the task needs from the document. Schema:\n"
      "{\"status\": \"success\"|\"partial\"|\"not_found\", \"facts\": {name: value},"
      " \"summary\": str}";
  request.user_prompt = "Task: " + step.action + "\nDocument: " + document.document_name + " (" +
                        document.locator + ")\n---\n" + document.excerpt + "\n---";
  return request;
}

tools::ModelRequest BuildAssessmentRequest(const ExecutionState& state, const Step& step,
                                           const StepResult& result) {
  tools::ModelRequest request;
  request.stage = tools::ModelStage::kAssessment;
  request.system_prompt = std::string(kRole) +
      "\nScore the latest result. Schema:\n"
      "{\"reasoning\": str, \"state_analysis\": {\"source_relevance_score\": 0..1,"
      " \"consistency_with_context_score\": 0..1, \"contradiction_details\": str | null},"
      " \"decision\": {\"verdict\": \"CONTINUE\" | \"REPLAN\" | \"FINALIZE\" |"
      " \"HUMAN_REVIEW\"}}";
  request.user_prompt = "Question: " + state.Query() + "\nStep: " + step.action +
                        "\nResult: " + core::json::ToJson(ToJsonValue(result)) +
                        "\nScratchpad: " + ScratchpadJson(state);
  return request;
}

tools::ModelRequest BuildFinalDraftRequest(const ExecutionState& state,
                                           const std::vector<std::string>& missing_facts) {
  tools::ModelRequest request;
  request.stage = tools::ModelStage::kFinalDraft;
  request.system_prompt = std::string(kRole) +
      "\nWrite the final answer. Schema:\n"
      "{\"final_response\": {\"analysis\": str, \"limitations\": [str],"
      " \"recommendations\": str}}";
  std::string missing;
  for (const auto& fact : missing_facts) {
    missing += (missing.empty() ? "" : ", ") + fact;
  }
  request.user_prompt = "Question: " + state.Query() + "\nGoal: " + state.CurrentPlan().goal +
                        "\nFacts: " + ScratchpadJson(state) +
                        "\nUnresolved: " + (missing.empty() ? "(none)" : missing);
  return request;
}

} // namespace norma::agent
