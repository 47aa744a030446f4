#pragma once

#include "core/json_dom.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace norma::tools {

// Which part of the loop is asking. Scripted models key their replies on it
// and the model adapter picks the response schema from it.
enum class ModelStage {
  kPlan,
  kReplan,
  kAnalysis,
  kAssessment,
  kFinalDraft,
};

inline const char* ToString(ModelStage stage) {
  switch (stage) {
  case ModelStage::kPlan:
    return "plan";
  case ModelStage::kReplan:
    return "replan";
  case ModelStage::kAnalysis:
    return "analysis";
  case ModelStage::kAssessment:
    return "assessment";
  case ModelStage::kFinalDraft:
    return "final_draft";
  }
  return "plan";
}

struct ModelRequest {
  ModelStage stage = ModelStage::kPlan;
  std::string system_prompt;
  std::string user_prompt;
  std::chrono::milliseconds timeout{30000};
};

// Language-model collaborator. Returns raw text; schema validation happens
// in the model adapter, never here.
class ILanguageModel {
public:
  virtual ~ILanguageModel() = default;

  virtual bool Complete(const ModelRequest& request, std::string& response,
                        std::string& error) = 0;
};

struct SearchRequest {
  std::vector<std::string> keywords;
  std::vector<std::string> expected_documents;
  std::size_t max_results = 5;
  std::chrono::milliseconds timeout{10000};
};

// One retrieved passage. `facts` carries whatever structured values the
// backend could attach to it.
struct DocumentRef {
  std::string document_name;
  std::string locator;
  std::string domain;
  std::string excerpt;
  core::json::Value::Object facts;
  double score = 0.0;
};

// Document-search collaborator. An empty result list means "not found";
// false means the backend itself failed.
class ISearchTool {
public:
  virtual ~ISearchTool() = default;

  virtual bool Search(const SearchRequest& request, std::vector<DocumentRef>& documents,
                      std::string& error) = 0;
};

struct CalculationRequest {
  std::string expression;
  std::map<std::string, double> variables;
  std::string output_variable = "result";
};

struct CalculationResult {
  std::string output_variable;
  double value = 0.0;
};

class ICalculationTool {
public:
  virtual ~ICalculationTool() = default;

  virtual bool Calculate(const CalculationRequest& request, CalculationResult& result,
                         std::string& error) = 0;
};

} // namespace norma::tools
