#pragma once

#include "tools/tool_interfaces.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace norma::tools::testing {

struct ScriptedReply {
  bool ok = true;
  std::string text;
  std::string error;
};

// Replays canned replies per stage in FIFO order so orchestrator tests run
// without a real model. An exhausted stage is reported as an error.
class ScriptedModel final : public ILanguageModel {
public:
  void Push(ModelStage stage, std::string text);
  void PushFailure(ModelStage stage, std::string error);

  bool Complete(const ModelRequest& request, std::string& response, std::string& error) override;

  const std::vector<ModelRequest>& requests() const;
  std::size_t remaining(ModelStage stage) const;

private:
  std::map<ModelStage, std::deque<ScriptedReply>> script_;
  std::vector<ModelRequest> requests_;
};

} // namespace norma::tools::testing
