#pragma once

#include "tools/tool_interfaces.hpp"

#include <filesystem>
#include <string>

namespace norma::tools::model {

// Language model backed by an external shell command.
//
// The prompt (system prompt, blank line, user prompt) is written to a
// temporary file that becomes the command's stdin; stdout is the response.
// The stage name is exported as NORMA_MODEL_STAGE so one wrapper script can
// serve every stage. A non-zero exit status or empty output is an error.
// The command runs in its own process group, which is killed once the request
// timeout passes; the call then fails instead of waiting.
class CommandModel final : public ILanguageModel {
public:
  CommandModel(std::string command, std::filesystem::path scratch_dir);

  bool Complete(const ModelRequest& request, std::string& response, std::string& error) override;

private:
  std::string command_;
  std::filesystem::path scratch_dir_;
};

} // namespace norma::tools::model
