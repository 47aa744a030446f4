#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "tools/model/command_model.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

int main() {
  using norma::tests::common::AssertContains;
  using norma::tests::common::Fail;
  using norma::tools::ModelRequest;
  using norma::tools::ModelStage;
  using norma::tools::model::CommandModel;

  norma::tests::common::ScopedTempDir temp_dir("norma-command-model");

  ModelRequest request;
  request.stage = ModelStage::kReplan;
  request.system_prompt = "You are a planner.";
  request.user_prompt = "Reply with 'JSON' only.";

  {
    // `cat` echoes the prompt file back.
    CommandModel model("cat", temp_dir.path());
    std::string response;
    std::string error;
    if (!model.Complete(request, response, error)) {
      Fail("cat model failed: " + error);
    }
    if (response != "You are a planner.\n\nReply with 'JSON' only.") {
      Fail("prompt must be system prompt, blank line, user prompt: " + response);
    }
    if (!fs::is_empty(temp_dir.path())) {
      Fail("prompt file must be removed after the call");
    }
  }

  {
    CommandModel model("sh -c 'printf %s \"$NORMA_MODEL_STAGE\"'", temp_dir.path());
    std::string response;
    std::string error;
    if (!model.Complete(request, response, error) || response != "replan") {
      Fail("stage must be exported to the command: " + response + error);
    }
  }

  {
    CommandModel model("sh -c 'exit 3'", temp_dir.path());
    std::string response;
    std::string error;
    if (model.Complete(request, response, error)) {
      Fail("non-zero exit must fail");
    }
    AssertContains(error, "model command exited with status 3");
  }

  {
    CommandModel model("true", temp_dir.path());
    std::string response;
    std::string error;
    if (model.Complete(request, response, error)) {
      Fail("empty output must fail");
    }
    AssertContains(error, "model command produced no output");
  }

  {
    // A hung command is killed at the deadline.
    CommandModel model("sleep 5", temp_dir.path());
    ModelRequest bounded = request;
    bounded.timeout = std::chrono::milliseconds(100);
    std::string response;
    std::string error;
    const auto started = std::chrono::steady_clock::now();
    if (model.Complete(bounded, response, error)) {
      Fail("hung command must fail");
    }
    const auto elapsed = std::chrono::steady_clock::now() - started;
    AssertContains(error, "model command exceeded timeout of 100ms");
    if (elapsed > std::chrono::seconds(3)) {
      Fail("timed-out command must not be waited for");
    }
    if (!fs::is_empty(temp_dir.path())) {
      Fail("prompt file must be removed after a timeout");
    }
  }

  {
    // Closing stdout early does not escape the deadline.
    CommandModel model("sh -c 'exec >&-; sleep 5'", temp_dir.path());
    ModelRequest bounded = request;
    bounded.timeout = std::chrono::milliseconds(100);
    std::string response;
    std::string error;
    const auto started = std::chrono::steady_clock::now();
    if (model.Complete(bounded, response, error)) {
      Fail("command sleeping after closing stdout must fail");
    }
    AssertContains(error, "model command exceeded timeout of 100ms");
    if (std::chrono::steady_clock::now() - started > std::chrono::seconds(3)) {
      Fail("deadline must apply after stdout closes");
    }
  }

  {
    CommandModel model("", temp_dir.path());
    std::string response;
    std::string error;
    if (model.Complete(request, response, error)) {
      Fail("empty command must fail");
    }
    AssertContains(error, "model command is empty");
  }

  return 0;
}
