#include "norma/cli/router.hpp"

#include "agent/orchestrator.hpp"
#include "agent/planner.hpp"
#include "config/session_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "tools/calculator/expression_calculator.hpp"
#include "tools/model/command_model.hpp"
#include "tools/search/corpus_search.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace norma::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitInputInvalid = core::errors::ToInt(core::errors::ExitCode::kInputInvalid);
constexpr int kExitHumanReview = core::errors::ToInt(core::errors::ExitCode::kHumanReview);
constexpr int kExitSessionError = core::errors::ToInt(core::errors::ExitCode::kSessionError);

std::atomic<bool> g_cancel_requested{false};

extern "C" void HandleInterrupt(int) {
  g_cancel_requested.store(true);
}

// Installs the SIGINT handler for the lifetime of one session and restores
// the previous one afterwards.
class ScopedInterruptHandler {
public:
  ScopedInterruptHandler() {
    g_cancel_requested.store(false);
    previous_ = std::signal(SIGINT, HandleInterrupt);
  }
  ~ScopedInterruptHandler() {
    std::signal(SIGINT, previous_ == SIG_ERR ? SIG_DFL : previous_);
  }
  ScopedInterruptHandler(const ScopedInterruptHandler&) = delete;
  ScopedInterruptHandler& operator=(const ScopedInterruptHandler&) = delete;

private:
  void (*previous_)(int) = SIG_DFL;
};

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  norma run --query <text> --corpus <corpus.json> [--plan <plan.json>] "
         "[--config <config.json>] [--out <dir>] [--model-cmd <command>] "
         "[--session-id <id>] [--log-level <debug|info|warn|error>]\n"
      << "  norma validate-config <config.json>\n"
      << "  norma validate-plan <plan.json>\n"
      << "  norma version\n";
}

// Filesystem preflight checks run before parsing. This keeps path and
// file-type failures separate from content issues.
bool ValidateInputPath(const fs::path& path, std::string_view what, std::string& error) {
  if (path.empty()) {
    error = std::string(what) + " path cannot be empty";
    return false;
  }

  std::error_code ec;
  if (!fs::exists(path, ec) || ec) {
    error = std::string(what) + " file not found: " + path.string();
    return false;
  }
  if (!fs::is_regular_file(path, ec) || ec) {
    error = std::string(what) + " path must point to a regular file: " + path.string();
    return false;
  }
  if (path.extension() != ".json") {
    error = std::string(what) + " file must use .json extension: " + path.string();
    return false;
  }

  std::ifstream file(path);
  if (!file) {
    error = "unable to open " + std::string(what) + " file: " + path.string();
    return false;
  }
  if (file.peek() == std::ifstream::traits_type::eof()) {
    error = std::string(what) + " file is empty: " + path.string();
    return false;
  }
  return true;
}

void PrintConfigIssues(const fs::path& path, const config::ValidationReport& report) {
  std::cerr << "invalid config: " << path.string() << '\n';
  for (const auto& issue : report.issues) {
    std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
  }
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "norma 0.1.0\n";
  return kExitSuccess;
}

int CommandValidateConfig(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate-config requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  std::string error;
  const fs::path config_path(args.front());
  if (!ValidateInputPath(config_path, "config", error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  config::SessionConfig parsed;
  config::ValidationReport report;
  if (!config::LoadSessionConfigFile(config_path, parsed, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!report.valid) {
    PrintConfigIssues(config_path, report);
    return kExitInputInvalid;
  }

  std::cout << "valid: " << config_path.string() << '\n';
  return kExitSuccess;
}

int CommandValidatePlan(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate-plan requires exactly 1 argument: <plan.json>\n";
    return kExitUsage;
  }

  std::string error;
  const fs::path plan_path(args.front());
  if (!ValidateInputPath(plan_path, "plan", error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  agent::PlanProposal proposal;
  if (!agent::LoadPlanFile(plan_path, proposal, error)) {
    std::cerr << "invalid plan: " << plan_path.string() << '\n';
    std::cerr << "  - " << error << '\n';
    return kExitInputInvalid;
  }

  std::cout << "valid: " << plan_path.string() << " (" << proposal.plan.steps.size()
            << " steps)\n";
  return kExitSuccess;
}

// Parse `run` args with an explicit contract: every value flag takes exactly
// one value, unknown flags and positional args are usage errors.
bool ParseRunOptions(const std::vector<std::string_view>& args, RunOptions& options,
                     std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    const bool has_value = i + 1 < args.size();

    if (token == "--query" || token == "--corpus" || token == "--plan" || token == "--config" ||
        token == "--out" || token == "--model-cmd" || token == "--session-id" ||
        token == "--log-level") {
      if (!has_value) {
        error = "missing value for " + std::string(token);
        return false;
      }
      const std::string_view value = args[i + 1];
      ++i;

      if (token == "--query") {
        options.query = std::string(value);
      } else if (token == "--corpus") {
        options.corpus_path = fs::path(value);
      } else if (token == "--plan") {
        options.plan_path = fs::path(value);
      } else if (token == "--config") {
        options.config_path = fs::path(value);
      } else if (token == "--out") {
        options.output_dir = fs::path(value);
      } else if (token == "--model-cmd") {
        options.model_command = std::string(value);
      } else if (token == "--session-id") {
        options.session_id = std::string(value);
      } else {
        core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
        if (!core::logging::ParseLogLevel(value, parsed, error)) {
          return false;
        }
        options.log_level = parsed;
      }
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    error = "run does not accept positional argument: " + std::string(token);
    return false;
  }

  if (options.query.empty()) {
    error = "run requires --query <text>";
    return false;
  }
  if (options.corpus_path.empty()) {
    error = "run requires --corpus <corpus.json>";
    return false;
  }
  return true;
}

void PrintAnswer(const agent::SessionOutcome& outcome) {
  const agent::FinalAnswer& answer = *outcome.answer;
  std::cout << "session: " << outcome.session_id << '\n';
  std::cout << "answer:\n" << answer.text << '\n';
  if (!answer.citations.empty()) {
    std::cout << "sources:\n";
    for (const auto& source : answer.citations) {
      std::cout << "  - " << source.document_name;
      if (!source.locator.empty()) {
        std::cout << " (" << source.locator << ")";
      }
      std::cout << '\n';
    }
  }
  if (!answer.limitations.empty()) {
    std::cout << "limitations:\n";
    for (const auto& limitation : answer.limitations) {
      std::cout << "  - " << limitation << '\n';
    }
  }
  if (!outcome.session_state_path.empty()) {
    std::cout << "state: " << outcome.session_state_path.string() << '\n';
  }
}

void PrintReview(const agent::SessionOutcome& outcome) {
  const agent::HumanReviewRequest& review = *outcome.review;
  std::cout << "session: " << outcome.session_id << '\n';
  std::cout << "human review requested: " << review.reason << '\n';
  std::cout << "failure: " << core::errors::ToString(review.failure) << '\n';
  if (!outcome.packet_path.empty()) {
    std::cout << "packet: " << outcome.packet_path.string() << '\n';
  }
}

int CommandRun(const std::vector<std::string_view>& args) {
  RunOptions options;
  std::string error;
  if (!ParseRunOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  return ExecuteSession(options);
}

} // namespace

int ExecuteSession(const RunOptions& options) {
  core::logging::Logger logger(options.log_level);
  std::string error;

  config::SessionConfig session_config;
  if (options.config_path.has_value()) {
    if (!ValidateInputPath(*options.config_path, "config", error)) {
      logger.Error("config path validation failed", {{"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    config::ValidationReport report;
    if (!config::LoadSessionConfigFile(*options.config_path, session_config, report, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    if (!report.valid) {
      PrintConfigIssues(*options.config_path, report);
      return kExitInputInvalid;
    }
  }
  if (options.output_dir.has_value()) {
    session_config.output_dir = *options.output_dir;
  }
  if (options.model_command.has_value()) {
    session_config.model.command = *options.model_command;
  }

  if (!options.plan_path.has_value() && session_config.model.command.empty()) {
    std::cerr << "error: run requires --plan <plan.json> or a model command "
                 "(--model-cmd or model.command in the config)\n";
    return kExitUsage;
  }

  if (!ValidateInputPath(options.corpus_path, "corpus", error)) {
    logger.Error("corpus path validation failed", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  std::vector<tools::search::CorpusDocument> documents;
  if (!tools::search::LoadCorpusFile(options.corpus_path, documents, error)) {
    logger.Error("failed to load corpus", {{"error", error}});
    std::cerr << "invalid corpus: " << options.corpus_path.string() << "\n  - " << error << '\n';
    return kExitInputInvalid;
  }
  logger.Debug("corpus loaded", {{"documents", std::to_string(documents.size())}});

  std::optional<agent::PlanProposal> static_plan;
  if (options.plan_path.has_value()) {
    if (!ValidateInputPath(*options.plan_path, "plan", error)) {
      logger.Error("plan path validation failed", {{"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    agent::PlanProposal proposal;
    if (!agent::LoadPlanFile(*options.plan_path, proposal, error)) {
      std::cerr << "invalid plan: " << options.plan_path->string() << "\n  - " << error << '\n';
      return kExitInputInvalid;
    }
    static_plan = std::move(proposal);
  }

  tools::search::CorpusSearch search(std::move(documents));
  tools::calculator::ExpressionCalculator calculator;
  std::unique_ptr<tools::model::CommandModel> model;
  if (!session_config.model.command.empty()) {
    model = std::make_unique<tools::model::CommandModel>(session_config.model.command,
                                                         session_config.output_dir);
  }

  agent::Collaborators collaborators;
  collaborators.search = &search;
  collaborators.calculator = &calculator;
  collaborators.planner = model.get();
  collaborators.analyzer = model.get();
  collaborators.assessor = model.get();
  collaborators.drafter = model.get();

  agent::OrchestratorConfig orchestrator_config;
  orchestrator_config.judge = session_config.judge;
  orchestrator_config.dispatcher = session_config.dispatcher;
  orchestrator_config.model = config::ToModelCallConfig(session_config.model);
  orchestrator_config.output_dir = session_config.output_dir;
  orchestrator_config.session_id = options.session_id;

  agent::Orchestrator orchestrator(orchestrator_config, collaborators, logger);
  agent::SessionOutcome outcome;
  bool ok = false;
  {
    ScopedInterruptHandler interrupt_handler;
    ok = orchestrator.Run(options.query, static_plan, &g_cancel_requested, outcome, error);
  }

  if (!ok) {
    std::cerr << "error: session " << outcome.session_id << " failed: " << error << '\n';
    return kExitSessionError;
  }
  if (outcome.answer.has_value()) {
    PrintAnswer(outcome);
    return kExitSuccess;
  }
  if (outcome.review.has_value()) {
    PrintReview(outcome);
    return kExitHumanReview;
  }

  std::cerr << "error: session " << outcome.session_id << " ended without an outcome\n";
  return kExitSessionError;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "validate-config") {
    return CommandValidateConfig(args);
  }

  if (command == "validate-plan") {
    return CommandValidatePlan(args);
  }

  if (command == "run") {
    return CommandRun(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace norma::cli
