#include "cli/router.hpp"

#include "config/model_catalog.hpp"
#include "core/errors/eval_error.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/time_utils.hpp"
#include "credentials/credential_resolver.hpp"
#include "exams/exam_catalog.hpp"
#include "matrix/task_matrix.hpp"
#include "prompts/prompt_source.hpp"
#include "results/result_store.hpp"
#include "sandbox/docker_sandbox.hpp"
#include "sandbox/process_runner.hpp"
#include "sandbox/sandbox_adapter.hpp"
#include "sandbox/task_script.hpp"
#include "scheduler/evaluation_scheduler.hpp"
#include "scheduler/run_summary.hpp"

#include <charconv>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace nucleobench::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfiguration =
    core::errors::ToInt(core::errors::ExitCode::kConfigurationError);
constexpr int kExitMissingCredential =
    core::errors::ToInt(core::errors::ExitCode::kMissingCredential);
constexpr int kExitSandboxImageUnavailable =
    core::errors::ToInt(core::errors::ExitCode::kSandboxImageUnavailable);

constexpr auto kImageBuildTimeout = std::chrono::seconds(600);
constexpr auto kDryRunTimeout = std::chrono::seconds(60);
constexpr std::string_view kDryRunPrompt = "Reply with just: OK";

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  nucleobench run [--models <file>] [--exams <dir>] [--results <dir>] "
         "[--secrets <file>] [--timeout <seconds>] [--image <name>] [--build] [--no-cache] "
         "[--model <name>] [--exam <name>] [--log-level <debug|info|warn|error>]\n"
      << "  nucleobench dry-run --model <name> [--models <file>] [--secrets <file>]\n"
      << "  nucleobench summary [--results <dir>]\n"
      << "  nucleobench version\n";
}

struct DryRunOptions {
  fs::path models_path = "models.json";
  fs::path secrets_path = ".env";
  std::string model_name;
};

struct SummaryOptions {
  fs::path results_dir = "results";
};

bool ReadFlagValue(const std::vector<std::string_view>& args, std::size_t& i,
                   std::string_view flag, std::string& value, std::string& error) {
  if (i + 1 >= args.size() || args[i + 1].empty()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = std::string(args[i + 1]);
  ++i;
  return true;
}

// One week. Budgets are later held in milliseconds.
constexpr long long kMaxTimeoutSeconds = 7LL * 24 * 60 * 60;

bool ParseTimeoutSeconds(std::string_view raw, std::chrono::seconds& timeout,
                         std::string& error) {
  long long seconds = 0;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), seconds);
  if (ec != std::errc{} || ptr != raw.data() + raw.size() || seconds <= 0) {
    error = "invalid --timeout '" + std::string(raw) + "' (expected positive integer seconds)";
    return false;
  }
  if (seconds > kMaxTimeoutSeconds) {
    error = "invalid --timeout '" + std::string(raw) + "' (maximum is " +
            std::to_string(kMaxTimeoutSeconds) + " seconds)";
    return false;
  }
  timeout = std::chrono::seconds(seconds);
  return true;
}

// Parse `run` args: flags only, no positionals. Unknown flags are usage
// errors.
bool ParseRunOptions(const std::vector<std::string_view>& args, RunOptions& options,
                     std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string value;

    if (token == "--build") {
      options.build_image = true;
      continue;
    }
    if (token == "--no-cache") {
      options.bypass_cache = true;
      continue;
    }
    if (token == "--models") {
      if (!ReadFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.models_path = value;
      continue;
    }
    if (token == "--exams") {
      if (!ReadFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.exams_dir = value;
      continue;
    }
    if (token == "--results") {
      if (!ReadFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.results_dir = value;
      continue;
    }
    if (token == "--secrets") {
      if (!ReadFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.secrets_path = value;
      continue;
    }
    if (token == "--image") {
      if (!ReadFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.image = value;
      continue;
    }
    if (token == "--model") {
      if (!ReadFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.model_filter = value;
      continue;
    }
    if (token == "--exam") {
      if (!ReadFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.exam_filter = value;
      continue;
    }
    if (token == "--timeout") {
      if (!ReadFlagValue(args, i, token, value, error) ||
          !ParseTimeoutSeconds(value, options.timeout, error)) {
        return false;
      }
      continue;
    }
    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level";
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(args[i + 1], parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      ++i;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    error = "run does not accept positional arguments: " + std::string(token);
    return false;
  }
  return true;
}

bool ParseDryRunOptions(const std::vector<std::string_view>& args, DryRunOptions& options,
                        std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string value;
    if (token == "--model") {
      if (!ReadFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.model_name = value;
      continue;
    }
    if (token == "--models") {
      if (!ReadFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.models_path = value;
      continue;
    }
    if (token == "--secrets") {
      if (!ReadFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.secrets_path = value;
      continue;
    }
    error = "unknown option: " + std::string(token);
    return false;
  }

  if (options.model_name.empty()) {
    error = "dry-run requires --model <name>";
    return false;
  }
  return true;
}

bool ParseSummaryOptions(const std::vector<std::string_view>& args, SummaryOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string value;
    if (token == "--results") {
      if (!ReadFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.results_dir = value;
      continue;
    }
    error = "unknown option: " + std::string(token);
    return false;
  }
  return true;
}

int ExitCodeFor(const core::errors::EvalError& error) {
  switch (error.code) {
  case core::errors::EvalErrorCode::kConfiguration:
    return kExitConfiguration;
  case core::errors::EvalErrorCode::kMissingCredential:
    return kExitMissingCredential;
  case core::errors::EvalErrorCode::kSandboxUnavailable:
    return kExitSandboxImageUnavailable;
  case core::errors::EvalErrorCode::kNone:
    return kExitSuccess;
  case core::errors::EvalErrorCode::kTimeout:
  case core::errors::EvalErrorCode::kPromptUnavailable:
  case core::errors::EvalErrorCode::kArtifactExtraction:
    return kExitFailure;
  }
  return kExitFailure;
}

std::string JoinNames(const std::vector<std::string>& names) {
  std::string joined;
  for (const auto& name : names) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += name;
  }
  return joined;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "nucleobench 0.1.0\n";
  return kExitSuccess;
}

int CommandRun(const std::vector<std::string_view>& args) {
  RunOptions options;
  std::string error;
  if (!ParseRunOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  return ExecuteRun(options);
}

int CommandDryRun(const std::vector<std::string_view>& args) {
  DryRunOptions options;
  std::string error;
  if (!ParseDryRunOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  std::vector<config::ModelSpec> models;
  if (!config::LoadModelCatalogFile(options.models_path, models, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfiguration;
  }

  const config::ModelSpec* model = nullptr;
  for (const auto& candidate : models) {
    if (candidate.name == options.model_name) {
      model = &candidate;
      break;
    }
  }
  if (model == nullptr) {
    std::cerr << "error: model '" << options.model_name << "' not found in config\n";
    return kExitConfiguration;
  }

  const credentials::CredentialResolver resolver(options.secrets_path,
                                                 credentials::ProcessEnvLookup());
  credentials::ResolvedCredential credential;
  core::errors::EvalError eval_error;
  if (!resolver.Resolve(model->provider, credential, eval_error)) {
    std::cerr << "error: " << core::errors::FormatEvalError(eval_error) << '\n';
    return ExitCodeFor(eval_error);
  }

  const std::string agent_model = credential.provider_id + "/" + model->model_identifier;
  std::cout << "model: " << model->name << '\n';
  std::cout << "provider: " << credential.provider << " (" << credential.provider_id << ")\n";
  std::cout << "env_var: " << credential.env_var << '\n';
  std::cout << "key: " << credentials::MaskSecret(credential.value) << " (from "
            << credential.source << ")\n";
  std::cout << "agent_model: " << agent_model << '\n';
  std::cout << "\nopencode.json:\n"
            << sandbox::RenderAgentConfigJson(credential.provider_id, model->model_identifier);
  std::cout << "\nauth.json:\n"
            << sandbox::RenderAgentAuthJson(credential.provider_id,
                                            credentials::MaskSecret(credential.value));

  sandbox::ProcessOptions process;
  process.argv = {"opencode", "run", std::string(kDryRunPrompt), "--model", agent_model};
  process.extra_env[credential.env_var] = credential.value;
  process.wall_limit = kDryRunTimeout;

  std::string output;
  sandbox::ProcessResult result;
  std::cout << "\nrunning agent smoke prompt...\n";
  if (!sandbox::RunProcessCapture(process, output, result, error)) {
    std::cerr << "error: failed to run opencode: " << error << '\n';
    return kExitFailure;
  }

  std::cout << "--- agent output ---\n" << output;
  if (!output.empty() && output.back() != '\n') {
    std::cout << '\n';
  }
  std::cout << "--- end agent output ---\n";
  if (!result.Succeeded()) {
    std::cerr << "error: agent smoke prompt failed (" << sandbox::DescribeProcessResult(result)
              << ")\n";
    return kExitFailure;
  }
  std::cout << "dry-run ok: " << model->name << '\n';
  return kExitSuccess;
}

int CommandSummary(const std::vector<std::string_view>& args) {
  SummaryOptions options;
  std::string error;
  if (!ParseSummaryOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  std::error_code ec;
  if (!fs::is_directory(options.results_dir, ec) || ec) {
    std::cerr << "error: results directory not found: " << options.results_dir.string() << '\n';
    return kExitConfiguration;
  }

  const results::ResultStore store(options.results_dir);
  std::vector<results::Result> records;
  std::vector<std::string> warnings;
  if (!store.ListAll(records, warnings, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  for (const auto& warning : warnings) {
    std::cerr << "warning: " << warning << '\n';
  }

  scheduler::PrintRunSummary(scheduler::SummarizeResults(records), std::cout);
  return kExitSuccess;
}

} // namespace

int ExecuteRun(const RunOptions& options) {
  core::logging::Logger logger(options.log_level);
  logger.SetRunId(core::MakeRunId(std::chrono::system_clock::now()));

  std::string error;
  std::vector<config::ModelSpec> models;
  if (!config::LoadModelCatalogFile(options.models_path, models, error)) {
    logger.Error("model configuration invalid", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitConfiguration;
  }

  std::vector<exams::ExamSpec> exam_specs;
  if (!exams::DiscoverExams(options.exams_dir, exam_specs, error)) {
    logger.Error("exam discovery failed", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitConfiguration;
  }

  matrix::TaskFilter filter;
  filter.model_name = options.model_filter;
  filter.exam_name = options.exam_filter;
  matrix::TaskMatrix task_matrix;
  if (!matrix::BuildTaskMatrix(models, exam_specs, filter, task_matrix, error)) {
    logger.Error("task matrix invalid", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitConfiguration;
  }

  std::vector<std::string> model_names;
  for (const auto& model : task_matrix.models) {
    model_names.push_back(model.name);
  }
  std::vector<std::string> exam_names;
  for (const auto& exam : task_matrix.exams) {
    exam_names.push_back(exam.name);
  }
  std::cout << "models: " << JoinNames(model_names) << '\n';
  std::cout << "exams: " << JoinNames(exam_names) << '\n';
  std::cout << "tasks: " << task_matrix.tasks.size() << '\n';

  const credentials::CredentialResolver resolver(options.secrets_path,
                                                 credentials::ProcessEnvLookup());
  std::map<std::string, credentials::ResolvedCredential> resolved;
  core::errors::EvalError eval_error;
  if (!resolver.ResolveAll(task_matrix.tasks, task_matrix.models, resolved, eval_error)) {
    logger.Error("credential pre-flight failed",
                 {{"code", core::errors::ToStableErrorCode(eval_error.code)},
                  {"error", eval_error.message}});
    std::cerr << "error: " << core::errors::FormatEvalError(eval_error) << '\n';
    return ExitCodeFor(eval_error);
  }
  for (const auto& [provider, credential] : resolved) {
    logger.Info("credential resolved", {{"provider", provider},
                                        {"env_var", credential.env_var},
                                        {"source", credential.source}});
  }

  sandbox::DockerSandbox docker(sandbox::DockerSandboxConfig{}, &logger);
  if (options.build_image) {
    std::cout << "building image " << options.image << "...\n";
    if (!docker.BuildImage(options.image, options.dockerfile, options.docker_context,
                           kImageBuildTimeout, error)) {
      logger.Error("image build failed", {{"image", options.image}, {"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitSandboxImageUnavailable;
    }
  }
  if (!docker.ImageExists(options.image, error)) {
    logger.Error("sandbox image unavailable", {{"image", options.image}, {"error", error}});
    std::cerr << "error: " << error << '\n'
              << "hint: run 'nucleobench run --build' to build it\n";
    return kExitSandboxImageUnavailable;
  }

  const results::ResultStore store(options.results_dir);
  sandbox::SandboxAdapter adapter(docker, logger);
  prompts::PdfPromptSource prompt_source;

  scheduler::SchedulerOptions scheduler_options;
  scheduler_options.image = options.image;
  scheduler_options.timeout = options.timeout;
  scheduler_options.bypass_cache = options.bypass_cache;

  scheduler::EvaluationScheduler evaluation(scheduler_options, store, adapter, prompt_source,
                                            logger);
  const scheduler::RunSummary summary = evaluation.Run(task_matrix, resolved);
  scheduler::PrintRunSummary(summary, std::cout);
  return kExitSuccess;
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

  if (command == "run") {
    return CommandRun(args);
  }

  if (command == "dry-run") {
    return CommandDryRun(args);
  }

  if (command == "summary") {
    return CommandSummary(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace nucleobench::cli
