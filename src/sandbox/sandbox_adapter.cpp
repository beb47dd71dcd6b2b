#include "sandbox/sandbox_adapter.hpp"

#include "core/fs_utils.hpp"
#include "sandbox/task_script.hpp"

#include <charconv>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace nucleobench::sandbox {

namespace {

constexpr const char* kScriptFileName = "run_inner.sh";
constexpr const char* kAgentConfigFileName = "opencode.json";
constexpr const char* kAgentAuthFileName = "auth.json";
constexpr const char* kConsoleLogFileName = "sandbox_console.log";

std::chrono::milliseconds ElapsedSince(std::chrono::steady_clock::time_point started) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               started);
}

std::chrono::milliseconds RemainingBudget(const TaskRunRequest& request,
                                          std::chrono::steady_clock::time_point started) {
  return request.timeout - ElapsedSince(started);
}

std::optional<int> ParseExitCode(std::string_view text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
    text.remove_suffix(1);
  }
  int value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

} // namespace

const char* ToString(TaskRunStatus status) {
  switch (status) {
  case TaskRunStatus::kCompleted:
    return "completed";
  case TaskRunStatus::kSandboxUnavailable:
    return "sandbox_unavailable";
  case TaskRunStatus::kTimeout:
    return "timeout";
  }
  return "completed";
}

void ScopedSandboxTeardown::Release() {
  if (released_) {
    return;
  }
  released_ = true;
  if (!handle_.active) {
    return;
  }

  std::string error;
  if (!sandbox_.Teardown(handle_, error) && logger_ != nullptr) {
    logger_->Warn("sandbox teardown failed", {{"sandbox", handle_.id}, {"error", error}});
  }
}

SandboxAdapter::SandboxAdapter(ISandbox& sandbox, core::logging::Logger& logger)
    : sandbox_(sandbox), logger_(logger) {}

bool SandboxAdapter::StageInputs(const TaskRunRequest& request, std::string& error) {
  if (!core::EnsureDirectory(request.work_dir, error)) {
    return false;
  }

  TaskScriptOptions script;
  script.prompt = request.prompt;
  script.provider_id = request.agent.provider_id;
  script.model_identifier = request.agent.model_identifier;

  if (!core::WriteTextFile(request.work_dir / kScriptFileName, RenderTaskScript(script), error) ||
      !core::WriteTextFile(
          request.work_dir / kAgentConfigFileName,
          RenderAgentConfigJson(request.agent.provider_id, request.agent.model_identifier),
          error)) {
    return false;
  }

  const fs::path auth_path = request.work_dir / kAgentAuthFileName;
  if (!core::WriteTextFile(
          auth_path, RenderAgentAuthJson(request.agent.provider_id, request.agent.api_key),
          error)) {
    return false;
  }
  std::error_code ec;
  fs::permissions(auth_path, fs::perms::owner_read | fs::perms::owner_write,
                  fs::perm_options::replace, ec);
  if (ec) {
    error = "failed to restrict permissions on '" + auth_path.string() + "': " + ec.message();
    return false;
  }
  return true;
}

bool SandboxAdapter::InjectInputs(const SandboxHandle& handle, const TaskRunRequest& request,
                                  std::chrono::steady_clock::time_point started,
                                  std::string& error) {
  const std::pair<fs::path, const char*> inputs[] = {
      {request.source_bundle_path, kSandboxBundlePath},
      {request.work_dir / kScriptFileName, kSandboxScriptPath},
      {request.work_dir / kAgentConfigFileName, kSandboxAgentConfigPath},
      {request.work_dir / kAgentAuthFileName, kSandboxAgentAuthPath},
  };
  for (const auto& [host_path, sandbox_path] : inputs) {
    if (!sandbox_.CopyIn(handle, host_path, sandbox_path, RemainingBudget(request, started),
                         error)) {
      return false;
    }
  }
  return true;
}

bool SandboxAdapter::ExtractOne(const SandboxHandle& handle, const std::string& sandbox_path,
                                const fs::path& host_path, std::chrono::milliseconds budget,
                                std::string& contents) {
  contents.clear();
  std::string error;
  if (budget <= std::chrono::milliseconds::zero()) {
    logger_.Warn("artifact extraction skipped; task budget exhausted",
                 {{"artifact", sandbox_path}});
    return false;
  }
  if (!sandbox_.CopyOut(handle, sandbox_path, host_path, budget, error) ||
      !core::ReadTextFile(host_path, contents, error)) {
    logger_.Warn("artifact extraction failed", {{"artifact", sandbox_path}, {"error", error}});
    contents.clear();
    return false;
  }
  return true;
}

void SandboxAdapter::ExtractArtifacts(const SandboxHandle& handle, const TaskRunRequest& request,
                                      std::chrono::steady_clock::time_point started,
                                      ExecutionArtifact& artifact) {
  const fs::path& work_dir = request.work_dir;
  (void)ExtractOne(handle, kSandboxDiffPath, work_dir / "solution.diff",
                   RemainingBudget(request, started), artifact.patch_diff);
  (void)ExtractOne(handle, kSandboxBootOutputPath, work_dir / "boot_output.txt",
                   RemainingBudget(request, started), artifact.raw_console_capture);
  (void)ExtractOne(handle, kSandboxAgentLogPath, work_dir / "agent_output.log",
                   RemainingBudget(request, started), artifact.agent_transcript);

  std::string exit_text;
  if (ExtractOne(handle, kSandboxAgentExitPath, work_dir / "agent_exit_code",
                 RemainingBudget(request, started), exit_text)) {
    artifact.agent_exit_code = ParseExitCode(exit_text);
  }
}

TaskRunOutcome SandboxAdapter::Run(const TaskRunRequest& request) {
  const auto started = std::chrono::steady_clock::now();
  TaskRunOutcome outcome;

  std::string error;
  if (!StageInputs(request, error)) {
    outcome.status = TaskRunStatus::kSandboxUnavailable;
    outcome.error = "failed to stage sandbox inputs: " + error;
    outcome.duration = ElapsedSince(started);
    return outcome;
  }

  SandboxRequest sandbox_request;
  sandbox_request.name_hint = request.task.model_id + "-" + request.task.exam_id;
  sandbox_request.image = request.image;
  if (!request.agent.env_var.empty()) {
    sandbox_request.environment[request.agent.env_var] = request.agent.api_key;
  }

  SandboxHandle handle;
  if (!sandbox_.Provision(sandbox_request, handle, error)) {
    outcome.status = TaskRunStatus::kSandboxUnavailable;
    outcome.error = error;
    outcome.duration = ElapsedSince(started);
    return outcome;
  }
  ScopedSandboxTeardown teardown(sandbox_, handle, &logger_);
  logger_.Info("sandbox provisioned", {{"sandbox", handle.id}});

  if (!InjectInputs(handle, request, started, error)) {
    teardown.Release();
    if (RemainingBudget(request, started) <= std::chrono::milliseconds::zero()) {
      logger_.Warn("task budget exhausted during input injection", {{"error", error}});
      outcome.status = TaskRunStatus::kTimeout;
    } else {
      outcome.status = TaskRunStatus::kSandboxUnavailable;
      outcome.error = "failed to inject task inputs: " + error;
    }
    outcome.duration = ElapsedSince(started);
    return outcome;
  }

  const auto remaining = RemainingBudget(request, started);
  if (remaining <= std::chrono::milliseconds::zero()) {
    outcome.status = TaskRunStatus::kTimeout;
    teardown.Release();
    outcome.duration = ElapsedSince(started);
    return outcome;
  }

  SandboxExecResult exec;
  const fs::path console_path = request.work_dir / kConsoleLogFileName;
  if (!sandbox_.Execute(handle, {"bash", kSandboxScriptPath}, remaining, console_path, exec,
                        error)) {
    outcome.status = TaskRunStatus::kSandboxUnavailable;
    outcome.error = "failed to execute task script: " + error;
    teardown.Release();
    outcome.duration = ElapsedSince(started);
    return outcome;
  }

  if (exec.timed_out) {
    logger_.Warn("task script exceeded its budget",
                 {{"timeout_ms", std::to_string(request.timeout.count())}});
    outcome.status = TaskRunStatus::kTimeout;
    teardown.Release();
    outcome.duration = ElapsedSince(started);
    return outcome;
  }

  if (exec.exit_code != 0) {
    logger_.Warn("task script exited non-zero",
                 {{"exit_code", std::to_string(exec.exit_code)},
                  {"console_log", console_path.string()}});
  }

  ExtractArtifacts(handle, request, started, outcome.artifact);
  if (RemainingBudget(request, started) <= std::chrono::milliseconds::zero()) {
    logger_.Warn("task budget exhausted during artifact extraction",
                 {{"timeout_ms", std::to_string(request.timeout.count())}});
    outcome.status = TaskRunStatus::kTimeout;
    outcome.artifact = ExecutionArtifact{};
    teardown.Release();
    outcome.duration = ElapsedSince(started);
    return outcome;
  }

  outcome.status = TaskRunStatus::kCompleted;
  outcome.artifact.wall_clock_duration = exec.wall_time;
  teardown.Release();
  outcome.duration = ElapsedSince(started);
  return outcome;
}

} // namespace nucleobench::sandbox
