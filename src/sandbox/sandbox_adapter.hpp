#pragma once

#include "core/logging/logger.hpp"
#include "matrix/task.hpp"
#include "sandbox/sandbox.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace nucleobench::sandbox {

// Agent identity and credential for one task.
struct AgentLaunch {
  std::string provider_id;
  std::string model_identifier;
  std::string env_var;
  std::string api_key;
};

struct TaskRunRequest {
  matrix::Task task;
  std::string image;
  std::filesystem::path source_bundle_path;
  std::string prompt;
  AgentLaunch agent;
  std::chrono::milliseconds timeout{std::chrono::seconds(600)};
  // Host scratch directory for rendered inputs and extracted artifacts.
  std::filesystem::path work_dir;
};

// Raw evidence from one completed sandbox execution. Fields whose extraction
// failed stay empty.
struct ExecutionArtifact {
  std::string raw_console_capture;
  std::string patch_diff;
  std::string agent_transcript;
  std::optional<int> agent_exit_code;
  std::chrono::milliseconds wall_clock_duration{0};
};

enum class TaskRunStatus {
  kCompleted,
  kSandboxUnavailable,
  kTimeout,
};

const char* ToString(TaskRunStatus status);

struct TaskRunOutcome {
  TaskRunStatus status = TaskRunStatus::kCompleted;
  ExecutionArtifact artifact;
  // Set for kSandboxUnavailable.
  std::string error;
  // Wall-clock time of the whole attempt, provisioning and teardown included.
  std::chrono::milliseconds duration{0};
};

// Tears the sandbox down when the owning scope exits, whatever the path.
class ScopedSandboxTeardown {
public:
  ScopedSandboxTeardown(ISandbox& sandbox, SandboxHandle& handle,
                        core::logging::Logger* logger = nullptr)
      : sandbox_(sandbox), handle_(handle), logger_(logger) {}

  ~ScopedSandboxTeardown() {
    Release();
  }

  // Tears down now instead of at scope exit. Safe to call more than once.
  void Release();

  ScopedSandboxTeardown(const ScopedSandboxTeardown&) = delete;
  ScopedSandboxTeardown& operator=(const ScopedSandboxTeardown&) = delete;

private:
  ISandbox& sandbox_;
  SandboxHandle& handle_;
  core::logging::Logger* logger_ = nullptr;
  bool released_ = false;
};

// Runs one task in a fresh sandbox: provision, inject inputs, execute the
// task script under the remaining budget, extract artifacts, tear down.
// Injection, execution and extraction all draw on the one task budget; a run
// that exhausts it is reported as kTimeout with no artifact.
//
// The agent failing is not an outcome here; the script always goes on to
// build and boot. Artifact extraction is best effort.
class SandboxAdapter {
public:
  SandboxAdapter(ISandbox& sandbox, core::logging::Logger& logger);

  TaskRunOutcome Run(const TaskRunRequest& request);

private:
  bool StageInputs(const TaskRunRequest& request, std::string& error);
  bool InjectInputs(const SandboxHandle& handle, const TaskRunRequest& request,
                    std::chrono::steady_clock::time_point started, std::string& error);
  void ExtractArtifacts(const SandboxHandle& handle, const TaskRunRequest& request,
                        std::chrono::steady_clock::time_point started,
                        ExecutionArtifact& artifact);
  bool ExtractOne(const SandboxHandle& handle, const std::string& sandbox_path,
                  const std::filesystem::path& host_path, std::chrono::milliseconds budget,
                  std::string& contents);

  ISandbox& sandbox_;
  core::logging::Logger& logger_;
};

} // namespace nucleobench::sandbox
