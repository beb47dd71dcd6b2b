#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace nucleobench::sandbox {

// What a fresh sandbox needs at creation time.
struct SandboxRequest {
  // Human-readable seed for the sandbox name, e.g. "<model>-<exam>".
  std::string name_hint;
  std::string image;
  // Variables visible to every command run in the sandbox. Values never
  // appear on a command line.
  std::map<std::string, std::string> environment;
};

struct SandboxHandle {
  std::string id;
  bool active = false;
};

struct SandboxExecResult {
  int exit_code = -1;
  bool timed_out = false;
  std::chrono::milliseconds wall_time{0};
};

// Isolated, disposable execution environment for one task.
//
// Contract:
// - Provision yields a fresh environment; nothing survives from earlier tasks
// - Execute enforces `timeout` by force; a timed-out command is reported via
//   `SandboxExecResult::timed_out`, not as a failure
// - CopyIn and CopyOut give up once `timeout` elapses
// - Teardown is idempotent and must be safe on a partially provisioned handle
class ISandbox {
public:
  virtual ~ISandbox() = default;

  virtual bool Provision(const SandboxRequest& request, SandboxHandle& handle,
                         std::string& error) = 0;

  // Copies a host file into the sandbox.
  virtual bool CopyIn(const SandboxHandle& handle, const std::filesystem::path& host_path,
                      const std::string& sandbox_path, std::chrono::milliseconds timeout,
                      std::string& error) = 0;

  // Runs `command` inside the sandbox with stdout and stderr merged into
  // `capture_path` on the host.
  virtual bool Execute(const SandboxHandle& handle, const std::vector<std::string>& command,
                       std::chrono::milliseconds timeout,
                       const std::filesystem::path& capture_path, SandboxExecResult& result,
                       std::string& error) = 0;

  // Copies a sandbox file out to the host.
  virtual bool CopyOut(const SandboxHandle& handle, const std::string& sandbox_path,
                       const std::filesystem::path& host_path, std::chrono::milliseconds timeout,
                       std::string& error) = 0;

  virtual bool Teardown(SandboxHandle& handle, std::string& error) = 0;
};

} // namespace nucleobench::sandbox
