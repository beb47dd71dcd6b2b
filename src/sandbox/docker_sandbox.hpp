#pragma once

#include "core/logging/logger.hpp"
#include "sandbox/sandbox.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace nucleobench::sandbox {

struct DockerSandboxConfig {
  std::string docker_binary = "docker";
  // Upper limit for every control command (create, cp, rm). Copies are further
  // capped by the caller's remaining budget; task scripts run under that
  // budget alone.
  std::chrono::milliseconds control_timeout = std::chrono::seconds(60);
};

// `bench-<hint>` with `/` and `.` replaced by `-`.
std::string SanitizeContainerName(std::string_view name_hint);

// Containers driven through the docker CLI. One long-lived container per
// provision (`sleep infinity`), commands run through `docker exec`.
class DockerSandbox final : public ISandbox {
public:
  explicit DockerSandbox(DockerSandboxConfig config = {},
                         core::logging::Logger* logger = nullptr);

  bool Provision(const SandboxRequest& request, SandboxHandle& handle,
                 std::string& error) override;
  bool CopyIn(const SandboxHandle& handle, const std::filesystem::path& host_path,
              const std::string& sandbox_path, std::chrono::milliseconds timeout,
              std::string& error) override;
  bool Execute(const SandboxHandle& handle, const std::vector<std::string>& command,
               std::chrono::milliseconds timeout, const std::filesystem::path& capture_path,
               SandboxExecResult& result, std::string& error) override;
  bool CopyOut(const SandboxHandle& handle, const std::string& sandbox_path,
               const std::filesystem::path& host_path, std::chrono::milliseconds timeout,
               std::string& error) override;
  bool Teardown(SandboxHandle& handle, std::string& error) override;

  // `docker image inspect`. Returns false with `error` set when the image is
  // missing or the docker client cannot be run.
  bool ImageExists(const std::string& image, std::string& error) const;

  // `docker build -t <image> -f <dockerfile> <context>`, output streamed to
  // the terminal.
  bool BuildImage(const std::string& image, const std::filesystem::path& dockerfile,
                  const std::filesystem::path& context_dir, std::chrono::milliseconds timeout,
                  std::string& error) const;

private:
  bool RunControl(const std::vector<std::string>& args, std::chrono::milliseconds limit,
                  std::string& output, std::string& error) const;
  std::chrono::milliseconds ControlLimit(std::chrono::milliseconds budget) const;

  DockerSandboxConfig config_;
  core::logging::Logger* logger_ = nullptr;
};

} // namespace nucleobench::sandbox
