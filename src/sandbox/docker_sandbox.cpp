#include "sandbox/docker_sandbox.hpp"

#include "sandbox/process_runner.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace nucleobench::sandbox {

namespace {

std::string TrimTrailing(std::string text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.pop_back();
  }
  return text;
}

std::string ContainerPath(const SandboxHandle& handle, const std::string& sandbox_path) {
  return handle.id + ":" + sandbox_path;
}

} // namespace

std::string SanitizeContainerName(std::string_view name_hint) {
  std::string name = "bench-";
  name.append(name_hint);
  std::replace(name.begin(), name.end(), '/', '-');
  std::replace(name.begin(), name.end(), '.', '-');
  return name;
}

DockerSandbox::DockerSandbox(DockerSandboxConfig config, core::logging::Logger* logger)
    : config_(std::move(config)), logger_(logger) {}

std::chrono::milliseconds DockerSandbox::ControlLimit(std::chrono::milliseconds budget) const {
  return std::min(config_.control_timeout, budget);
}

bool DockerSandbox::RunControl(const std::vector<std::string>& args,
                               std::chrono::milliseconds limit, std::string& output,
                               std::string& error) const {
  if (limit <= std::chrono::milliseconds::zero()) {
    error = config_.docker_binary + " " + args.front() + " skipped: no time budget left";
    return false;
  }

  ProcessOptions options;
  options.argv.push_back(config_.docker_binary);
  options.argv.insert(options.argv.end(), args.begin(), args.end());
  options.wall_limit = limit;

  ProcessResult result;
  if (!RunProcessCapture(options, output, result, error)) {
    error = "failed to run " + config_.docker_binary + ": " + error;
    return false;
  }
  if (!result.Succeeded()) {
    error = config_.docker_binary + " " + args.front() + " failed (" +
            DescribeProcessResult(result) + ")";
    const std::string detail = TrimTrailing(output);
    if (!detail.empty()) {
      error += ": " + detail;
    }
    return false;
  }
  return true;
}

bool DockerSandbox::Provision(const SandboxRequest& request, SandboxHandle& handle,
                              std::string& error) {
  error.clear();
  handle = SandboxHandle{};

  const std::string name =
      SanitizeContainerName(request.name_hint) + "-" + std::to_string(getpid());

  // Leftover from an interrupted run with the same name; absence is fine.
  std::string output;
  std::string stale_error;
  if (!RunControl({"rm", "-f", name}, config_.control_timeout, output, stale_error) &&
      logger_ != nullptr) {
    logger_->Debug("stale container removal failed", {{"container", name}, {"error", stale_error}});
  }

  std::vector<std::string> args = {"run", "-d", "--name", name, "-e", "AUTOCORR=1"};
  for (const auto& [key, value] : request.environment) {
    (void)value;
    args.push_back("-e");
    args.push_back(key);
  }
  args.push_back(request.image);
  args.push_back("sleep");
  args.push_back("infinity");

  ProcessOptions options;
  options.argv.push_back(config_.docker_binary);
  options.argv.insert(options.argv.end(), args.begin(), args.end());
  options.extra_env = request.environment;
  options.wall_limit = config_.control_timeout;

  ProcessResult result;
  if (!RunProcessCapture(options, output, result, error)) {
    error = "failed to run " + config_.docker_binary + ": " + error;
    return false;
  }
  if (!result.Succeeded()) {
    error = "container creation failed (" + DescribeProcessResult(result) + ")";
    const std::string detail = TrimTrailing(output);
    if (!detail.empty()) {
      error += ": " + detail;
    }
    // A timed-out create may still have left a container behind.
    std::string cleanup_error;
    (void)RunControl({"rm", "-f", name}, config_.control_timeout, output, cleanup_error);
    return false;
  }

  handle.id = name;
  handle.active = true;
  if (logger_ != nullptr) {
    logger_->Debug("container provisioned", {{"container", name}, {"image", request.image}});
  }
  return true;
}

bool DockerSandbox::CopyIn(const SandboxHandle& handle, const std::filesystem::path& host_path,
                           const std::string& sandbox_path, std::chrono::milliseconds timeout,
                           std::string& error) {
  std::string output;
  return RunControl({"cp", host_path.string(), ContainerPath(handle, sandbox_path)},
                    ControlLimit(timeout), output, error);
}

bool DockerSandbox::Execute(const SandboxHandle& handle, const std::vector<std::string>& command,
                            std::chrono::milliseconds timeout,
                            const std::filesystem::path& capture_path,
                            SandboxExecResult& result, std::string& error) {
  result = SandboxExecResult{};
  error.clear();

  ProcessOptions options;
  options.argv = {config_.docker_binary, "exec", handle.id};
  options.argv.insert(options.argv.end(), command.begin(), command.end());
  options.stdout_path = capture_path;
  options.wall_limit = timeout;

  ProcessResult process;
  if (!RunProcess(options, process, error)) {
    error = "failed to run " + config_.docker_binary + " exec: " + error;
    return false;
  }

  result.exit_code = process.exit_code;
  result.timed_out = process.timed_out;
  result.wall_time = process.wall_time;
  return true;
}

bool DockerSandbox::CopyOut(const SandboxHandle& handle, const std::string& sandbox_path,
                            const std::filesystem::path& host_path,
                            std::chrono::milliseconds timeout, std::string& error) {
  std::string output;
  return RunControl({"cp", ContainerPath(handle, sandbox_path), host_path.string()},
                    ControlLimit(timeout), output, error);
}

bool DockerSandbox::Teardown(SandboxHandle& handle, std::string& error) {
  error.clear();
  if (!handle.active || handle.id.empty()) {
    handle.active = false;
    return true;
  }

  std::string output;
  if (!RunControl({"rm", "-f", handle.id}, config_.control_timeout, output, error)) {
    return false;
  }
  if (logger_ != nullptr) {
    logger_->Debug("container removed", {{"container", handle.id}});
  }
  handle.active = false;
  return true;
}

bool DockerSandbox::ImageExists(const std::string& image, std::string& error) const {
  std::string output;
  if (!RunControl({"image", "inspect", image}, config_.control_timeout, output, error)) {
    error = "image '" + image + "' is not available: " + error;
    return false;
  }
  return true;
}

bool DockerSandbox::BuildImage(const std::string& image, const std::filesystem::path& dockerfile,
                               const std::filesystem::path& context_dir,
                               std::chrono::milliseconds timeout, std::string& error) const {
  ProcessOptions options;
  options.argv = {config_.docker_binary, "build",           "-t",
                  image,                 "-f",              dockerfile.string(),
                  context_dir.string()};
  options.inherit_output = true;
  options.wall_limit = timeout;

  ProcessResult result;
  if (!RunProcess(options, result, error)) {
    error = "failed to run " + config_.docker_binary + " build: " + error;
    return false;
  }
  if (!result.Succeeded()) {
    error = "image build failed (" + DescribeProcessResult(result) + ")";
    return false;
  }
  return true;
}

} // namespace nucleobench::sandbox
