#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "sandbox/process_runner.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

using nucleobench::sandbox::ProcessOptions;
using nucleobench::sandbox::ProcessResult;
using nucleobench::sandbox::RunProcess;
using nucleobench::sandbox::RunProcessCapture;
using nucleobench::tests::common::Assert;
using nucleobench::tests::common::AssertContains;
using nucleobench::tests::common::Fail;

int main() {
  const fs::path root =
      nucleobench::tests::common::CreateUniqueTempDir("nucleobench-process-smoke");
  std::string error;

  // Output and stderr are merged, extra env is visible, exit code is kept.
  {
    ProcessOptions options;
    options.argv = {"/bin/sh", "-c", "echo out; echo err 1>&2; echo \"$NB_SMOKE\"; exit 3"};
    options.extra_env["NB_SMOKE"] = "injected";
    std::string output;
    ProcessResult result;
    if (!RunProcessCapture(options, output, result, error)) {
      Fail("capture run failed: " + error);
    }
    Assert(result.exit_code == 3, "exit code mismatch");
    Assert(!result.timed_out, "short command should not time out");
    Assert(!result.Succeeded(), "non-zero exit should not count as success");
    AssertContains(output, "out\n");
    AssertContains(output, "err\n");
    AssertContains(output, "injected\n");
  }

  // Stderr can be dropped.
  {
    ProcessOptions options;
    options.argv = {"/bin/sh", "-c", "echo kept; echo dropped 1>&2"};
    options.merge_stderr = false;
    std::string output;
    ProcessResult result;
    if (!RunProcessCapture(options, output, result, error)) {
      Fail("stderr-discard run failed: " + error);
    }
    Assert(result.Succeeded(), "command should succeed");
    Assert(output == "kept\n", "stderr should not reach the capture");
  }

  // File capture and working directory.
  {
    ProcessOptions options;
    options.argv = {"/bin/sh", "-c", "pwd"};
    options.working_dir = root;
    options.stdout_path = root / "nested" / "pwd.txt";
    ProcessResult result;
    if (!RunProcess(options, result, error)) {
      Fail("file capture run failed: " + error);
    }
    const std::string text = nucleobench::tests::common::ReadFileToString(options.stdout_path);
    AssertContains(text, root.filename().string());
  }

  // The wall limit kills the whole process group.
  {
    ProcessOptions options;
    options.argv = {"/bin/sh", "-c", "sleep 30 & sleep 30; wait"};
    options.wall_limit = std::chrono::milliseconds(200);
    ProcessResult result;
    const auto started = std::chrono::steady_clock::now();
    if (!RunProcess(options, result, error)) {
      Fail("timeout run failed: " + error);
    }
    const auto elapsed = std::chrono::steady_clock::now() - started;
    Assert(result.timed_out, "long command should time out");
    Assert(elapsed < std::chrono::seconds(10), "timeout should be enforced promptly");
    Assert(result.wall_time >= std::chrono::milliseconds(200), "wall time below limit");
  }

  // A missing binary is a launch failure, not an exit code.
  {
    ProcessOptions options;
    options.argv = {"nucleobench-definitely-missing-binary"};
    ProcessResult result;
    Assert(!RunProcess(options, result, error), "missing binary should fail to launch");
    AssertContains(error, "exec");
  }

  {
    ProcessOptions options;
    ProcessResult result;
    Assert(!RunProcess(options, result, error), "empty argv should fail");
  }

  nucleobench::tests::common::RemovePathBestEffort(root);
  std::cout << "process_runner_smoke: ok\n";
  return 0;
}
