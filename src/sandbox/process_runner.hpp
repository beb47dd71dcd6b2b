#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace nucleobench::sandbox {

// One child process invocation.
//
// Output routing:
// - `stdout_path` set: stdout is written (truncated) to that file
// - otherwise `inherit_output` decides between the parent's stdout and
//   /dev/null
// - stderr follows stdout when `merge_stderr`, otherwise it is discarded
//   (or inherited with `inherit_output`)
struct ProcessOptions {
  std::vector<std::string> argv;
  std::filesystem::path working_dir;
  std::filesystem::path stdout_path;
  bool inherit_output = false;
  bool merge_stderr = true;
  // Added to (or overriding) the parent's environment for the child only.
  std::map<std::string, std::string> extra_env;
  // 0 disables the limit.
  std::chrono::milliseconds wall_limit{0};
};

struct ProcessResult {
  int exit_code = -1;
  int signal = 0;
  bool timed_out = false;
  std::chrono::milliseconds wall_time{0};

  bool Succeeded() const {
    return !timed_out && signal == 0 && exit_code == 0;
  }
};

// Runs `options.argv` (argv[0] resolved through PATH) in its own process
// group and waits for it. When the wall limit expires the whole group is
// killed with SIGKILL and `timed_out` is set; this is not an error.
//
// Returns false only when the child could not be started (fork/exec/redirect
// failures), with `error` describing the failing step.
bool RunProcess(const ProcessOptions& options, ProcessResult& result, std::string& error);

// Same as RunProcess, capturing the routed output into `output`.
bool RunProcessCapture(ProcessOptions options, std::string& output, ProcessResult& result,
                       std::string& error);

// "exit code N", "killed by signal N" or "timed out after Nms".
std::string DescribeProcessResult(const ProcessResult& result);

} // namespace nucleobench::sandbox
