#include "sandbox/process_runner.hpp"

#include "core/fs_utils.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <thread>

extern char** environ;

namespace fs = std::filesystem;

namespace nucleobench::sandbox {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);

std::string ErrnoText(int err) {
  char buf[256] = {};
  // GNU strerror_r may return a static string instead of filling `buf`.
  return std::string(strerror_r(err, buf, sizeof(buf)));
}

// argv/envp storage is built before fork so the child only performs
// async-signal-safe calls.
std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& extra_env) {
  std::vector<std::string> env;
  for (char** cursor = environ; cursor != nullptr && *cursor != nullptr; ++cursor) {
    const std::string entry(*cursor);
    const std::size_t eq = entry.find('=');
    const std::string name = eq == std::string::npos ? entry : entry.substr(0, eq);
    if (extra_env.find(name) == extra_env.end()) {
      env.push_back(entry);
    }
  }
  for (const auto& [name, value] : extra_env) {
    env.push_back(name + "=" + value);
  }
  return env;
}

std::vector<char*> ToPointerArray(std::vector<std::string>& storage) {
  std::vector<char*> pointers;
  pointers.reserve(storage.size() + 1);
  for (auto& item : storage) {
    pointers.push_back(item.data());
  }
  pointers.push_back(nullptr);
  return pointers;
}

// Reports `step` and errno through the status pipe, then exits.
[[noreturn]] void ChildFail(int status_fd, int step, int err) {
  const int payload[2] = {step, err};
  ssize_t ignored = write(status_fd, payload, sizeof(payload));
  (void)ignored;
  _exit(127);
}

enum ChildStep {
  kStepSetsid = 1,
  kStepOpenStdout,
  kStepOpenNull,
  kStepDup,
  kStepChdir,
  kStepExec,
};

const char* ChildStepName(int step) {
  switch (step) {
  case kStepSetsid:
    return "setsid";
  case kStepOpenStdout:
    return "open stdout";
  case kStepOpenNull:
    return "open /dev/null";
  case kStepDup:
    return "redirect";
  case kStepChdir:
    return "chdir";
  case kStepExec:
    return "exec";
  }
  return "child setup";
}

} // namespace

bool RunProcess(const ProcessOptions& options, ProcessResult& result, std::string& error) {
  result = ProcessResult{};
  error.clear();

  if (options.argv.empty() || options.argv.front().empty()) {
    error = "process argv cannot be empty";
    return false;
  }
  if (!options.stdout_path.empty() && !core::EnsureParentDirectory(options.stdout_path, error)) {
    return false;
  }

  std::vector<std::string> argv_storage = options.argv;
  std::vector<std::string> env_storage = BuildEnvironment(options.extra_env);
  std::vector<char*> argv = ToPointerArray(argv_storage);
  std::vector<char*> envp = ToPointerArray(env_storage);
  const std::string stdout_path = options.stdout_path.string();
  const std::string working_dir = options.working_dir.string();

  int status_pipe[2] = {-1, -1};
  if (pipe2(status_pipe, O_CLOEXEC) == -1) {
    error = "pipe2: " + ErrnoText(errno);
    return false;
  }

  const auto started = std::chrono::steady_clock::now();
  const pid_t pid = fork();
  if (pid == -1) {
    error = "fork: " + ErrnoText(errno);
    close(status_pipe[0]);
    close(status_pipe[1]);
    return false;
  }

  if (pid == 0) {
    close(status_pipe[0]);
    // Own process group so a timeout can kill every descendant at once.
    if (setsid() == -1) {
      ChildFail(status_pipe[1], kStepSetsid, errno);
    }

    int out_fd = -1;
    if (!stdout_path.empty()) {
      out_fd = open(stdout_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
      if (out_fd == -1) {
        ChildFail(status_pipe[1], kStepOpenStdout, errno);
      }
    } else if (!options.inherit_output) {
      out_fd = open("/dev/null", O_WRONLY | O_CLOEXEC);
      if (out_fd == -1) {
        ChildFail(status_pipe[1], kStepOpenNull, errno);
      }
    }

    int null_in = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (null_in == -1) {
      ChildFail(status_pipe[1], kStepOpenNull, errno);
    }
    if (dup2(null_in, STDIN_FILENO) == -1) {
      ChildFail(status_pipe[1], kStepDup, errno);
    }

    if (out_fd != -1 && dup2(out_fd, STDOUT_FILENO) == -1) {
      ChildFail(status_pipe[1], kStepDup, errno);
    }
    if (options.merge_stderr) {
      if (out_fd != -1 && dup2(out_fd, STDERR_FILENO) == -1) {
        ChildFail(status_pipe[1], kStepDup, errno);
      }
    } else if (!options.inherit_output) {
      const int null_err = open("/dev/null", O_WRONLY | O_CLOEXEC);
      if (null_err == -1 || dup2(null_err, STDERR_FILENO) == -1) {
        ChildFail(status_pipe[1], kStepDup, errno);
      }
    }

    if (!working_dir.empty() && chdir(working_dir.c_str()) == -1) {
      ChildFail(status_pipe[1], kStepChdir, errno);
    }

    execvpe(argv[0], argv.data(), envp.data());
    ChildFail(status_pipe[1], kStepExec, errno);
  }

  close(status_pipe[1]);
  int failure[2] = {0, 0};
  ssize_t read_bytes = 0;
  do {
    read_bytes = read(status_pipe[0], failure, sizeof(failure));
  } while (read_bytes == -1 && errno == EINTR);
  close(status_pipe[0]);

  if (read_bytes == static_cast<ssize_t>(sizeof(failure))) {
    int ignored_status = 0;
    (void)waitpid(pid, &ignored_status, 0);
    error = std::string(ChildStepName(failure[0])) + " '" + options.argv.front() +
            "': " + ErrnoText(failure[1]);
    return false;
  }

  auto elapsed = [&started]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 started);
  };

  int child_status = 0;
  bool exited = false;
  while (options.wall_limit.count() == 0 || elapsed() < options.wall_limit) {
    const pid_t ret = waitpid(pid, &child_status, WNOHANG);
    if (ret == -1) {
      if (errno == EINTR) {
        continue;
      }
      error = "waitpid: " + ErrnoText(errno);
      (void)kill(-pid, SIGKILL);
      (void)waitpid(pid, &child_status, 0);
      return false;
    }
    if (ret == pid) {
      exited = true;
      break;
    }
    std::this_thread::sleep_for(kPollInterval);
  }

  if (!exited) {
    result.timed_out = true;
    (void)kill(-pid, SIGKILL);
    pid_t ret = 0;
    do {
      ret = waitpid(pid, &child_status, 0);
    } while (ret == -1 && errno == EINTR);
  }

  result.wall_time = elapsed();
  result.exit_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : -1;
  result.signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  return true;
}

bool RunProcessCapture(ProcessOptions options, std::string& output, ProcessResult& result,
                       std::string& error) {
  output.clear();

  std::string pattern = (fs::temp_directory_path() / "nucleobench-capture-XXXXXX").string();
  const int fd = mkstemp(pattern.data());
  if (fd == -1) {
    error = "mkstemp: " + ErrnoText(errno);
    return false;
  }
  close(fd);
  const fs::path capture_path(pattern);

  options.stdout_path = capture_path;
  const bool ran = RunProcess(options, result, error);
  if (ran && !core::ReadTextFile(capture_path, output, error)) {
    core::RemovePathBestEffort(capture_path);
    return false;
  }
  core::RemovePathBestEffort(capture_path);
  return ran;
}

std::string DescribeProcessResult(const ProcessResult& result) {
  if (result.timed_out) {
    return "timed out after " + std::to_string(result.wall_time.count()) + "ms";
  }
  if (result.signal != 0) {
    return "killed by signal " + std::to_string(result.signal);
  }
  return "exit code " + std::to_string(result.exit_code);
}

} // namespace nucleobench::sandbox
