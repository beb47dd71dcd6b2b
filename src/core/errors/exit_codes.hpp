#pragma once

namespace nucleobench::core::errors {

// Stable process-exit contract for batch automation.
//
// 0/1/2 keep their conventional meanings. A run whose tasks all reached a
// terminal state exits 0 regardless of individual verdicts; the remaining
// values classify run-level preconditions that stopped the run before any
// task executed.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigurationError = 10,
  kMissingCredential = 11,
  kSandboxImageUnavailable = 20,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace nucleobench::core::errors
