#pragma once

#include <string>
#include <string_view>

namespace nucleobench::core::errors {

// Stable classification for evaluation failures.
//
// Run-level: kConfiguration, kMissingCredential (reported before any task runs).
// Task-level: kSandboxUnavailable, kTimeout, kPromptUnavailable (recorded as
// errored results). kArtifactExtraction is only ever logged.
enum class EvalErrorCode {
  kNone,
  kConfiguration,
  kMissingCredential,
  kSandboxUnavailable,
  kTimeout,
  kPromptUnavailable,
  kArtifactExtraction,
};

inline std::string_view ToStableErrorCode(EvalErrorCode code) {
  switch (code) {
  case EvalErrorCode::kNone:
    return "NONE";
  case EvalErrorCode::kConfiguration:
    return "CONFIGURATION_ERROR";
  case EvalErrorCode::kMissingCredential:
    return "MISSING_CREDENTIAL";
  case EvalErrorCode::kSandboxUnavailable:
    return "SANDBOX_UNAVAILABLE";
  case EvalErrorCode::kTimeout:
    return "TIMEOUT";
  case EvalErrorCode::kPromptUnavailable:
    return "PROMPT_UNAVAILABLE";
  case EvalErrorCode::kArtifactExtraction:
    return "ARTIFACT_EXTRACTION_FAILED";
  }
  return "NONE";
}

// Classified failure carried through bool-returning APIs next to the plain
// error text.
struct EvalError {
  EvalErrorCode code = EvalErrorCode::kNone;
  std::string message;

  bool ok() const {
    return code == EvalErrorCode::kNone;
  }
};

// Single-line contract text: "<STABLE_CODE>: <message>".
inline std::string FormatEvalError(const EvalError& error) {
  return std::string(ToStableErrorCode(error.code)) + ": " + error.message;
}

} // namespace nucleobench::core::errors
