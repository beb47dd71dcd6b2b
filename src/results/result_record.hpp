#pragma once

#include "matrix/task.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nucleobench::results {

// Durable outcome of one task. This is the contract consumed by report and
// leaderboard tooling; key names must stay stable.
//
// Invariant: passed == true implies error is empty and output equals one of
// the exam's expected variants.
struct Result {
  std::string model;
  std::string exam;
  bool passed = false;
  std::optional<std::string> error;
  std::string diff;
  std::vector<std::string> output;
  std::vector<std::string> expected;
  std::string boot_capture;
  std::string agent_transcript;
  std::optional<double> duration_seconds;

  bool operator==(const Result& other) const = default;
};

// Errored outcome: passed=false, populated error, empty evidence.
Result MakeErroredResult(const matrix::Task& task, std::string error,
                         std::optional<double> duration_seconds = std::nullopt);

// Checks the record-level invariant that does not need the exam (a passing
// result carries no error).
bool CheckResultInvariant(const Result& result, std::string& error);

// Two-space indented JSON with canonical key order and a trailing newline.
std::string ToJson(const Result& result);

// Parses a stored record. Missing optional keys take their defaults; the
// legacy keys `boot_output` / `agent_output` are accepted when the current
// ones are absent.
bool ParseResultJson(std::string_view text, Result& result, std::string& error);

} // namespace nucleobench::results
