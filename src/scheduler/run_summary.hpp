#pragma once

#include "results/result_record.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace nucleobench::scheduler {

// Per-task lifecycle:
//   kPending -> (kCacheHit | kRunning) -> (kPassed | kFailed | kErrored)
// A cache hit resolves straight to the recorded verdict.
enum class TaskState {
  kPending,
  kCacheHit,
  kRunning,
  kPassed,
  kFailed,
  kErrored,
};

const char* ToString(TaskState state);

// Terminal state implied by a stored record.
TaskState VerdictState(const results::Result& result);

struct SummaryRow {
  std::string model;
  std::string exam;
  TaskState state = TaskState::kPending;
  bool cached = false;
  std::optional<std::string> error;
};

struct ScoreLine {
  std::string name;
  std::size_t passed = 0U;
  std::size_t total = 0U;
};

// Aggregate view of one run, in task order.
struct RunSummary {
  std::vector<SummaryRow> rows;
  std::size_t store_failures = 0U;

  std::size_t PassedCount() const;
  std::size_t ErroredCount() const;
  std::size_t CachedCount() const;

  // Sorted by name.
  std::vector<ScoreLine> ByModel() const;
  std::vector<ScoreLine> ByExam() const;
};

// Summary over stored records only (no sandbox work).
RunSummary SummarizeResults(const std::vector<results::Result>& results);

// Table (model, exam, verdict with " (cached)" marker) followed by per-model
// and per-exam scores.
void PrintRunSummary(const RunSummary& summary, std::ostream& out);

} // namespace nucleobench::scheduler
