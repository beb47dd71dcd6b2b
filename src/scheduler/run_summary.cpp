#include "scheduler/run_summary.hpp"

#include <algorithm>
#include <iomanip>
#include <map>
#include <utility>

namespace nucleobench::scheduler {

namespace {

const char* VerdictLabel(TaskState state) {
  switch (state) {
  case TaskState::kPassed:
    return "PASS";
  case TaskState::kFailed:
    return "FAIL";
  case TaskState::kErrored:
    return "ERROR";
  case TaskState::kPending:
  case TaskState::kCacheHit:
  case TaskState::kRunning:
    return "-";
  }
  return "-";
}

template <typename KeyFn>
std::vector<ScoreLine> GroupScores(const std::vector<SummaryRow>& rows, KeyFn key_fn) {
  std::map<std::string, ScoreLine> by_key;
  for (const auto& row : rows) {
    ScoreLine& line = by_key[key_fn(row)];
    line.name = key_fn(row);
    ++line.total;
    if (row.state == TaskState::kPassed) {
      ++line.passed;
    }
  }

  std::vector<ScoreLine> lines;
  lines.reserve(by_key.size());
  for (auto& [name, line] : by_key) {
    (void)name;
    lines.push_back(std::move(line));
  }
  return lines;
}

void PrintScores(const std::vector<ScoreLine>& lines, std::ostream& out) {
  for (const auto& line : lines) {
    out << "  " << line.name << ": " << line.passed << '/' << line.total << '\n';
  }
}

} // namespace

const char* ToString(TaskState state) {
  switch (state) {
  case TaskState::kPending:
    return "pending";
  case TaskState::kCacheHit:
    return "cache_hit";
  case TaskState::kRunning:
    return "running";
  case TaskState::kPassed:
    return "passed";
  case TaskState::kFailed:
    return "failed";
  case TaskState::kErrored:
    return "errored";
  }
  return "pending";
}

TaskState VerdictState(const results::Result& result) {
  if (result.passed) {
    return TaskState::kPassed;
  }
  return result.error.has_value() ? TaskState::kErrored : TaskState::kFailed;
}

std::size_t RunSummary::PassedCount() const {
  return static_cast<std::size_t>(std::count_if(
      rows.begin(), rows.end(), [](const SummaryRow& row) { return row.state == TaskState::kPassed; }));
}

std::size_t RunSummary::ErroredCount() const {
  return static_cast<std::size_t>(std::count_if(rows.begin(), rows.end(), [](const SummaryRow& row) {
    return row.state == TaskState::kErrored;
  }));
}

std::size_t RunSummary::CachedCount() const {
  return static_cast<std::size_t>(
      std::count_if(rows.begin(), rows.end(), [](const SummaryRow& row) { return row.cached; }));
}

std::vector<ScoreLine> RunSummary::ByModel() const {
  return GroupScores(rows, [](const SummaryRow& row) { return row.model; });
}

std::vector<ScoreLine> RunSummary::ByExam() const {
  return GroupScores(rows, [](const SummaryRow& row) { return row.exam; });
}

RunSummary SummarizeResults(const std::vector<results::Result>& results) {
  RunSummary summary;
  summary.rows.reserve(results.size());
  for (const auto& result : results) {
    SummaryRow row;
    row.model = result.model;
    row.exam = result.exam;
    row.state = VerdictState(result);
    row.cached = true;
    row.error = result.error;
    summary.rows.push_back(std::move(row));
  }
  return summary;
}

void PrintRunSummary(const RunSummary& summary, std::ostream& out) {
  const std::string rule(60, '=');
  out << '\n' << rule << '\n' << "SUMMARY\n" << rule << '\n';
  out << std::left << std::setw(30) << "Model" << ' ' << std::setw(20) << "Exam" << ' '
      << "Result" << '\n';
  out << std::string(30, '-') << ' ' << std::string(20, '-') << ' ' << std::string(10, '-')
      << '\n';
  for (const auto& row : summary.rows) {
    out << std::left << std::setw(30) << row.model << ' ' << std::setw(20) << row.exam << ' '
        << VerdictLabel(row.state) << (row.cached ? " (cached)" : "") << '\n';
  }
  out << std::right;

  out << "\nScores:\n";
  PrintScores(summary.ByModel(), out);
  out << "\nScores by exam:\n";
  PrintScores(summary.ByExam(), out);

  if (summary.store_failures > 0U) {
    out << "\nwarning: " << summary.store_failures << " result(s) could not be stored\n";
  }
}

} // namespace nucleobench::scheduler
