#include "scheduler/run_summary.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using nucleobench::results::Result;
using nucleobench::scheduler::PrintRunSummary;
using nucleobench::scheduler::SummarizeResults;
using nucleobench::scheduler::TaskState;
using nucleobench::scheduler::ToString;
using nucleobench::scheduler::VerdictState;

namespace {

Result Record(std::string model, std::string exam, bool passed,
              std::optional<std::string> error = std::nullopt) {
  Result result;
  result.model = std::move(model);
  result.exam = std::move(exam);
  result.passed = passed;
  result.error = std::move(error);
  return result;
}

} // namespace

TEST_CASE("Task states have stable names", "[scheduler][summary]") {
  REQUIRE(std::string(ToString(TaskState::kPending)) == "pending");
  REQUIRE(std::string(ToString(TaskState::kCacheHit)) == "cache_hit");
  REQUIRE(std::string(ToString(TaskState::kErrored)) == "errored");
}

TEST_CASE("Verdict state follows the record", "[scheduler][summary]") {
  REQUIRE(VerdictState(Record("m", "e", true)) == TaskState::kPassed);
  REQUIRE(VerdictState(Record("m", "e", false)) == TaskState::kFailed);
  REQUIRE(VerdictState(Record("m", "e", false, "Timeout after 5s")) == TaskState::kErrored);
}

TEST_CASE("Summary aggregates per model and per exam", "[scheduler][summary]") {
  const auto summary = SummarizeResults({Record("m1", "e1", true), Record("m1", "e2", false),
                                         Record("m2", "e1", true),
                                         Record("m2", "e2", false, "Sandbox unavailable: x")});

  REQUIRE(summary.PassedCount() == 2U);
  REQUIRE(summary.ErroredCount() == 1U);
  REQUIRE(summary.CachedCount() == 4U);

  const auto by_model = summary.ByModel();
  REQUIRE(by_model.size() == 2U);
  REQUIRE(by_model[0].name == "m1");
  REQUIRE(by_model[0].passed == 1U);
  REQUIRE(by_model[0].total == 2U);

  const auto by_exam = summary.ByExam();
  REQUIRE(by_exam.size() == 2U);
  REQUIRE(by_exam[0].name == "e1");
  REQUIRE(by_exam[0].passed == 2U);
  REQUIRE(by_exam[1].passed == 0U);

  std::ostringstream out;
  PrintRunSummary(summary, out);
  const std::string text = out.str();
  REQUIRE(text.find("SUMMARY") != std::string::npos);
  REQUIRE(text.find("PASS (cached)") != std::string::npos);
  REQUIRE(text.find("ERROR (cached)") != std::string::npos);
  REQUIRE(text.find("  m1: 1/2\n") != std::string::npos);
  REQUIRE(text.find("  e1: 2/2\n") != std::string::npos);
}
