#include "matrix/task.hpp"
#include "results/result_record.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using nucleobench::results::CheckResultInvariant;
using nucleobench::results::MakeErroredResult;
using nucleobench::results::ParseResultJson;
using nucleobench::results::Result;
using nucleobench::results::ToJson;

namespace {

Result MakePassingResult() {
  Result result;
  result.model = "glm-4.6";
  result.exam = "2024-01-10";
  result.passed = true;
  result.diff = "diff --git a/sistema.cpp b/sistema.cpp\n+\tflags |= 1;\n";
  result.output = {"proc 1: \"ok\"", "tab\tsep"};
  result.expected = result.output;
  result.boot_capture = "INF 0 boot\nUSR 1 proc 1: \"ok\"\n";
  result.agent_transcript = "thinking...\n";
  result.duration_seconds = 12.5;
  return result;
}

} // namespace

TEST_CASE("Result JSON uses stable keys and layout", "[results][json]") {
  const std::string json = ToJson(MakePassingResult());

  REQUIRE(json.rfind("{\n  \"model\": \"glm-4.6\",\n  \"exam\": \"2024-01-10\",\n", 0) == 0U);
  REQUIRE(json.find("\"passed\": true,") != std::string::npos);
  REQUIRE(json.find("\"error\": null,") != std::string::npos);
  REQUIRE(json.find("\"duration_seconds\": 12.5\n}") != std::string::npos);
  REQUIRE(json.back() == '\n');
}

TEST_CASE("Result JSON parses back to the same record", "[results][json]") {
  const Result original = MakePassingResult();
  Result parsed;
  std::string error;
  REQUIRE(ParseResultJson(ToJson(original), parsed, error));
  REQUIRE(parsed == original);
}

TEST_CASE("Errored results serialize empty evidence", "[results][json]") {
  const nucleobench::matrix::Task task{"m", "e"};
  const Result errored = MakeErroredResult(task, "Timeout after 600s", 600.25);

  const std::string json = ToJson(errored);
  REQUIRE(json.find("\"error\": \"Timeout after 600s\"") != std::string::npos);
  REQUIRE(json.find("\"output\": [],") != std::string::npos);

  Result parsed;
  std::string error;
  REQUIRE(ParseResultJson(json, parsed, error));
  REQUIRE_FALSE(parsed.passed);
  REQUIRE(parsed.error == std::string("Timeout after 600s"));
  REQUIRE(parsed.duration_seconds == 600.25);
}

TEST_CASE("Legacy records are accepted", "[results][json]") {
  const std::string legacy = R"({
  "passed": false,
  "output": "",
  "expected": "",
  "diff": "",
  "boot_output": "USR 1 x\n",
  "error": "Failed to extract PDF"
})";

  Result parsed;
  std::string error;
  REQUIRE(ParseResultJson(legacy, parsed, error));
  REQUIRE(parsed.output.empty());
  REQUIRE(parsed.expected.empty());
  REQUIRE(parsed.boot_capture == "USR 1 x\n");
  REQUIRE(parsed.error == std::string("Failed to extract PDF"));
  REQUIRE_FALSE(parsed.duration_seconds.has_value());
}

TEST_CASE("Malformed records are rejected", "[results][json]") {
  Result parsed;
  std::string error;
  REQUIRE_FALSE(ParseResultJson("{\"passed\": ", parsed, error));
  REQUIRE_FALSE(error.empty());

  REQUIRE_FALSE(ParseResultJson("{\"passed\": \"yes\"}", parsed, error));
  REQUIRE(error.find("passed") != std::string::npos);

  REQUIRE_FALSE(ParseResultJson("{\"passed\": false, \"output\": [1, 2]}", parsed, error));
}

TEST_CASE("Passing results cannot carry an error", "[results][invariant]") {
  Result result = MakePassingResult();
  std::string error;
  REQUIRE(CheckResultInvariant(result, error));

  result.error = "boom";
  REQUIRE_FALSE(CheckResultInvariant(result, error));

  Result anonymous;
  REQUIRE_FALSE(CheckResultInvariant(anonymous, error));
}
