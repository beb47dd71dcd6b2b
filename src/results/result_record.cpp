#include "results/result_record.hpp"

#include "core/json_dom.hpp"
#include "core/json_writer.hpp"

#include <sstream>
#include <utility>

namespace nucleobench::results {

namespace {

using JsonValue = core::json::Value;

bool ReadString(const JsonValue& root, std::string_view key, std::string& out,
                std::string& error) {
  const JsonValue* field = core::json::FindMember(root, key);
  if (field == nullptr || field->type == JsonValue::Type::kNull) {
    out.clear();
    return true;
  }
  if (field->type != JsonValue::Type::kString) {
    error = "result field '" + std::string(key) + "' must be a string";
    return false;
  }
  out = field->string_value;
  return true;
}

bool ReadStringWithFallback(const JsonValue& root, std::string_view key,
                            std::string_view legacy_key, std::string& out, std::string& error) {
  if (core::json::FindMember(root, key) != nullptr) {
    return ReadString(root, key, out, error);
  }
  return ReadString(root, legacy_key, out, error);
}

// Older records stored an empty string instead of an empty list for
// errored runs.
bool ReadLines(const JsonValue& root, std::string_view key, std::vector<std::string>& out,
               std::string& error) {
  out.clear();
  const JsonValue* field = core::json::FindMember(root, key);
  if (field == nullptr || field->type == JsonValue::Type::kNull) {
    return true;
  }
  if (field->type == JsonValue::Type::kString && field->string_value.empty()) {
    return true;
  }
  if (!core::json::ReadStringArray(*field, out)) {
    error = "result field '" + std::string(key) + "' must be an array of strings";
    return false;
  }
  return true;
}

} // namespace

Result MakeErroredResult(const matrix::Task& task, std::string error,
                         std::optional<double> duration_seconds) {
  Result result;
  result.model = task.model_id;
  result.exam = task.exam_id;
  result.passed = false;
  result.error = std::move(error);
  result.duration_seconds = duration_seconds;
  return result;
}

bool CheckResultInvariant(const Result& result, std::string& error) {
  if (result.model.empty() || result.exam.empty()) {
    error = "result must name both model and exam";
    return false;
  }
  if (result.passed && result.error.has_value()) {
    error = "passing result cannot carry an error";
    return false;
  }
  return true;
}

std::string ToJson(const Result& result) {
  std::ostringstream out;
  out << "{\n"
      << "  \"model\": " << core::QuoteJson(result.model) << ",\n"
      << "  \"exam\": " << core::QuoteJson(result.exam) << ",\n"
      << "  \"passed\": " << (result.passed ? "true" : "false") << ",\n"
      << "  \"error\": " << core::OptionalStringJson(result.error) << ",\n"
      << "  \"diff\": " << core::QuoteJson(result.diff) << ",\n"
      << "  \"output\": ";
  core::WriteStringArray(out, result.output, "  ");
  out << ",\n  \"expected\": ";
  core::WriteStringArray(out, result.expected, "  ");
  out << ",\n"
      << "  \"boot_capture\": " << core::QuoteJson(result.boot_capture) << ",\n"
      << "  \"agent_transcript\": " << core::QuoteJson(result.agent_transcript) << ",\n"
      << "  \"duration_seconds\": " << core::OptionalNumberJson(result.duration_seconds) << "\n"
      << "}\n";
  return out.str();
}

bool ParseResultJson(std::string_view text, Result& result, std::string& error) {
  result = Result{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(text, root, parse_error)) {
    error = "invalid result JSON: " + parse_error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "result root must be a JSON object";
    return false;
  }

  const JsonValue* passed = core::json::FindMember(root, "passed");
  if (passed == nullptr || passed->type != JsonValue::Type::kBool) {
    error = "result field 'passed' must be a boolean";
    return false;
  }
  result.passed = passed->bool_value;

  const JsonValue* error_field = core::json::FindMember(root, "error");
  if (error_field != nullptr && error_field->type == JsonValue::Type::kString) {
    result.error = error_field->string_value;
  } else if (error_field != nullptr && error_field->type != JsonValue::Type::kNull) {
    error = "result field 'error' must be a string or null";
    return false;
  }

  const JsonValue* duration = core::json::FindMember(root, "duration_seconds");
  if (duration != nullptr && duration->type == JsonValue::Type::kNumber) {
    result.duration_seconds = duration->number_value;
  } else if (duration != nullptr && duration->type != JsonValue::Type::kNull) {
    error = "result field 'duration_seconds' must be a number or null";
    return false;
  }

  if (!ReadString(root, "model", result.model, error) ||
      !ReadString(root, "exam", result.exam, error) ||
      !ReadString(root, "diff", result.diff, error) ||
      !ReadLines(root, "output", result.output, error) ||
      !ReadLines(root, "expected", result.expected, error) ||
      !ReadStringWithFallback(root, "boot_capture", "boot_output", result.boot_capture, error) ||
      !ReadStringWithFallback(root, "agent_transcript", "agent_output", result.agent_transcript,
                              error)) {
    return false;
  }

  return true;
}

} // namespace nucleobench::results
