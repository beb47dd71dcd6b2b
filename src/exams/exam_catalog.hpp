#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace nucleobench::exams {

// Fixed file layout inside one exam directory.
inline constexpr const char* kSourceBundleFile = "es2.zip";
inline constexpr const char* kPromptSourceFile = "testo.pdf";
inline constexpr const char* kExpectedVariantPrefix = "es2.out.";

// One exam: the kernel source bundle the agent patches, the exam text it
// reads, and every accepted output trace. Loaded once and never mutated.
struct ExamSpec {
  std::string name;
  std::filesystem::path directory;
  std::filesystem::path source_bundle_path;
  std::filesystem::path prompt_source_path;
  std::vector<std::vector<std::string>> expected_variants;
};

// Parses one expected-output file body: trimmed, non-empty lines in order.
std::vector<std::string> ParseExpectedVariantText(const std::string& text);

// Loads `es2.out.*` from `exam_dir` in file-name order.
bool LoadExpectedVariants(const std::filesystem::path& exam_dir,
                          std::vector<std::vector<std::string>>& variants, std::string& error);

// Discovers every immediate subdirectory of `exams_dir` (sorted by name) that
// holds both the source bundle and the prompt source. Fails when the
// directory is missing or when no subdirectory qualifies.
bool DiscoverExams(const std::filesystem::path& exams_dir, std::vector<ExamSpec>& exams,
                   std::string& error);

} // namespace nucleobench::exams
