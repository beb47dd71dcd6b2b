#include "exams/exam_catalog.hpp"

#include "core/fs_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string_view>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace nucleobench::exams {

namespace {

std::string_view TrimView(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
}

} // namespace

std::vector<std::string> ParseExpectedVariantText(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    const std::string_view trimmed = TrimView(line);
    if (!trimmed.empty()) {
      lines.emplace_back(trimmed);
    }
  }
  return lines;
}

bool LoadExpectedVariants(const fs::path& exam_dir, std::vector<std::vector<std::string>>& variants,
                          std::string& error) {
  variants.clear();

  std::vector<fs::path> files;
  std::error_code ec;
  for (fs::directory_iterator it(exam_dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec) || entry_ec) {
      continue;
    }
    const std::string name = it->path().filename().string();
    if (StartsWith(name, kExpectedVariantPrefix)) {
      files.push_back(it->path());
    }
  }
  if (ec) {
    error = "failed to list exam directory '" + exam_dir.string() + "': " + ec.message();
    return false;
  }

  std::sort(files.begin(), files.end());
  for (const fs::path& file : files) {
    std::string text;
    if (!core::ReadTextFile(file, text, error)) {
      variants.clear();
      return false;
    }
    variants.push_back(ParseExpectedVariantText(text));
  }
  return true;
}

bool DiscoverExams(const fs::path& exams_dir, std::vector<ExamSpec>& exams, std::string& error) {
  exams.clear();

  std::error_code ec;
  if (!fs::is_directory(exams_dir, ec) || ec) {
    error = "exams directory not found: " + exams_dir.string();
    return false;
  }

  std::vector<fs::path> candidates;
  for (fs::directory_iterator it(exams_dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if (it->is_directory(entry_ec) && !entry_ec) {
      candidates.push_back(it->path());
    }
  }
  if (ec) {
    error = "failed to list exams directory '" + exams_dir.string() + "': " + ec.message();
    return false;
  }
  std::sort(candidates.begin(), candidates.end());

  for (const fs::path& dir : candidates) {
    ExamSpec exam;
    exam.name = dir.filename().string();
    exam.directory = dir;
    exam.source_bundle_path = dir / kSourceBundleFile;
    exam.prompt_source_path = dir / kPromptSourceFile;
    if (!core::IsRegularFile(exam.source_bundle_path) ||
        !core::IsRegularFile(exam.prompt_source_path)) {
      continue;
    }
    if (!LoadExpectedVariants(dir, exam.expected_variants, error)) {
      exams.clear();
      return false;
    }
    exams.push_back(std::move(exam));
  }

  if (exams.empty()) {
    error = "no exams found in " + exams_dir.string();
    return false;
  }
  return true;
}

} // namespace nucleobench::exams
