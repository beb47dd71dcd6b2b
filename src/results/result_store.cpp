#include "results/result_store.hpp"

#include "core/fs_utils.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace nucleobench::results {

namespace {

bool IsPathComponent(const std::string& name) {
  return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos;
}

std::vector<fs::path> SortedSubdirectories(const fs::path& dir, std::string& error) {
  std::vector<fs::path> dirs;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if (it->is_directory(entry_ec) && !entry_ec) {
      dirs.push_back(it->path());
    }
  }
  if (ec) {
    error = "failed to list directory '" + dir.string() + "': " + ec.message();
    dirs.clear();
  }
  std::sort(dirs.begin(), dirs.end());
  return dirs;
}

} // namespace

ResultStore::ResultStore(fs::path root) : root_(std::move(root)) {}

fs::path ResultStore::TaskDir(const matrix::Task& task) const {
  return root_ / task.model_id / task.exam_id;
}

fs::path ResultStore::RecordPath(const matrix::Task& task) const {
  return TaskDir(task) / kResultFileName;
}

fs::path ResultStore::WorkDir(const matrix::Task& task) const {
  return TaskDir(task) / "work";
}

bool ResultStore::ValidateTask(const matrix::Task& task, std::string& error) const {
  if (!IsPathComponent(task.model_id) || !IsPathComponent(task.exam_id)) {
    error = "task identity is not usable as a result key: " + task.Key();
    return false;
  }
  return true;
}

bool ResultStore::Put(const matrix::Task& task, const Result& result, std::string& error) const {
  if (!ValidateTask(task, error)) {
    return false;
  }
  if (result.model != task.model_id || result.exam != task.exam_id) {
    error = "result identity " + result.model + "/" + result.exam +
            " does not match task " + task.Key();
    return false;
  }
  if (!CheckResultInvariant(result, error)) {
    return false;
  }

  if (!core::WriteTextFileAtomic(RecordPath(task), ToJson(result), error)) {
    error = "failed to store result for " + task.Key() + ": " + error;
    return false;
  }
  return true;
}

bool ResultStore::Exists(const matrix::Task& task) const {
  std::string ignored;
  return ValidateTask(task, ignored) && core::IsRegularFile(RecordPath(task));
}

bool ResultStore::Get(const matrix::Task& task, Result& result, std::string& error) const {
  result = Result{};
  if (!ValidateTask(task, error)) {
    return false;
  }

  const fs::path path = RecordPath(task);
  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }
  if (!ParseResultJson(text, result, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  if (result.model.empty()) {
    result.model = task.model_id;
  }
  if (result.exam.empty()) {
    result.exam = task.exam_id;
  }
  return true;
}

bool ResultStore::ListAll(std::vector<Result>& results, std::vector<std::string>& warnings,
                          std::string& error) const {
  results.clear();
  warnings.clear();
  error.clear();

  std::error_code ec;
  if (!fs::exists(root_, ec)) {
    return true;
  }
  if (!fs::is_directory(root_, ec) || ec) {
    error = "results path is not a directory: " + root_.string();
    return false;
  }

  const std::vector<fs::path> model_dirs = SortedSubdirectories(root_, error);
  if (!error.empty()) {
    return false;
  }
  for (const fs::path& model_dir : model_dirs) {
    std::string list_error;
    const std::vector<fs::path> exam_dirs = SortedSubdirectories(model_dir, list_error);
    if (!list_error.empty()) {
      warnings.push_back(list_error);
      continue;
    }
    for (const fs::path& exam_dir : exam_dirs) {
      const matrix::Task task{model_dir.filename().string(), exam_dir.filename().string()};
      if (!Exists(task)) {
        continue;
      }
      Result result;
      std::string read_error;
      if (!Get(task, result, read_error)) {
        warnings.push_back(read_error);
        continue;
      }
      results.push_back(std::move(result));
    }
  }
  return true;
}

} // namespace nucleobench::results
