#pragma once

#include "matrix/task.hpp"
#include "results/result_record.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace nucleobench::results {

inline constexpr const char* kResultFileName = "result.json";

// File-backed result cache: one record per task at
// `<root>/<model>/<exam>/result.json`.
//
// Contract:
// - Put publishes the whole record atomically (temp sibling + rename), so a
//   crash or timeout never leaves a half-written record behind.
// - A record's presence is the cache key; re-running a task replaces it.
// - Records live at independent keys; no cross-task locking is needed.
class ResultStore {
public:
  explicit ResultStore(std::filesystem::path root);

  const std::filesystem::path& Root() const {
    return root_;
  }

  std::filesystem::path TaskDir(const matrix::Task& task) const;
  std::filesystem::path RecordPath(const matrix::Task& task) const;

  // Scratch area for one task attempt (rendered script, extracted artifacts).
  std::filesystem::path WorkDir(const matrix::Task& task) const;

  bool Put(const matrix::Task& task, const Result& result, std::string& error) const;
  bool Exists(const matrix::Task& task) const;

  // Reads the record for `task`. Model/exam default to the task identity
  // when the record predates those keys.
  bool Get(const matrix::Task& task, Result& result, std::string& error) const;

  // Every readable record, ordered by model then exam. Unreadable records are
  // skipped and described in `warnings`.
  bool ListAll(std::vector<Result>& results, std::vector<std::string>& warnings,
               std::string& error) const;

private:
  bool ValidateTask(const matrix::Task& task, std::string& error) const;

  std::filesystem::path root_;
};

} // namespace nucleobench::results
