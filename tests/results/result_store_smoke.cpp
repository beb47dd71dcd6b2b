#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "matrix/task.hpp"
#include "results/result_store.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

using nucleobench::matrix::Task;
using nucleobench::results::Result;
using nucleobench::results::ResultStore;
using nucleobench::tests::common::Assert;
using nucleobench::tests::common::Fail;

namespace {

Result MakeResult(const Task& task, bool passed, std::string diff) {
  Result result;
  result.model = task.model_id;
  result.exam = task.exam_id;
  result.passed = passed;
  result.diff = std::move(diff);
  result.output = {"line one", "line two"};
  result.expected = passed ? result.output : std::vector<std::string>{"other"};
  result.boot_capture = "USR 1 line one\nUSR 2 line two\n";
  result.agent_transcript = "done\n";
  result.duration_seconds = 42.125;
  return result;
}

void AssertNoTempSiblings(const fs::path& dir) {
  for (const auto& entry : fs::directory_iterator(dir)) {
    const std::string name = entry.path().filename().string();
    if (name != "result.json" && name != "work") {
      Fail("unexpected file left next to result record: " + name);
    }
  }
}

} // namespace

int main() {
  const fs::path root = nucleobench::tests::common::CreateUniqueTempDir("nucleobench-store-smoke");
  const ResultStore store(root / "results");
  const Task task{"glm-4.6", "2024-01-10"};
  std::string error;

  Assert(!store.Exists(task), "empty store should have no record");
  Assert(store.RecordPath(task) == root / "results" / "glm-4.6" / "2024-01-10" / "result.json",
         "record path layout mismatch");

  const Result first = MakeResult(task, true, "diff-1\n");
  if (!store.Put(task, first, error)) {
    Fail("put failed: " + error);
  }
  Assert(store.Exists(task), "record should exist after put");

  Result loaded;
  if (!store.Get(task, loaded, error)) {
    Fail("get failed: " + error);
  }
  Assert(loaded == first, "get should return exactly what put stored");
  AssertNoTempSiblings(store.TaskDir(task));

  // A rerun replaces the record wholesale.
  Result second = MakeResult(task, false, "diff-2\n");
  second.agent_transcript.clear();
  second.duration_seconds.reset();
  if (!store.Put(task, second, error)) {
    Fail("overwrite failed: " + error);
  }
  if (!store.Get(task, loaded, error)) {
    Fail("get after overwrite failed: " + error);
  }
  Assert(loaded == second, "overwrite should replace every field");

  // Identity and invariant are enforced.
  Result mismatched = MakeResult(Task{"other", "2024-01-10"}, false, "");
  Assert(!store.Put(task, mismatched, error), "identity mismatch should be rejected");
  Result invalid = MakeResult(task, true, "");
  invalid.error = "boom";
  Assert(!store.Put(task, invalid, error), "passing result with error should be rejected");
  Assert(!store.Put(Task{"..", "x"}, MakeResult(Task{"..", "x"}, false, ""), error),
         "path traversal should be rejected");

  // ListAll skips unreadable records with a warning.
  const Task other{"alpha", "2024-01-10"};
  if (!store.Put(other, MakeResult(other, true, ""), error)) {
    Fail("put other failed: " + error);
  }
  nucleobench::tests::common::WriteFileOrFail(root / "results" / "broken" / "e" / "result.json",
                                              "{not json");
  // Self-referencing links cannot be stat'ed; listing must step over them.
  std::error_code link_ec;
  fs::create_symlink("loop", root / "results" / "loop", link_ec);
  if (!link_ec) {
    fs::create_symlink("loop", root / "results" / "alpha" / "loop", link_ec);
  }
  if (link_ec) {
    Fail("failed to create symlink loop: " + link_ec.message());
  }

  std::vector<Result> all;
  std::vector<std::string> warnings;
  if (!store.ListAll(all, warnings, error)) {
    Fail("list failed: " + error);
  }
  Assert(all.size() == 2U, "list should return two readable records");
  Assert(all[0].model == "alpha" && all[1].model == "glm-4.6", "list order mismatch");
  Assert(warnings.size() == 1U, "unreadable record should produce one warning");

  nucleobench::tests::common::RemovePathBestEffort(root);
  std::cout << "result_store_smoke: ok\n";
  return 0;
}
