#include "../common/assertions.hpp"
#include "../common/eval_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "exams/exam_catalog.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

using nucleobench::tests::common::Assert;
using nucleobench::tests::common::Fail;
using nucleobench::tests::common::WriteFileOrFail;

int main() {
  const fs::path root = nucleobench::tests::common::CreateUniqueTempDir("nucleobench-exams-smoke");
  const fs::path exams_dir = root / "exams";

  std::vector<nucleobench::exams::ExamSpec> exams;
  std::string error;
  Assert(!nucleobench::exams::DiscoverExams(exams_dir, exams, error),
         "missing exams directory should fail");
  nucleobench::tests::common::AssertContains(error, "exams directory not found");

  // Incomplete directory (no prompt source) is skipped.
  WriteFileOrFail(exams_dir / "2023-09-01" / "es2.zip", "PK");
  Assert(!nucleobench::exams::DiscoverExams(exams_dir, exams, error),
         "directory without complete exams should fail");
  nucleobench::tests::common::AssertContains(error, "no exams found");

  nucleobench::tests::common::WriteExamFixture(exams_dir, "2024-06-12",
                                               {"  first  \n\nsecond\n", "second\nfirst\n"});
  nucleobench::tests::common::WriteExamFixture(exams_dir, "2024-01-10", {});
  WriteFileOrFail(exams_dir / "2024-06-12" / "es2.out.10", "late\n");
  WriteFileOrFail(exams_dir / "2024-06-12" / "notes.txt", "ignored\n");
  WriteFileOrFail(exams_dir / "README.md", "not an exam\n");
  std::error_code link_ec;
  fs::create_symlink("loop", exams_dir / "loop", link_ec);
  if (!link_ec) {
    fs::create_symlink("loop", exams_dir / "2024-06-12" / "loop", link_ec);
  }
  if (link_ec) {
    Fail("failed to create symlink loop: " + link_ec.message());
  }

  if (!nucleobench::exams::DiscoverExams(exams_dir, exams, error)) {
    Fail("exam discovery failed: " + error);
  }
  Assert(exams.size() == 2U, "expected two complete exams");
  Assert(exams[0].name == "2024-01-10", "exams should be sorted by name");
  Assert(exams[0].expected_variants.empty(), "exam without variants should load none");

  const auto& variants = exams[1].expected_variants;
  Assert(variants.size() == 3U, "expected three variants for 2024-06-12");
  Assert(variants[0] == std::vector<std::string>{"first", "second"},
         "variant lines should be trimmed and blank lines dropped");
  Assert(variants[1] == std::vector<std::string>{"second", "first"}, "variant order mismatch");
  Assert(variants[2] == std::vector<std::string>{"late"}, "file-name order mismatch");
  Assert(exams[1].source_bundle_path.filename() == "es2.zip", "bundle path mismatch");

  nucleobench::tests::common::RemovePathBestEffort(root);
  std::cout << "exam_catalog_smoke: ok\n";
  return 0;
}
