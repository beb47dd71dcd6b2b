#ifndef NUCLEOBENCH_TESTS_COMMON_EVAL_FIXTURES_HPP_
#define NUCLEOBENCH_TESTS_COMMON_EVAL_FIXTURES_HPP_

#include "assertions.hpp"

#include "config/model_catalog.hpp"
#include "exams/exam_catalog.hpp"
#include "prompts/prompt_source.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nucleobench::tests::common {

// Writes `<exams_root>/<name>/` with a placeholder bundle, prompt source and
// one `es2.out.<i>` file per expected variant.
inline std::filesystem::path WriteExamFixture(const std::filesystem::path& exams_root,
                                              std::string_view name,
                                              const std::vector<std::string>& variant_bodies) {
  const std::filesystem::path exam_dir = exams_root / std::string(name);
  WriteFileOrFail(exam_dir / exams::kSourceBundleFile, "PK-placeholder");
  WriteFileOrFail(exam_dir / exams::kPromptSourceFile, "%PDF-placeholder");
  for (std::size_t i = 0; i < variant_bodies.size(); ++i) {
    WriteFileOrFail(exam_dir / (std::string(exams::kExpectedVariantPrefix) + std::to_string(i)),
                    variant_bodies[i]);
  }
  return exam_dir;
}

inline config::ModelSpec MakeModel(std::string name, std::string provider = "openrouter",
                                   std::string model_identifier = "vendor/model-1") {
  config::ModelSpec model;
  model.name = std::move(name);
  model.provider = std::move(provider);
  model.model_identifier = std::move(model_identifier);
  return model;
}

// Prompt source returning fixed text, or failing on demand.
class StaticPromptSource final : public prompts::IPromptSource {
public:
  explicit StaticPromptSource(bool fail = false) : fail_(fail) {}

  bool BuildPrompt(const exams::ExamSpec& exam, std::string& prompt,
                   std::string& error) override {
    ++calls_;
    if (fail_) {
      error = "pdftotext unavailable";
      return false;
    }
    prompt = prompts::RenderAgentPrompt("exam text for " + exam.name);
    return true;
  }

  std::size_t calls() const {
    return calls_;
  }

private:
  bool fail_ = false;
  std::size_t calls_ = 0U;
};

} // namespace nucleobench::tests::common

#endif // NUCLEOBENCH_TESTS_COMMON_EVAL_FIXTURES_HPP_
