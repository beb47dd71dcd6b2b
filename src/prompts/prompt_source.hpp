#pragma once

#include "exams/exam_catalog.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace nucleobench::prompts {

// Produces the agent prompt for one exam.
class IPromptSource {
public:
  virtual ~IPromptSource() = default;

  virtual bool BuildPrompt(const exams::ExamSpec& exam, std::string& prompt,
                           std::string& error) = 0;
};

// Wraps the exam text in the fixed agent instructions.
std::string RenderAgentPrompt(std::string_view exam_text);

// Extracts the exam text from the exam's PDF with `pdftotext -layout`.
class PdfPromptSource final : public IPromptSource {
public:
  explicit PdfPromptSource(std::string pdftotext_binary = "pdftotext",
                           std::chrono::milliseconds timeout = std::chrono::seconds(30));

  bool BuildPrompt(const exams::ExamSpec& exam, std::string& prompt, std::string& error) override;

private:
  std::string pdftotext_binary_;
  std::chrono::milliseconds timeout_;
};

} // namespace nucleobench::prompts
