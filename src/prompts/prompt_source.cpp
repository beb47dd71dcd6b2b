#include "prompts/prompt_source.hpp"

#include "sandbox/process_runner.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace nucleobench::prompts {

namespace {

constexpr std::string_view kPromptHeader =
    "You are solving Exercise 2 (es2) from a Calcolatori Elettronici exam.\n"
    "\n"
    "The exercise involves modifying kernel (nucleo) source code. The modifications are marked "
    "with \"ESAME\" in the source files, and the parts where you need to insert your solution "
    "are marked with \"SOLUZIONE\".\n"
    "\n"
    "Here is the exam text:\n"
    "---\n";

constexpr std::string_view kPromptInstructions =
    "---\n"
    "\n"
    "Instructions:\n"
    "1. Read the source files in the current directory to understand the exercise.\n"
    "2. Look for files containing \"ESAME\" and \"SOLUZIONE\" markers.\n"
    "3. Implement the solution by replacing the \"SOLUZIONE\" markers with your code.\n"
    "4. Run `make` to compile the code. Fix any compilation errors.\n"
    "5. IMPORTANT: NEVER run `boot` directly. ALWAYS use `timeout 10s boot` to test your "
    "solution.\n"
    "6. The environment variable AUTOCORR=1 is already set. This causes video output to appear "
    "in the log as lines starting with \"USR\". Check those lines to verify correctness.\n"
    "7. If there are errors, analyze them and fix your solution.\n"
    "8. Repeat steps 4-7 until the solution works correctly.\n"
    "\n"
    "Remember: ALWAYS use `timeout 10s boot` instead of `boot` - this is critical to avoid "
    "hanging!\n";

bool IsBlank(std::string_view text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

std::string RenderAgentPrompt(std::string_view exam_text) {
  std::string prompt(kPromptHeader);
  prompt.append(exam_text);
  if (!exam_text.empty() && exam_text.back() != '\n') {
    prompt.push_back('\n');
  }
  prompt.append(kPromptInstructions);
  return prompt;
}

PdfPromptSource::PdfPromptSource(std::string pdftotext_binary, std::chrono::milliseconds timeout)
    : pdftotext_binary_(std::move(pdftotext_binary)), timeout_(timeout) {}

bool PdfPromptSource::BuildPrompt(const exams::ExamSpec& exam, std::string& prompt,
                                  std::string& error) {
  prompt.clear();

  sandbox::ProcessOptions options;
  options.argv = {pdftotext_binary_, "-layout", exam.prompt_source_path.string(), "-"};
  options.merge_stderr = false;
  options.wall_limit = timeout_;

  std::string text;
  sandbox::ProcessResult result;
  if (!sandbox::RunProcessCapture(options, text, result, error)) {
    error = "failed to run " + pdftotext_binary_ + ": " + error;
    return false;
  }
  if (!result.Succeeded()) {
    error = pdftotext_binary_ + " failed on '" + exam.prompt_source_path.string() + "' (" +
            sandbox::DescribeProcessResult(result) + ")";
    return false;
  }
  if (IsBlank(text)) {
    error = "no text extracted from '" + exam.prompt_source_path.string() + "'";
    return false;
  }

  prompt = RenderAgentPrompt(text);
  return true;
}

} // namespace nucleobench::prompts
