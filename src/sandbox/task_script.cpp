#include "sandbox/task_script.hpp"

#include "core/json_writer.hpp"

#include <sstream>

namespace nucleobench::sandbox {

std::string ShellSingleQuote(std::string_view raw) {
  std::string quoted = "'";
  for (const char c : raw) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

std::string RenderTaskScript(const TaskScriptOptions& options) {
  const std::string agent_model = options.provider_id + "/" + options.model_identifier;

  std::ostringstream out;
  out << "#!/bin/bash\n"
      << "set -e\n"
      << "\n"
      << "mkdir -p /work\n"
      << "cd /work\n"
      << "unzip -o " << kSandboxBundlePath << "\n"
      << "cd /work/es2/nucleo\n"
      << "\n"
      << "# Track kernel sources only.\n"
      << "cat > .gitignore << 'GITIGNORE'\n"
      << "*\n"
      << "!*.cpp\n"
      << "!*.s\n"
      << "!*.h\n"
      << "!*.asm\n"
      << "!*.c\n"
      << "!.gitignore\n"
      << "!*/\n"
      << "GITIGNORE\n"
      << "\n"
      << "git init -q\n"
      << "git config user.email \"agent@bench.local\"\n"
      << "git config user.name \"Agent\"\n"
      << "git add -A\n"
      << "git commit -q -m \"initial state\" --allow-empty\n"
      << "\n"
      << "mkdir -p ~/.local/share/opencode\n"
      << "cp " << kSandboxAgentAuthPath << " ~/.local/share/opencode/auth.json\n"
      << "cp " << kSandboxAgentConfigPath << " /work/es2/nucleo/opencode.json\n"
      << "\n"
      << "set +e\n"
      << "opencode run " << ShellSingleQuote(options.prompt) << " --model "
      << ShellSingleQuote(agent_model) << " 2>&1 | tee " << kSandboxAgentLogPath << "\n"
      << "echo \"${PIPESTATUS[0]}\" > " << kSandboxAgentExitPath << "\n"
      << "set -e\n"
      << "\n"
      << "git diff > " << kSandboxDiffPath << " || true\n"
      << "git add -A || true\n"
      << "git diff --cached >> " << kSandboxDiffPath << " || true\n"
      << "\n"
      << "# AUTOCORR=1 routes video output to the log as USR lines at build and\n"
      << "# boot time.\n"
      << "export AUTOCORR=1\n"
      << "make clean 2>&1 || true\n"
      << "make 2>&1 || echo \"MAKE_FAILED\"\n"
      << "timeout " << options.boot_timeout << " boot > " << kSandboxBootOutputPath
      << " 2>&1 || true\n"
      << "\n"
      << "echo \"" << kScriptDoneMarker << "\"\n";
  return out.str();
}

std::string RenderAgentConfigJson(std::string_view provider_id, std::string_view model_identifier) {
  std::ostringstream out;
  out << "{\n"
      << "  \"$schema\": \"https://opencode.ai/config.json\",\n"
      << "  \"provider\": {\n"
      << "    " << core::QuoteJson(provider_id) << ": {\n"
      << "      \"models\": {\n"
      << "        " << core::QuoteJson(model_identifier) << ": {}\n"
      << "      }\n"
      << "    }\n"
      << "  }\n"
      << "}\n";
  return out.str();
}

std::string RenderAgentAuthJson(std::string_view provider_id, std::string_view api_key) {
  std::ostringstream out;
  out << "{\n"
      << "  " << core::QuoteJson(provider_id) << ": {\n"
      << "    \"type\": \"api\",\n"
      << "    \"key\": " << core::QuoteJson(api_key) << "\n"
      << "  }\n"
      << "}\n";
  return out.str();
}

} // namespace nucleobench::sandbox
