#pragma once

#include <string>
#include <string_view>

namespace nucleobench::sandbox {

// Fixed file locations inside the sandbox.
inline constexpr const char* kSandboxBundlePath = "/tmp/es2.zip";
inline constexpr const char* kSandboxScriptPath = "/tmp/run_inner.sh";
inline constexpr const char* kSandboxAgentConfigPath = "/tmp/opencode.json";
inline constexpr const char* kSandboxAgentAuthPath = "/tmp/auth.json";
inline constexpr const char* kSandboxDiffPath = "/tmp/solution.diff";
inline constexpr const char* kSandboxBootOutputPath = "/tmp/boot_output.txt";
inline constexpr const char* kSandboxAgentLogPath = "/tmp/agent_output.log";
inline constexpr const char* kSandboxAgentExitPath = "/tmp/agent_exit_code";
inline constexpr const char* kScriptDoneMarker = "===DONE===";

struct TaskScriptOptions {
  std::string prompt;
  std::string provider_id;
  std::string model_identifier;
  std::string boot_timeout = "10s";
};

// Wraps `raw` in single quotes, escaping embedded quotes as '\''.
std::string ShellSingleQuote(std::string_view raw);

// Bash script executed inside the sandbox for one task.
//
// Stages, in order:
// - unpack the bundle into /work and snapshot the sources in a git repo
// - install the agent config and run the agent (failure tolerated, exit
//   status saved to kSandboxAgentExitPath)
// - save the agent's patch (unstaged + staged) to kSandboxDiffPath
// - rebuild and boot with a hard limit, console captured to
//   kSandboxBootOutputPath
std::string RenderTaskScript(const TaskScriptOptions& options);

// opencode.json registering exactly one provider/model pair.
std::string RenderAgentConfigJson(std::string_view provider_id, std::string_view model_identifier);

// auth.json holding the API key for `provider_id`.
std::string RenderAgentAuthJson(std::string_view provider_id, std::string_view api_key);

} // namespace nucleobench::sandbox
