#include "core/json_dom.hpp"
#include "sandbox/docker_sandbox.hpp"
#include "sandbox/task_script.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using nucleobench::sandbox::RenderAgentAuthJson;
using nucleobench::sandbox::RenderAgentConfigJson;
using nucleobench::sandbox::RenderTaskScript;
using nucleobench::sandbox::SanitizeContainerName;
using nucleobench::sandbox::ShellSingleQuote;
using nucleobench::sandbox::TaskScriptOptions;

TEST_CASE("Shell quoting survives embedded single quotes", "[sandbox][script]") {
  REQUIRE(ShellSingleQuote("plain") == "'plain'");
  REQUIRE(ShellSingleQuote("it's") == "'it'\\''s'");
  REQUIRE(ShellSingleQuote("") == "''");
}

TEST_CASE("Task script runs every stage in order", "[sandbox][script]") {
  TaskScriptOptions options;
  options.prompt = "Don't run `boot` directly";
  options.provider_id = "openrouter";
  options.model_identifier = "qwen/qwen3-coder";

  const std::string script = RenderTaskScript(options);
  REQUIRE(script.rfind("#!/bin/bash\n", 0) == 0U);

  const std::size_t unzip = script.find("unzip -o /tmp/es2.zip");
  const std::size_t git_init = script.find("git init");
  const std::size_t agent =
      script.find("opencode run 'Don'\\''t run `boot` directly' --model "
                  "'openrouter/qwen/qwen3-coder' 2>&1 | tee /tmp/agent_output.log");
  const std::size_t diff = script.find("git diff > /tmp/solution.diff");
  const std::size_t build = script.find("make 2>&1 || echo \"MAKE_FAILED\"");
  const std::size_t boot = script.find("timeout 10s boot > /tmp/boot_output.txt 2>&1 || true");
  const std::size_t done = script.find("===DONE===");

  REQUIRE(unzip != std::string::npos);
  REQUIRE(git_init > unzip);
  REQUIRE(agent != std::string::npos);
  REQUIRE(agent > git_init);
  REQUIRE(diff > agent);
  REQUIRE(build > diff);
  REQUIRE(boot > build);
  REQUIRE(done > boot);

  REQUIRE(script.find("echo \"${PIPESTATUS[0]}\" > /tmp/agent_exit_code") != std::string::npos);
  REQUIRE(script.find("!*.cpp") != std::string::npos);
  REQUIRE(script.find("export AUTOCORR=1") != std::string::npos);
}

TEST_CASE("Agent config documents are valid JSON", "[sandbox][script]") {
  nucleobench::core::json::Value config;
  std::string error;
  REQUIRE(nucleobench::core::json::Parse(RenderAgentConfigJson("openrouter", "qwen/qwen3-coder"),
                                         config, error));
  const auto* provider = nucleobench::core::json::FindMember(config, "provider");
  REQUIRE(provider != nullptr);
  const auto* openrouter = nucleobench::core::json::FindMember(*provider, "openrouter");
  REQUIRE(openrouter != nullptr);
  const auto* models = nucleobench::core::json::FindMember(*openrouter, "models");
  REQUIRE(models != nullptr);
  REQUIRE(nucleobench::core::json::FindMember(*models, "qwen/qwen3-coder") != nullptr);

  nucleobench::core::json::Value auth;
  REQUIRE(nucleobench::core::json::Parse(RenderAgentAuthJson("openrouter", "sk-\"quoted\""), auth,
                                         error));
  const auto* entry = nucleobench::core::json::FindMember(auth, "openrouter");
  REQUIRE(entry != nullptr);
  const auto* key = nucleobench::core::json::FindMember(*entry, "key");
  REQUIRE(key != nullptr);
  REQUIRE(key->string_value == "sk-\"quoted\"");
}

TEST_CASE("Container names replace path and dot separators", "[sandbox][docker]") {
  REQUIRE(SanitizeContainerName("glm-4.6-2024/01") == "bench-glm-4-6-2024-01");
}
