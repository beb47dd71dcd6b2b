#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "credentials/credential_resolver.hpp"

#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <string>

namespace fs = std::filesystem;

using nucleobench::core::errors::EvalError;
using nucleobench::core::errors::EvalErrorCode;
using nucleobench::credentials::CredentialResolver;
using nucleobench::credentials::ResolvedCredential;
using nucleobench::tests::common::Assert;
using nucleobench::tests::common::Fail;

namespace {

std::optional<std::string> NoEnvironment(std::string_view) {
  return std::nullopt;
}

} // namespace

int main() {
  const fs::path root =
      nucleobench::tests::common::CreateUniqueTempDir("nucleobench-secrets-smoke");
  const fs::path secrets = root / ".env";
  nucleobench::tests::common::WriteFileOrFail(secrets, "# provider keys\n"
                                                       "GLM_CODING_API_KEY=\"glm-from-file\"\n"
                                                       "OPENROUTER_API_KEY=\n");

  const CredentialResolver file_only(secrets, NoEnvironment);
  ResolvedCredential credential;
  EvalError error;
  if (!file_only.Resolve("zai-coding-plan", credential, error)) {
    Fail("file credential should resolve: " + error.message);
  }
  Assert(credential.value == "glm-from-file", "file credential value mismatch");
  Assert(credential.source == secrets.string(), "file credential source mismatch");

  // Present but empty in the file counts as missing.
  Assert(!file_only.Resolve("openrouter", credential, error), "empty value should not resolve");
  Assert(error.code == EvalErrorCode::kMissingCredential, "empty value should be missing");
  nucleobench::tests::common::AssertContains(error.message, secrets.string());

  // The environment wins over the file.
  const CredentialResolver env_first(secrets, [](std::string_view name) {
    return name == "GLM_CODING_API_KEY" ? std::optional<std::string>("glm-from-env")
                                        : std::nullopt;
  });
  if (!env_first.Resolve("zai-coding-plan", credential, error)) {
    Fail("env credential should resolve: " + error.message);
  }
  Assert(credential.value == "glm-from-env", "environment should take precedence");

  // A missing secrets file is not an error by itself.
  const CredentialResolver no_file(root / "missing.env", NoEnvironment);
  Assert(!no_file.Resolve("anthropic", credential, error), "missing file should not resolve");
  Assert(error.code == EvalErrorCode::kMissingCredential, "missing file should be missing");

  nucleobench::tests::common::RemovePathBestEffort(root);
  std::cout << "credential_secrets_file_smoke: ok\n";
  return 0;
}
