#pragma once

#include "config/model_catalog.hpp"
#include "core/errors/eval_error.hpp"
#include "matrix/task.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nucleobench::credentials {

// Environment accessor; injectable so tests stay hermetic.
using EnvLookup = std::function<std::optional<std::string>(std::string_view name)>;

// Reads the real process environment.
EnvLookup ProcessEnvLookup();

// A resolved secret together with where it came from.
struct ResolvedCredential {
  std::string provider;
  std::string env_var;
  std::string provider_id;
  std::string value;
  std::string source;
};

// Looks up `key` in line-oriented `KEY=value` text: lines are trimmed, the
// first line starting with exactly `KEY=` wins, and one layer of matching
// single or double quotes is stripped from the trimmed value.
std::optional<std::string> FindSecretInText(std::string_view text, std::string_view key);

// Maps a provider to its API key: the environment variable first, then the
// secrets file when the variable is unset or empty.
class CredentialResolver {
public:
  CredentialResolver(std::filesystem::path secrets_file, EnvLookup env_lookup);

  // kConfiguration for unknown providers, kMissingCredential when neither
  // source yields a non-empty value.
  bool Resolve(std::string_view provider, ResolvedCredential& credential,
               core::errors::EvalError& error) const;

  // Pre-flight over every distinct provider referenced by `tasks`. Stops at
  // the first failure. The result is keyed by provider name.
  bool ResolveAll(const std::vector<matrix::Task>& tasks,
                  const std::vector<config::ModelSpec>& models,
                  std::map<std::string, ResolvedCredential>& resolved,
                  core::errors::EvalError& error) const;

private:
  std::optional<std::string> LookupSecretsFile(std::string_view key) const;

  std::filesystem::path secrets_file_;
  EnvLookup env_lookup_;
};

// Masks all but the last four characters for console display.
std::string MaskSecret(std::string_view secret);

} // namespace nucleobench::credentials
