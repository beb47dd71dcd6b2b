#include "credentials/credential_resolver.hpp"

#include "config/provider_registry.hpp"
#include "core/fs_utils.hpp"

#include <cctype>
#include <cstdlib>
#include <set>
#include <utility>

namespace fs = std::filesystem;

namespace nucleobench::credentials {

namespace {

std::string_view TrimView(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

std::string_view StripChar(std::string_view text, char ch) {
  while (!text.empty() && text.front() == ch) {
    text.remove_prefix(1);
  }
  while (!text.empty() && text.back() == ch) {
    text.remove_suffix(1);
  }
  return text;
}

// Double quotes first, then single quotes, each from both ends and unpaired
// ones included: `"abc` and `"abc'` both read as `abc`.
std::string_view StripQuotes(std::string_view value) {
  return StripChar(StripChar(value, '"'), '\'');
}

} // namespace

EnvLookup ProcessEnvLookup() {
  return [](std::string_view name) -> std::optional<std::string> {
    const char* raw = std::getenv(std::string(name).c_str());
    if (raw == nullptr) {
      return std::nullopt;
    }
    return std::string(raw);
  };
}

std::optional<std::string> FindSecretInText(std::string_view text, std::string_view key) {
  const std::string prefix = std::string(key) + "=";
  std::size_t cursor = 0;
  while (cursor <= text.size()) {
    std::size_t line_end = text.find('\n', cursor);
    if (line_end == std::string_view::npos) {
      line_end = text.size();
    }
    const std::string_view line = TrimView(text.substr(cursor, line_end - cursor));
    if (line.substr(0, prefix.size()) == prefix) {
      return std::string(StripQuotes(TrimView(line.substr(prefix.size()))));
    }
    if (line_end == text.size()) {
      break;
    }
    cursor = line_end + 1;
  }
  return std::nullopt;
}

CredentialResolver::CredentialResolver(fs::path secrets_file, EnvLookup env_lookup)
    : secrets_file_(std::move(secrets_file)), env_lookup_(std::move(env_lookup)) {}

std::optional<std::string> CredentialResolver::LookupSecretsFile(std::string_view key) const {
  if (secrets_file_.empty() || !core::IsRegularFile(secrets_file_)) {
    return std::nullopt;
  }
  std::string text;
  std::string read_error;
  if (!core::ReadTextFile(secrets_file_, text, read_error)) {
    return std::nullopt;
  }
  return FindSecretInText(text, key);
}

bool CredentialResolver::Resolve(std::string_view provider, ResolvedCredential& credential,
                                 core::errors::EvalError& error) const {
  credential = ResolvedCredential{};
  error = core::errors::EvalError{};

  config::ProviderInfo info;
  std::string lookup_error;
  if (!config::LookupProvider(provider, info, lookup_error)) {
    error = {core::errors::EvalErrorCode::kConfiguration, lookup_error};
    return false;
  }

  credential.provider = info.name;
  credential.env_var = info.env_var;
  credential.provider_id = info.provider_id;

  if (env_lookup_) {
    const std::optional<std::string> from_env = env_lookup_(info.env_var);
    if (from_env.has_value() && !from_env->empty()) {
      credential.value = from_env.value();
      credential.source = "environment";
      return true;
    }
  }

  const std::optional<std::string> from_file = LookupSecretsFile(info.env_var);
  if (from_file.has_value() && !from_file->empty()) {
    credential.value = from_file.value();
    credential.source = secrets_file_.string();
    return true;
  }

  error = {core::errors::EvalErrorCode::kMissingCredential,
           info.env_var + " not found in " +
               (secrets_file_.empty() ? std::string("secrets file") : secrets_file_.string()) +
               " or environment"};
  return false;
}

bool CredentialResolver::ResolveAll(const std::vector<matrix::Task>& tasks,
                                    const std::vector<config::ModelSpec>& models,
                                    std::map<std::string, ResolvedCredential>& resolved,
                                    core::errors::EvalError& error) const {
  resolved.clear();
  error = core::errors::EvalError{};

  std::set<std::string> providers;
  for (const auto& task : tasks) {
    const config::ModelSpec* model = nullptr;
    for (const auto& candidate : models) {
      if (candidate.name == task.model_id) {
        model = &candidate;
        break;
      }
    }
    if (model == nullptr) {
      error = {core::errors::EvalErrorCode::kConfiguration,
               "task references unknown model: " + task.model_id};
      return false;
    }
    providers.insert(model->provider);
  }

  for (const std::string& provider : providers) {
    ResolvedCredential credential;
    if (!Resolve(provider, credential, error)) {
      resolved.clear();
      return false;
    }
    resolved.emplace(provider, std::move(credential));
  }
  return true;
}

std::string MaskSecret(std::string_view secret) {
  if (secret.size() <= 4U) {
    return "********";
  }
  return "********" + std::string(secret.substr(secret.size() - 4U));
}

} // namespace nucleobench::credentials
