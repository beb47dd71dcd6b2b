#include "config/provider_registry.hpp"

#include <array>

namespace nucleobench::config {

namespace {

struct ProviderRow {
  std::string_view name;
  std::string_view env_var;
  std::string_view provider_id;
};

constexpr std::array<ProviderRow, 4> kProviders = {{
    {"openrouter", "OPENROUTER_API_KEY", "openrouter"},
    {"zai-coding-plan", "GLM_CODING_API_KEY", "zai-coding-plan"},
    {"anthropic", "ANTHROPIC_API_KEY", "anthropic"},
    {"openai", "OPENAI_API_KEY", "openai"},
}};

} // namespace

std::vector<std::string> KnownProviderNames() {
  std::vector<std::string> names;
  names.reserve(kProviders.size());
  for (const auto& row : kProviders) {
    names.emplace_back(row.name);
  }
  return names;
}

bool LookupProvider(std::string_view name, ProviderInfo& info, std::string& error) {
  for (const auto& row : kProviders) {
    if (row.name == name) {
      info.name = std::string(row.name);
      info.env_var = std::string(row.env_var);
      info.provider_id = std::string(row.provider_id);
      return true;
    }
  }

  std::string known;
  for (const auto& row : kProviders) {
    if (!known.empty()) {
      known += ", ";
    }
    known += row.name;
  }
  error = "unknown provider: " + std::string(name) + " (available: " + known + ")";
  return false;
}

} // namespace nucleobench::config
