#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace nucleobench::config {

// How a provider's secret is located and how the agent tool addresses it.
struct ProviderInfo {
  std::string name;
  std::string env_var;
  std::string provider_id;
};

// Looks up a known provider by its configuration name. Returns false and sets
// `error` (listing the known providers) when the name is unknown.
bool LookupProvider(std::string_view name, ProviderInfo& info, std::string& error);

std::vector<std::string> KnownProviderNames();

} // namespace nucleobench::config
