#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace nucleobench::config {

// One agent model under evaluation. `provider` selects the credential
// strategy; `model_identifier` is the id the agent tool expects.
struct ModelSpec {
  std::string name;
  std::string provider;
  std::string model_identifier;

  bool operator==(const ModelSpec& other) const = default;
};

// Parses the models document:
//   {"models": [{"name": "...", "provider": "...", "model_id": "..."}, ...]}
// (`model` is accepted in place of `models`). Every entry needs non-empty
// string fields and a unique name; providers must be known. An empty list is
// an error.
bool ParseModelCatalogText(std::string_view json_text, std::vector<ModelSpec>& models,
                           std::string& error);

bool LoadModelCatalogFile(const std::filesystem::path& path, std::vector<ModelSpec>& models,
                          std::string& error);

} // namespace nucleobench::config
