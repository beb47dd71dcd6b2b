#include "config/model_catalog.hpp"

#include "config/provider_registry.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <set>
#include <utility>

namespace fs = std::filesystem;

namespace nucleobench::config {

namespace {

using JsonValue = core::json::Value;

bool ReadRequiredString(const JsonValue& entry, std::string_view key, std::size_t index,
                        std::string& out, std::string& error) {
  const JsonValue* field = core::json::FindMember(entry, key);
  const std::string location = "models[" + std::to_string(index) + "]." + std::string(key);
  if (field == nullptr) {
    error = location + " is required";
    return false;
  }
  if (field->type != JsonValue::Type::kString) {
    error = location + " must be a string";
    return false;
  }
  if (field->string_value.empty()) {
    error = location + " cannot be empty";
    return false;
  }
  out = field->string_value;
  return true;
}

// Model names become result directory names.
bool IsPathSafeName(std::string_view name) {
  return name != "." && name != ".." && name.find('/') == std::string_view::npos &&
         name.find('\\') == std::string_view::npos;
}

} // namespace

bool ParseModelCatalogText(std::string_view json_text, std::vector<ModelSpec>& models,
                           std::string& error) {
  models.clear();

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    error = "invalid models JSON: " + parse_error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "models document root must be a JSON object";
    return false;
  }

  const JsonValue* list = core::json::FindMember(root, "models");
  if (list == nullptr) {
    list = core::json::FindMember(root, "model");
  }
  if (list == nullptr || list->type != JsonValue::Type::kArray) {
    error = "models document must contain a 'models' array";
    return false;
  }
  if (list->array_value.empty()) {
    error = "no models found in config";
    return false;
  }

  std::set<std::string> seen_names;
  for (std::size_t i = 0; i < list->array_value.size(); ++i) {
    const JsonValue& entry = list->array_value[i];
    if (entry.type != JsonValue::Type::kObject) {
      error = "models[" + std::to_string(i) + "] must be an object";
      models.clear();
      return false;
    }

    ModelSpec spec;
    if (!ReadRequiredString(entry, "name", i, spec.name, error) ||
        !ReadRequiredString(entry, "provider", i, spec.provider, error) ||
        !ReadRequiredString(entry, "model_id", i, spec.model_identifier, error)) {
      models.clear();
      return false;
    }

    if (!IsPathSafeName(spec.name)) {
      error = "models[" + std::to_string(i) + "].name must not contain path separators: " +
              spec.name;
      models.clear();
      return false;
    }

    ProviderInfo provider;
    if (!LookupProvider(spec.provider, provider, error)) {
      error = "models[" + std::to_string(i) + "]: " + error;
      models.clear();
      return false;
    }

    if (!seen_names.insert(spec.name).second) {
      error = "duplicate model name: " + spec.name;
      models.clear();
      return false;
    }
    models.push_back(std::move(spec));
  }

  return true;
}

bool LoadModelCatalogFile(const fs::path& path, std::vector<ModelSpec>& models,
                          std::string& error) {
  models.clear();
  if (!core::IsRegularFile(path)) {
    error = "models config not found: " + path.string();
    return false;
  }

  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }
  if (!ParseModelCatalogText(text, models, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

} // namespace nucleobench::config
