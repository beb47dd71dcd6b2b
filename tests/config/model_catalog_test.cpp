#include "config/model_catalog.hpp"
#include "config/provider_registry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using nucleobench::config::ModelSpec;
using nucleobench::config::ParseModelCatalogText;

TEST_CASE("Model catalog parses every entry in order", "[config][models]") {
  const std::string text = R"({
  "models": [
    {"name": "glm-4.6", "provider": "zai-coding-plan", "model_id": "glm-4.6"},
    {"name": "qwen3-coder", "provider": "openrouter", "model_id": "qwen/qwen3-coder"}
  ]
})";

  std::vector<ModelSpec> models;
  std::string error;
  REQUIRE(ParseModelCatalogText(text, models, error));
  REQUIRE(models.size() == 2U);
  REQUIRE(models[0].name == "glm-4.6");
  REQUIRE(models[0].provider == "zai-coding-plan");
  REQUIRE(models[1].model_identifier == "qwen/qwen3-coder");
}

TEST_CASE("Model catalog accepts the singular list key", "[config][models]") {
  std::vector<ModelSpec> models;
  std::string error;
  REQUIRE(ParseModelCatalogText(
      R"({"model": [{"name": "a", "provider": "openai", "model_id": "gpt-x"}]})", models, error));
  REQUIRE(models.size() == 1U);
}

TEST_CASE("Model catalog rejects invalid documents", "[config][models]") {
  std::vector<ModelSpec> models;
  std::string error;

  REQUIRE_FALSE(ParseModelCatalogText("not json", models, error));
  REQUIRE(error.find("invalid models JSON") != std::string::npos);

  REQUIRE_FALSE(ParseModelCatalogText(R"({"models": []})", models, error));
  REQUIRE(error == "no models found in config");

  REQUIRE_FALSE(ParseModelCatalogText(R"({"models": [{"name": "a", "provider": "openai"}]})",
                                      models, error));
  REQUIRE(error == "models[0].model_id is required");

  REQUIRE_FALSE(ParseModelCatalogText(
      R"({"models": [{"name": "a", "provider": "nobody", "model_id": "x"}]})", models, error));
  REQUIRE(error.find("models[0]") != std::string::npos);

  REQUIRE_FALSE(ParseModelCatalogText(
      R"({"models": [{"name": "../a", "provider": "openai", "model_id": "x"}]})", models, error));
  REQUIRE(models.empty());
}

TEST_CASE("Model catalog rejects duplicate names", "[config][models]") {
  const std::string text = R"({"models": [
    {"name": "a", "provider": "openai", "model_id": "x"},
    {"name": "a", "provider": "anthropic", "model_id": "y"}
  ]})";

  std::vector<ModelSpec> models;
  std::string error;
  REQUIRE_FALSE(ParseModelCatalogText(text, models, error));
  REQUIRE(error == "duplicate model name: a");
  REQUIRE(models.empty());
}

TEST_CASE("Provider registry maps providers to credential variables", "[config][providers]") {
  nucleobench::config::ProviderInfo info;
  std::string error;
  REQUIRE(nucleobench::config::LookupProvider("zai-coding-plan", info, error));
  REQUIRE(info.env_var == "GLM_CODING_API_KEY");
  REQUIRE(nucleobench::config::LookupProvider("openrouter", info, error));
  REQUIRE(info.env_var == "OPENROUTER_API_KEY");
  REQUIRE_FALSE(nucleobench::config::LookupProvider("unknown", info, error));
  REQUIRE_FALSE(error.empty());
}
