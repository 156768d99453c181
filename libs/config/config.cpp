/**
 * @file config.cpp
 * @brief Boundary policy configuration loading
 */

#include "engwall/config.hpp"

#include "engwall/logging.hpp"
#include "engwall/schema_validate.hpp"
#include "engwall/version.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace engwall::config {

namespace {

constexpr std::string_view kConfigSchema = kConfigSchemaVersion;

[[nodiscard]] std::vector<std::string> string_list(const nlohmann::json& document,
                                                   const char* key)
{
    const auto it = document.find(key);
    if (it == document.end() || it->is_null()) {
        return {};
    }
    return it->get<std::vector<std::string>>();
}

[[nodiscard]] OracleOptions oracle_from_json(const nlohmann::json& node,
                                             const std::filesystem::path& base_dir)
{
    OracleOptions options;
    if (node.contains("Command")) {
        options.command = string_list(node, "Command");
    }
    options.persistence_base_type =
        node.value("PersistenceBaseType", std::string(kDefaultPersistenceBaseType));
    if (node.contains("TimeoutMs")) {
        options.timeout = std::chrono::milliseconds(node.at("TimeoutMs").get<std::int64_t>());
    }
    options.assume_all_models = node.value("AssumeAllModels", false);
    if (node.contains("ModelManifest")) {
        std::filesystem::path manifest = node.at("ModelManifest").get<std::string>();
        if (manifest.is_relative() && !base_dir.empty()) {
            manifest = base_dir / manifest;
        }
        options.model_manifest = std::move(manifest);
    }
    return options;
}

}  // namespace

PolicyConfig from_json(const nlohmann::json& document, const std::filesystem::path& base_dir)
{
    PolicyConfig config;
    config.engines_path = document.at("EnginesPath").get<std::string>();
    config.unprotected_engines = string_list(document, "UnprotectedEngines");
    config.strongly_protected_engines = string_list(document, "StronglyProtectedEngines");

    if (const auto it = document.find("EngineSpecificOverrides");
        it != document.end() && it->is_array()) {
        for (const auto& raw : *it) {
            config.overrides.push_back(
                EngineOverride{.engine = raw.at("Engine").get<std::string>(),
                               .allowed_modules = string_list(raw, "AllowedModules")});
        }
    }

    if (const auto it = document.find("ModelOracle"); it != document.end() && it->is_object()) {
        config.oracle = oracle_from_json(*it, base_dir);
    }
    return config;
}

engwall::Result<PolicyConfig> parse_config(const nlohmann::json& document,
                                           const std::filesystem::path& schema_dir,
                                           const std::filesystem::path& base_dir)
{
    if (auto validation = common::validate_document(document, kConfigSchema, schema_dir);
        !validation) {
        return std::unexpected(Error::make(
            "InvalidConfig", "configuration rejected: " + validation.error().message));
    }
    return from_json(document, base_dir);
}

engwall::Result<PolicyConfig> load_config(const std::filesystem::path& path,
                                          const std::filesystem::path& schema_dir)
{
    auto document = common::read_json_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    auto config = parse_config(*document, schema_dir, path.parent_path());
    if (!config) {
        return std::unexpected(config.error());
    }
    ENGWALL_LOG_DEBUG("loaded configuration {} (EnginesPath={}, {} override(s))",
                      path.string(),
                      config->engines_path,
                      config->overrides.size());
    return config;
}

}  // namespace engwall::config
