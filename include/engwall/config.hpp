#pragma once

/**
 * @file config.hpp
 * @brief Boundary policy configuration (engwall_config.v1)
 */

#include "engwall/common.hpp"

#include <array>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace engwall::config {

/// Default base type whose presence in an ancestry list marks a persistence model.
inline constexpr const char* kDefaultPersistenceBaseType = "ActiveRecord::Base";

/// Default oracle command timeout.
inline constexpr std::chrono::milliseconds kDefaultOracleTimeout{10'000};

/// Runtime query used when no Command is configured.
inline constexpr std::array<const char*, 3> kDefaultOracleCommand{"rails",
                                                                  "runner",
                                                                  "puts {}.ancestors"};

struct EngineOverride
{
    std::string engine;                        ///< Engine granted access (raw, not camelized)
    std::vector<std::string> allowed_modules;  ///< Fully qualified constants it may access
};

struct OracleOptions
{
    /// argv template; every "{}" inside an argument is replaced by the constant name.
    std::vector<std::string> command{kDefaultOracleCommand.begin(), kDefaultOracleCommand.end()};
    std::string persistence_base_type = kDefaultPersistenceBaseType;
    std::chrono::milliseconds timeout = kDefaultOracleTimeout;
    /// JSON array of model names, answered in-process instead of running `command`.
    std::optional<std::filesystem::path> model_manifest;
    /// Treat every constant as a model without asking a runtime.
    bool assume_all_models = false;
};

/**
 * Raw policy settings. Engine names are kept as written; normalization is
 * done by policy::PolicyStore.
 */
struct PolicyConfig
{
    std::string engines_path;
    std::vector<std::string> unprotected_engines;
    std::vector<std::string> strongly_protected_engines;
    std::vector<EngineOverride> overrides;
    std::optional<OracleOptions> oracle;
};

/**
 * Build a PolicyConfig from an already validated document.
 * Relative ModelManifest paths are resolved against `base_dir`.
 */
[[nodiscard]] PolicyConfig from_json(const nlohmann::json& document,
                                     const std::filesystem::path& base_dir = {});

/**
 * Validate a document against engwall_config.v1 and convert it.
 */
[[nodiscard]] engwall::Result<PolicyConfig> parse_config(const nlohmann::json& document,
                                                         const std::filesystem::path& schema_dir,
                                                         const std::filesystem::path& base_dir = {});

/**
 * Read, validate and convert a configuration file.
 */
[[nodiscard]] engwall::Result<PolicyConfig> load_config(const std::filesystem::path& path,
                                                        const std::filesystem::path& schema_dir);

}  // namespace engwall::config
