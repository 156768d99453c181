#pragma once

/**
 * @file policy.hpp
 * @brief Policy store: engine discovery, protection tiers and overrides
 */

#include "engwall/config.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace engwall::policy {

/// Namespace denoting non-engine application code.
inline constexpr std::string_view kMainAppName = "MainApp::EngineApi";

using EngineSet = std::set<std::string, std::less<>>;

/**
 * Normalized, read-mostly view of a PolicyConfig.
 *
 * Engine names from every source (directory names, config lists, override
 * keys, file paths) are camelized before comparison. The directory scan of
 * EnginesPath runs once, on first use; a missing directory yields no engines.
 */
class PolicyStore
{
public:
    explicit PolicyStore(config::PolicyConfig config);

    /// EnginesPath, normalized with exactly one trailing '/'.
    [[nodiscard]] const std::string& engines_path() const noexcept { return m_engines_path; }

    [[nodiscard]] const config::PolicyConfig& config() const noexcept { return m_config; }

    /// All discovered engines minus UnprotectedEngines.
    [[nodiscard]] const EngineSet& protected_engines() const;

    [[nodiscard]] bool is_protected(std::string_view engine) const;

    [[nodiscard]] bool is_strongly_protected(std::string_view engine) const;

    /// Constants `engine` may access directly, or nullptr if it has no override.
    [[nodiscard]] const std::vector<std::string>* overrides_for(std::string_view engine) const;

    /// Directory a discovered engine was found in.
    [[nodiscard]] std::optional<std::filesystem::path>
    engine_directory(std::string_view engine) const;

    /// Every discovered engine directory, protected or not, in name order.
    [[nodiscard]] std::vector<std::filesystem::path> engine_directories() const;

    /**
     * Engine owning `file_path`: the first path segment after the last
     * occurrence of EnginesPath, camelized. Empty for main application code.
     */
    [[nodiscard]] std::optional<std::string> current_engine(std::string_view file_path) const;

private:
    using DirectoryMap = std::map<std::string, std::filesystem::path, std::less<>>;

    const DirectoryMap& discovered_engines() const;

    config::PolicyConfig m_config;
    std::string m_engines_path;
    EngineSet m_unprotected;
    EngineSet m_strongly_protected;
    std::map<std::string, std::vector<std::string>, std::less<>> m_overrides;

    mutable std::optional<DirectoryMap> m_discovered;
    mutable std::optional<EngineSet> m_protected;
};

}  // namespace engwall::policy
