#pragma once

/**
 * @file api_metadata.hpp
 * @brief Engine API artifacts: allow-lists, legacy dependents, change checksum
 */

#include "engwall/policy.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace engwall::api {

enum class ArtifactKind {
    kAllowlist,         ///< api/_allowlist.rb
    kWhitelist,         ///< api/_whitelist.rb (fallback for an empty allow-list)
    kLegacyDependents,  ///< api/_legacy_dependents.rb
};

[[nodiscard]] std::string_view artifact_file_name(ArtifactKind kind) noexcept;

/**
 * Extract the list literal declared by an artifact.
 *
 * Expected shape:
 *
 *     module MyEngine::Api::Allowlist
 *       PUBLIC_MODULES = [
 *         MyEngine::BarService,
 *         "app/models/legacy.rb",
 *       ]
 *     end
 *
 * Matching is structural and textual; nothing is evaluated. String entries
 * lose their quotes, constant entries lose any leading "::". Text that does
 * not have this shape yields an empty list.
 */
[[nodiscard]] std::vector<std::string> parse_artifact_list(std::string_view source);

/**
 * API directory of an engine: `<dir>/app/api/<name>/api` when present
 * (Rails engine layout), otherwise `<dir>/api`.
 */
[[nodiscard]] std::filesystem::path api_directory(const std::filesystem::path& engine_dir);

/**
 * Sum of the modification times (seconds) of every regular file below
 * `api_dir`. A missing directory sums to 0.
 */
[[nodiscard]] std::int64_t modified_time_checksum(const std::filesystem::path& api_dir);

/**
 * Lazily reads and caches each engine's API artifacts.
 *
 * An entry is reused for as long as the modification-time checksum of the
 * engine's API directory is unchanged.
 */
class ApiMetadataReader
{
public:
    explicit ApiMetadataReader(const policy::PolicyStore& policy);

    /// Allow-listed constants of `engine` (_allowlist, falling back to _whitelist).
    [[nodiscard]] const std::vector<std::string>& allowlist(std::string_view engine);

    /// File path fragments exempted from `engine`'s boundary.
    [[nodiscard]] const std::vector<std::string>& legacy_dependents(std::string_view engine);

    /// Modification-time checksum over the API directories of all engines.
    [[nodiscard]] std::int64_t checksum() const;

    /// Number of times artifacts were (re)read from disk.
    [[nodiscard]] std::size_t load_count() const noexcept { return m_load_count; }

private:
    struct Artifacts
    {
        std::int64_t checksum = 0;
        std::vector<std::string> allowlist;
        std::vector<std::string> legacy_dependents;
    };

    const Artifacts& artifacts_for(std::string_view engine);
    [[nodiscard]] Artifacts load(const std::filesystem::path& api_dir, std::int64_t checksum);

    const policy::PolicyStore& m_policy;
    std::map<std::string, Artifacts, std::less<>> m_cache;
    std::size_t m_load_count = 0;
};

}  // namespace engwall::api
