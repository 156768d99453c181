/**
 * @file api_metadata.cpp
 * @brief Engine API artifact reader with checksum-invalidated cache
 */

#include "engwall/api_metadata.hpp"

#include "engwall/logging.hpp"

#include <chrono>
#include <fstream>
#include <iterator>
#include <optional>
#include <system_error>

namespace engwall::api {

namespace {

[[nodiscard]] std::optional<std::string> read_text(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

[[nodiscard]] std::vector<std::string> read_artifact(const std::filesystem::path& api_dir,
                                                     ArtifactKind kind)
{
    const auto path = api_dir / artifact_file_name(kind);
    auto text = read_text(path);
    if (!text) {
        return {};
    }
    auto entries = parse_artifact_list(*text);
    if (entries.empty()) {
        ENGWALL_LOG_DEBUG("{} declares no entries or does not have the expected shape",
                          path.string());
    }
    return entries;
}

[[nodiscard]] std::int64_t mtime_seconds(const std::filesystem::path& path)
{
    std::error_code ec;
    const auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return 0;
    }
    return std::chrono::duration_cast<std::chrono::seconds>(mtime.time_since_epoch()).count();
}

}  // namespace

std::filesystem::path api_directory(const std::filesystem::path& engine_dir)
{
    const auto name = engine_dir.filename();
    auto rails_layout = engine_dir / "app" / "api" / name / "api";
    std::error_code ec;
    if (std::filesystem::is_directory(rails_layout, ec)) {
        return rails_layout;
    }
    return engine_dir / "api";
}

std::int64_t modified_time_checksum(const std::filesystem::path& api_dir)
{
    std::int64_t sum = 0;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(api_dir, ec);
    for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            sum += mtime_seconds(it->path());
        }
    }
    return sum;
}

ApiMetadataReader::ApiMetadataReader(const policy::PolicyStore& policy)
    : m_policy(policy)
{}

const std::vector<std::string>& ApiMetadataReader::allowlist(std::string_view engine)
{
    return artifacts_for(engine).allowlist;
}

const std::vector<std::string>& ApiMetadataReader::legacy_dependents(std::string_view engine)
{
    return artifacts_for(engine).legacy_dependents;
}

std::int64_t ApiMetadataReader::checksum() const
{
    std::int64_t sum = 0;
    for (const auto& engine_dir : m_policy.engine_directories()) {
        sum += modified_time_checksum(api_directory(engine_dir));
    }
    return sum;
}

const ApiMetadataReader::Artifacts& ApiMetadataReader::artifacts_for(std::string_view engine)
{
    const auto engine_dir = m_policy.engine_directory(engine);
    if (!engine_dir) {
        static const Artifacts kEmpty{};
        return kEmpty;
    }
    const auto api_dir = api_directory(*engine_dir);
    const std::int64_t checksum = modified_time_checksum(api_dir);

    auto it = m_cache.find(engine);
    if (it != m_cache.end() && it->second.checksum == checksum) {
        return it->second;
    }
    if (it == m_cache.end()) {
        it = m_cache.emplace(std::string(engine), Artifacts{}).first;
    } else {
        ENGWALL_LOG_DEBUG("API artifacts of {} changed, reloading", engine);
    }
    it->second = load(api_dir, checksum);
    return it->second;
}

ApiMetadataReader::Artifacts ApiMetadataReader::load(const std::filesystem::path& api_dir,
                                                     std::int64_t checksum)
{
    ++m_load_count;
    Artifacts artifacts;
    artifacts.checksum = checksum;
    artifacts.allowlist = read_artifact(api_dir, ArtifactKind::kAllowlist);
    if (artifacts.allowlist.empty()) {
        artifacts.allowlist = read_artifact(api_dir, ArtifactKind::kWhitelist);
    }
    artifacts.legacy_dependents = read_artifact(api_dir, ArtifactKind::kLegacyDependents);
    return artifacts;
}

}  // namespace engwall::api
