/**
 * @file policy_store.cpp
 * @brief Policy store: engine discovery, protection tiers and overrides
 */

#include "engwall/policy.hpp"

#include "engwall/common.hpp"
#include "engwall/logging.hpp"

#include <system_error>
#include <utility>

namespace engwall::policy {

namespace {

[[nodiscard]] EngineSet camelize_all(const std::vector<std::string>& names)
{
    EngineSet result;
    for (const auto& name : names) {
        result.insert(common::camelize(name));
    }
    return result;
}

}  // namespace

PolicyStore::PolicyStore(config::PolicyConfig config)
    : m_config(std::move(config))
    , m_engines_path(common::normalize_directory(m_config.engines_path))
    , m_unprotected(camelize_all(m_config.unprotected_engines))
    , m_strongly_protected(camelize_all(m_config.strongly_protected_engines))
{
    // Repeated entries for the same engine accumulate.
    for (const auto& entry : m_config.overrides) {
        auto& allowed = m_overrides[common::camelize(entry.engine)];
        allowed.insert(allowed.end(), entry.allowed_modules.begin(), entry.allowed_modules.end());
    }
}

const PolicyStore::DirectoryMap& PolicyStore::discovered_engines() const
{
    if (m_discovered) {
        return *m_discovered;
    }
    DirectoryMap engines;
    std::error_code ec;
    std::filesystem::directory_iterator it(m_engines_path, ec);
    if (ec) {
        ENGWALL_LOG_DEBUG("engines path {} not readable: {}", m_engines_path, ec.message());
    }
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_directory(type_ec)) {
            continue;
        }
        const auto& path = it->path();
        engines.emplace(common::camelize(path.filename().string()), path);
    }
    ENGWALL_LOG_DEBUG("discovered {} engine(s) under {}", engines.size(), m_engines_path);
    m_discovered = std::move(engines);
    return *m_discovered;
}

const EngineSet& PolicyStore::protected_engines() const
{
    if (!m_protected) {
        EngineSet engines;
        for (const auto& [name, _] : discovered_engines()) {
            if (!m_unprotected.contains(name)) {
                engines.insert(name);
            }
        }
        m_protected = std::move(engines);
    }
    return *m_protected;
}

bool PolicyStore::is_protected(std::string_view engine) const
{
    return protected_engines().contains(engine);
}

bool PolicyStore::is_strongly_protected(std::string_view engine) const
{
    return m_strongly_protected.contains(engine);
}

const std::vector<std::string>* PolicyStore::overrides_for(std::string_view engine) const
{
    const auto it = m_overrides.find(engine);
    return it == m_overrides.end() ? nullptr : &it->second;
}

std::optional<std::filesystem::path> PolicyStore::engine_directory(std::string_view engine) const
{
    const auto& engines = discovered_engines();
    const auto it = engines.find(engine);
    if (it == engines.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::filesystem::path> PolicyStore::engine_directories() const
{
    std::vector<std::filesystem::path> directories;
    for (const auto& [_, path] : discovered_engines()) {
        directories.push_back(path);
    }
    return directories;
}

std::optional<std::string> PolicyStore::current_engine(std::string_view file_path) const
{
    const auto pos = file_path.rfind(m_engines_path);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    std::string_view rest = file_path.substr(pos + m_engines_path.size());
    rest = rest.substr(0, rest.find('/'));
    if (rest.empty()) {
        return std::nullopt;
    }
    return common::camelize(rest);
}

}  // namespace engwall::policy
