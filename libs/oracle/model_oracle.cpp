/**
 * @file model_oracle.cpp
 * @brief Persistence-model oracles: static, command-backed and caching
 */

#include "engwall/model_oracle.hpp"

#include "engwall/logging.hpp"
#include "engwall/schema_validate.hpp"
#include "subprocess.hpp"

#include <cctype>
#include <ranges>
#include <sstream>
#include <utility>

namespace engwall::oracle {

namespace {

constexpr std::string_view kPlaceholder = "{}";

[[nodiscard]] std::string substitute(std::string_view pattern, std::string_view value)
{
    std::string out;
    std::size_t pos = 0;
    while (pos < pattern.size()) {
        const auto hit = pattern.find(kPlaceholder, pos);
        if (hit == std::string_view::npos) {
            out.append(pattern.substr(pos));
            break;
        }
        out.append(pattern.substr(pos, hit - pos));
        out.append(value);
        pos = hit + kPlaceholder.size();
    }
    return out;
}

[[nodiscard]] bool output_mentions(const std::string& text, std::string_view token)
{
    std::istringstream in(text);
    std::string word;
    while (in >> word) {
        if (word == token) {
            return true;
        }
    }
    return false;
}

}  // namespace

bool is_plain_constant_path(std::string_view name) noexcept
{
    if (name.empty()) {
        return false;
    }
    for (const auto segment : name | std::views::split(std::string_view("::"))) {
        std::string_view part(segment.begin(), segment.end());
        if (part.empty() || std::isupper(static_cast<unsigned char>(part.front())) == 0) {
            return false;
        }
        for (const char c : part) {
            if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
                return false;
            }
        }
    }
    return true;
}

// ============================================================================
// StaticModelOracle
// ============================================================================

StaticModelOracle::StaticModelOracle(std::vector<std::string> model_names)
    : m_models(std::make_move_iterator(model_names.begin()),
               std::make_move_iterator(model_names.end()))
{}

bool StaticModelOracle::is_persistence_model(std::string_view constant_name)
{
    return m_models.contains(constant_name);
}

// ============================================================================
// CommandModelOracle
// ============================================================================

CommandModelOracle::CommandModelOracle(config::OracleOptions options)
    : m_options(std::move(options))
{}

std::vector<std::string> CommandModelOracle::command_for(std::string_view constant_name) const
{
    std::vector<std::string> argv;
    argv.reserve(m_options.command.size());
    for (const auto& arg : m_options.command) {
        argv.push_back(substitute(arg, constant_name));
    }
    return argv;
}

bool CommandModelOracle::is_persistence_model(std::string_view constant_name)
{
    if (!is_plain_constant_path(constant_name)) {
        ENGWALL_LOG_DEBUG("not querying oracle for non-constant name '{}'", constant_name);
        return false;
    }
    auto result = run_command(command_for(constant_name), m_options.timeout);
    if (!result) {
        ENGWALL_LOG_WARN("model oracle query for {} failed ({}): {}",
                         constant_name,
                         result.error().code,
                         result.error().message);
        return false;
    }
    if (result->exit_code != 0) {
        ENGWALL_LOG_WARN("model oracle query for {} exited with status {}",
                         constant_name,
                         result->exit_code);
        return false;
    }
    return output_mentions(result->stdout_text, m_options.persistence_base_type);
}

// ============================================================================
// CachingModelOracle
// ============================================================================

CachingModelOracle::CachingModelOracle(std::unique_ptr<ModelOracle> inner)
    : m_inner(std::move(inner))
{}

bool CachingModelOracle::is_persistence_model(std::string_view constant_name)
{
    std::string key(constant_name);
    if (const auto it = m_answers.find(key); it != m_answers.end()) {
        return it->second;
    }
    ++m_misses;
    const bool answer = m_inner->is_persistence_model(constant_name);
    m_answers.emplace(std::move(key), answer);
    return answer;
}

// ============================================================================
// Factory
// ============================================================================

engwall::Result<std::vector<std::string>> load_model_manifest(const std::filesystem::path& path)
{
    auto document = common::read_json_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    if (!document->is_array()) {
        return std::unexpected(Error::make(
            "InvalidManifest", "model manifest must be a JSON array: " + path.string()));
    }
    std::vector<std::string> names;
    for (const auto& entry : *document) {
        if (!entry.is_string()) {
            return std::unexpected(Error::make(
                "InvalidManifest", "model manifest entries must be strings: " + path.string()));
        }
        names.emplace_back(common::strip_leading_colons(entry.get<std::string>()));
    }
    return names;
}

engwall::Result<std::unique_ptr<ModelOracle>>
make_oracle(const std::optional<config::OracleOptions>& options)
{
    std::unique_ptr<ModelOracle> inner;
    if (!options) {
        ENGWALL_LOG_DEBUG("no ModelOracle configured, querying the runtime with '{}'",
                          config::kDefaultOracleCommand.back());
        inner = std::make_unique<CommandModelOracle>(config::OracleOptions{});
    } else if (options->assume_all_models) {
        inner = std::make_unique<AllModelsOracle>();
    } else if (options->model_manifest) {
        auto names = load_model_manifest(*options->model_manifest);
        if (!names) {
            return std::unexpected(names.error());
        }
        ENGWALL_LOG_DEBUG("model manifest {} lists {} model(s)",
                          options->model_manifest->string(),
                          names->size());
        inner = std::make_unique<StaticModelOracle>(std::move(*names));
    } else if (!options->command.empty()) {
        inner = std::make_unique<CommandModelOracle>(*options);
    } else {
        return std::unexpected(Error::make(
            "InvalidConfig", "ModelOracle Command must not be empty"));
    }
    return std::unique_ptr<ModelOracle>(std::make_unique<CachingModelOracle>(std::move(inner)));
}

}  // namespace engwall::oracle
