#pragma once

/**
 * @file model_oracle.hpp
 * @brief Oracle answering whether a constant is a persistence-backed model
 */

#include "engwall/common.hpp"
#include "engwall/config.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace engwall::oracle {

class ModelOracle
{
public:
    virtual ~ModelOracle() = default;

    /// True if `constant_name` (fully qualified, no leading "::") is a persistence model.
    [[nodiscard]] virtual bool is_persistence_model(std::string_view constant_name) = 0;
};

/// Treats every constant as a model. Only used when AssumeAllModels is set.
class AllModelsOracle final : public ModelOracle
{
public:
    [[nodiscard]] bool is_persistence_model(std::string_view) override { return true; }
};

/// In-process oracle over a fixed set of model names.
class StaticModelOracle final : public ModelOracle
{
public:
    explicit StaticModelOracle(std::vector<std::string> model_names);

    [[nodiscard]] bool is_persistence_model(std::string_view constant_name) override;

private:
    std::set<std::string, std::less<>> m_models;
};

/**
 * Runs an external command per query and looks for the persistence base type
 * among the whitespace-separated tokens it prints.
 *
 * Any failure (spawn error, non-zero exit, timeout, a name that is not a
 * plain constant path) answers false.
 */
class CommandModelOracle final : public ModelOracle
{
public:
    explicit CommandModelOracle(config::OracleOptions options);

    [[nodiscard]] bool is_persistence_model(std::string_view constant_name) override;

    /// argv for `constant_name`, with every "{}" replaced.
    [[nodiscard]] std::vector<std::string> command_for(std::string_view constant_name) const;

private:
    config::OracleOptions m_options;
};

/// Memoizes another oracle per constant name for the lifetime of the run.
class CachingModelOracle final : public ModelOracle
{
public:
    explicit CachingModelOracle(std::unique_ptr<ModelOracle> inner);

    [[nodiscard]] bool is_persistence_model(std::string_view constant_name) override;

    /// Number of queries forwarded to the wrapped oracle.
    [[nodiscard]] std::size_t miss_count() const noexcept { return m_misses; }

private:
    std::unique_ptr<ModelOracle> m_inner;
    std::unordered_map<std::string, bool> m_answers;
    std::size_t m_misses = 0;
};

/// True for `Foo`, `Foo::Bar_2`; false for anything a shell or runtime could misread.
[[nodiscard]] bool is_plain_constant_path(std::string_view name) noexcept;

/**
 * Read a model manifest: a JSON array of fully qualified model names.
 */
[[nodiscard]] engwall::Result<std::vector<std::string>>
load_model_manifest(const std::filesystem::path& path);

/**
 * Build the oracle described by the configuration, wrapped in a cache.
 *  - no options: CommandModelOracle running kDefaultOracleCommand; without a
 *    runtime on PATH every query fails and answers false
 *  - AssumeAllModels set: AllModelsOracle
 *  - ModelManifest set: StaticModelOracle over the manifest
 *  - otherwise: CommandModelOracle
 */
[[nodiscard]] engwall::Result<std::unique_ptr<ModelOracle>>
make_oracle(const std::optional<config::OracleOptions>& options);

}  // namespace engwall::oracle
