/**
 * @file test_model_oracle.cpp
 * @brief Tests for the persistence-model oracles
 */

#include "engwall/model_oracle.hpp"

#include "test_support.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

using engwall::config::OracleOptions;
using engwall::oracle::CachingModelOracle;
using engwall::oracle::CommandModelOracle;
using engwall::oracle::ModelOracle;
using engwall::oracle::StaticModelOracle;

namespace {

class CountingOracle final : public ModelOracle
{
public:
    explicit CountingOracle(int& calls)
        : m_calls(calls)
    {}

    [[nodiscard]] bool is_persistence_model(std::string_view constant_name) override
    {
        ++m_calls;
        return constant_name.starts_with("Billing::");
    }

private:
    int& m_calls;
};

/// Points PATH at a single directory for the lifetime of the object.
class ScopedPath
{
public:
    explicit ScopedPath(const std::filesystem::path& directory)
    {
        if (const char* previous = std::getenv("PATH")) {
            m_previous = previous;
        }
        ::setenv("PATH", directory.c_str(), 1);
    }
    ~ScopedPath()
    {
        if (m_previous) {
            ::setenv("PATH", m_previous->c_str(), 1);
        } else {
            ::unsetenv("PATH");
        }
    }
    ScopedPath(const ScopedPath&) = delete;
    ScopedPath& operator=(const ScopedPath&) = delete;
    ScopedPath(ScopedPath&&) = delete;
    ScopedPath& operator=(ScopedPath&&) = delete;

private:
    std::optional<std::string> m_previous;
};

void write_executable(const std::filesystem::path& path, std::string_view script)
{
    engwall::test::write_text_file(path, script);
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_all
                                     | std::filesystem::perms::group_read
                                     | std::filesystem::perms::group_exec);
}

[[nodiscard]] OracleOptions shell_options(const std::string& script)
{
    OracleOptions options;
    options.command = {"/bin/sh", "-c", script};
    options.timeout = std::chrono::milliseconds(5'000);
    return options;
}

}  // namespace

TEST(StaticModelOracle, AnswersFromItsSet)
{
    StaticModelOracle oracle({"Billing::Invoice", "Shipping::Box"});
    EXPECT_TRUE(oracle.is_persistence_model("Billing::Invoice"));
    EXPECT_FALSE(oracle.is_persistence_model("Billing::InvoiceService"));
}

TEST(AllModelsOracle, EverythingIsAModel)
{
    engwall::oracle::AllModelsOracle oracle;
    EXPECT_TRUE(oracle.is_persistence_model("Billing::Anything"));
}

TEST(CachingModelOracle, QueriesEachNameOnce)
{
    int calls = 0;
    CachingModelOracle oracle(std::make_unique<CountingOracle>(calls));
    EXPECT_TRUE(oracle.is_persistence_model("Billing::Invoice"));
    EXPECT_TRUE(oracle.is_persistence_model("Billing::Invoice"));
    EXPECT_FALSE(oracle.is_persistence_model("Shipping::Box"));
    EXPECT_FALSE(oracle.is_persistence_model("Shipping::Box"));
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(oracle.miss_count(), 2U);
}

TEST(PlainConstantPath, AcceptsOnlyConstantSyntax)
{
    using engwall::oracle::is_plain_constant_path;
    EXPECT_TRUE(is_plain_constant_path("Billing"));
    EXPECT_TRUE(is_plain_constant_path("Billing::Invoice_V2"));
    EXPECT_FALSE(is_plain_constant_path(""));
    EXPECT_FALSE(is_plain_constant_path("billing"));
    EXPECT_FALSE(is_plain_constant_path("Billing::"));
    EXPECT_FALSE(is_plain_constant_path("::Billing"));
    EXPECT_FALSE(is_plain_constant_path("Billing; rm -rf /"));
    EXPECT_FALSE(is_plain_constant_path("Billing.send(:x)"));
}

TEST(CommandModelOracle, SubstitutesPlaceholder)
{
    OracleOptions options;
    options.command = {"bin/rails", "runner", "puts {}.ancestors"};
    const CommandModelOracle oracle(options);
    const auto argv = oracle.command_for("Billing::Invoice");
    ASSERT_EQ(argv.size(), 3U);
    EXPECT_EQ(argv[0], "bin/rails");
    EXPECT_EQ(argv[2], "puts Billing::Invoice.ancestors");
}

TEST(CommandModelOracle, ArgumentsReachTheCommandUnsplit)
{
    OracleOptions options;
    options.command = {"/bin/sh",
                       "-c",
                       R"(if [ "$1" = "puts Billing::Invoice.ancestors" ]; then echo ActiveRecord::Base; fi)",
                       "sh",
                       "puts {}.ancestors"};
    CommandModelOracle oracle(options);
    EXPECT_TRUE(oracle.is_persistence_model("Billing::Invoice"));
    // The template is left untouched for later queries.
    EXPECT_EQ(oracle.command_for("Shipping::Box")[4], "puts Shipping::Box.ancestors");
    EXPECT_FALSE(oracle.is_persistence_model("Shipping::Box"));
}

TEST(CommandModelOracle, LooksForBaseTypeAmongOutputTokens)
{
    CommandModelOracle oracle(shell_options(
        "if [ {} = Billing::Invoice ]; then echo Billing::Invoice ApplicationRecord "
        "ActiveRecord::Base Object; else echo Billing::Rates Object; fi"));
    EXPECT_TRUE(oracle.is_persistence_model("Billing::Invoice"));
    EXPECT_FALSE(oracle.is_persistence_model("Billing::Rates"));
}

TEST(CommandModelOracle, BaseTypeMustMatchWholeToken)
{
    CommandModelOracle oracle(shell_options("echo ActiveRecord::BaseExtensions"));
    EXPECT_FALSE(oracle.is_persistence_model("Billing::Invoice"));
}

TEST(CommandModelOracle, FailuresAnswerFalse)
{
    CommandModelOracle failing(shell_options("echo ActiveRecord::Base; exit 3"));
    EXPECT_FALSE(failing.is_persistence_model("Billing::Invoice"));

    OracleOptions missing;
    missing.command = {"/nonexistent/engwall-oracle", "{}"};
    CommandModelOracle unspawnable(missing);
    EXPECT_FALSE(unspawnable.is_persistence_model("Billing::Invoice"));
}

TEST(CommandModelOracle, TimeoutAnswersFalse)
{
    auto options = shell_options("sleep 5; echo ActiveRecord::Base");
    options.timeout = std::chrono::milliseconds(100);
    CommandModelOracle oracle(options);

    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(oracle.is_persistence_model("Billing::Invoice"));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(4));
}

TEST(CommandModelOracle, CustomBaseType)
{
    auto options = shell_options("echo Sequel::Model");
    options.persistence_base_type = "Sequel::Model";
    CommandModelOracle oracle(options);
    EXPECT_TRUE(oracle.is_persistence_model("Billing::Invoice"));
}

TEST(CommandModelOracle, DoesNotRunForUnsafeNames)
{
    engwall::test::TempDir temp_dir("engwall_oracle_unsafe_test");
    const auto marker = temp_dir.path() / "ran";
    CommandModelOracle oracle(
        shell_options("touch " + marker.string() + "; echo ActiveRecord::Base"));
    EXPECT_FALSE(oracle.is_persistence_model("Billing$(id)"));
    EXPECT_FALSE(std::filesystem::exists(marker));
}

TEST(ModelManifest, LoadsNames)
{
    engwall::test::TempDir temp_dir("engwall_manifest_test");
    const auto path = temp_dir.path() / "models.json";
    engwall::test::write_text_file(path, R"(["Billing::Invoice", "::Shipping::Box"])");

    auto names = engwall::oracle::load_model_manifest(path);
    ASSERT_TRUE(names.has_value()) << names.error().message;
    ASSERT_EQ(names->size(), 2U);
    EXPECT_EQ((*names)[0], "Billing::Invoice");
    EXPECT_EQ((*names)[1], "Shipping::Box");
}

TEST(ModelManifest, RejectsNonArray)
{
    engwall::test::TempDir temp_dir("engwall_manifest_invalid_test");
    const auto path = temp_dir.path() / "models.json";
    engwall::test::write_text_file(path, R"({"models": []})");

    auto names = engwall::oracle::load_model_manifest(path);
    ASSERT_FALSE(names.has_value());
    EXPECT_EQ(names.error().code, "InvalidManifest");
}

TEST(MakeOracle, DefaultQueriesRailsRunner)
{
    engwall::test::TempDir temp_dir("engwall_default_oracle_test");
    write_executable(temp_dir.path() / "rails", R"(#!/bin/sh
if [ "$1" = runner ] && [ "$2" = "puts Billing::Invoice.ancestors" ]; then
  echo Billing::Invoice ApplicationRecord ActiveRecord::Base Object
fi
exit 0
)");
    const ScopedPath path(temp_dir.path());

    auto oracle = engwall::oracle::make_oracle(std::nullopt);
    ASSERT_TRUE(oracle.has_value()) << oracle.error().message;
    EXPECT_TRUE((*oracle)->is_persistence_model("Billing::Invoice"));
    EXPECT_FALSE((*oracle)->is_persistence_model("Billing::InvoiceService"));
}

TEST(MakeOracle, DefaultWithoutRuntimeReportsNoModels)
{
    engwall::test::TempDir temp_dir("engwall_default_oracle_missing_test");
    const ScopedPath path(temp_dir.path());

    auto oracle = engwall::oracle::make_oracle(std::nullopt);
    ASSERT_TRUE(oracle.has_value()) << oracle.error().message;
    EXPECT_FALSE((*oracle)->is_persistence_model("Billing::Invoice"));
    EXPECT_FALSE((*oracle)->is_persistence_model("Billing::InvoiceService"));
}

TEST(MakeOracle, AssumeAllModelsIsExplicit)
{
    OracleOptions options;
    options.assume_all_models = true;
    auto oracle = engwall::oracle::make_oracle(options);
    ASSERT_TRUE(oracle.has_value()) << oracle.error().message;
    EXPECT_TRUE((*oracle)->is_persistence_model("Billing::InvoiceService"));
}

TEST(MakeOracle, ManifestBeatsCommand)
{
    engwall::test::TempDir temp_dir("engwall_make_oracle_test");
    const auto path = temp_dir.path() / "models.json";
    engwall::test::write_text_file(path, R"(["Billing::Invoice"])");

    OracleOptions options;
    options.command = {"/bin/sh", "-c", "echo ActiveRecord::Base"};
    options.model_manifest = path;
    auto oracle = engwall::oracle::make_oracle(options);
    ASSERT_TRUE(oracle.has_value()) << oracle.error().message;
    EXPECT_TRUE((*oracle)->is_persistence_model("Billing::Invoice"));
    EXPECT_FALSE((*oracle)->is_persistence_model("Billing::Rates"));
}

TEST(MakeOracle, MissingManifestIsAnError)
{
    OracleOptions options;
    options.model_manifest = "/nonexistent/engwall/models.json";
    auto oracle = engwall::oracle::make_oracle(options);
    ASSERT_FALSE(oracle.has_value());
    EXPECT_EQ(oracle.error().code, "IOError");
}
