/**
 * @file test_schema_validate.cpp
 * @brief Tests for schema validation of configuration, tree and report documents
 */

#include "engwall/schema_validate.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using engwall::common::validate_document;

namespace {

constexpr const char* kSchemaDir = ENGWALL_SCHEMA_DIR;

}  // namespace

TEST(SchemaValidate, AcceptsMinimalConfig)
{
    const nlohmann::json config = {
        {"EnginesPath", "engines/"}
    };
    EXPECT_TRUE(validate_document(config, "engwall_config.v1", kSchemaDir).has_value());
}

TEST(SchemaValidate, AcceptsFullConfig)
{
    const nlohmann::json config = {
        {"EnginesPath", "engines/"},
        {"UnprotectedEngines", {"legacy"}},
        {"StronglyProtectedEngines", {"Shipping"}},
        {"EngineSpecificOverrides",
         {{{"Engine", "shipping"}, {"AllowedModules", {"Billing::InternalHelper"}}}}},
        {"ModelOracle",
         {{"Command", {"bin/rails", "runner", "puts {}.ancestors"}},
          {"PersistenceBaseType", "ActiveRecord::Base"},
          {"TimeoutMs", 5000}}},
    };
    auto result = validate_document(config, "engwall_config.v1", kSchemaDir);
    EXPECT_TRUE(result.has_value()) << (result ? "" : result.error().message);
}

TEST(SchemaValidate, RejectsConfigWithoutEnginesPath)
{
    const nlohmann::json config = {
        {"UnprotectedEngines", {"legacy"}}
    };
    auto result = validate_document(config, "engwall_config.v1", kSchemaDir);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaInvalid");
}

TEST(SchemaValidate, OracleCommandIsOptional)
{
    const nlohmann::json config = {
        {"EnginesPath", "engines/"},
        {"ModelOracle", {{"TimeoutMs", 100}, {"AssumeAllModels", false}}},
    };
    EXPECT_TRUE(validate_document(config, "engwall_config.v1", kSchemaDir).has_value());
}

TEST(SchemaValidate, RejectsEmptyOracleCommand)
{
    const nlohmann::json config = {
        {"EnginesPath", "engines/"},
        {"ModelOracle", {{"Command", nlohmann::json::array()}}},
    };
    EXPECT_FALSE(validate_document(config, "engwall_config.v1", kSchemaDir).has_value());
}

TEST(SchemaValidate, AcceptsBuiltTree)
{
    engwall::test::TreeBuilder builder("app/models/order.rb");
    builder.add_constant(std::nullopt, "Billing::Invoice", {.line = 3, .col = 5});
    auto result = validate_document(builder.to_json(), "reference_tree.v1", kSchemaDir);
    EXPECT_TRUE(result.has_value()) << (result ? "" : result.error().message);
}

TEST(SchemaValidate, RejectsUnknownNodeKind)
{
    const nlohmann::json tree = {
        {"schema_version", "reference_tree.v1"},
        {"file", "a.rb"},
        {"nodes", {{{"id", 0}, {"kind", "lambda"}}}},
    };
    EXPECT_FALSE(validate_document(tree, "reference_tree.v1", kSchemaDir).has_value());
}

TEST(SchemaValidate, MissingSchemaIsUnavailable)
{
    auto result = validate_document(nlohmann::json::object(), "no_such_schema.v1", kSchemaDir);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaUnavailable");
}

TEST(ReadJsonFile, ReportsParseErrors)
{
    engwall::test::TempDir temp_dir("engwall_read_json_test");
    const auto path = temp_dir.path() / "broken.json";
    engwall::test::write_text_file(path, "{\"EnginesPath\": ");

    auto result = engwall::common::read_json_file(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "ParseError");

    auto missing = engwall::common::read_json_file(temp_dir.path() / "absent.json");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, "IOError");
}
