/**
 * @file test_policy_store.cpp
 * @brief Tests for engine discovery, protection tiers and overrides
 */

#include "engwall/policy.hpp"

#include "test_support.hpp"

#include <filesystem>

#include <gtest/gtest.h>

using engwall::config::EngineOverride;
using engwall::config::PolicyConfig;
using engwall::policy::PolicyStore;
using engwall::test::TempDir;

namespace {

class PolicyStoreTest : public ::testing::Test
{
protected:
    PolicyStoreTest()
        : m_temp_dir("engwall_policy_store_test")
    {
        for (const char* engine : {"billing", "order_items", "shipping", "legacy_tools"}) {
            std::filesystem::create_directories(engines_root() / engine);
        }
        engwall::test::write_text_file(engines_root() / "README.md", "not an engine\n");
    }

    [[nodiscard]] std::filesystem::path engines_root() const
    {
        return m_temp_dir.path() / "engines";
    }

    [[nodiscard]] PolicyConfig make_config() const
    {
        PolicyConfig config;
        config.engines_path = engines_root().string();
        config.unprotected_engines = {"legacy_tools"};
        config.strongly_protected_engines = {"shipping"};
        return config;
    }

private:
    TempDir m_temp_dir;
};

}  // namespace

TEST_F(PolicyStoreTest, DiscoversDirectoriesMinusUnprotected)
{
    const PolicyStore store(make_config());
    const auto& engines = store.protected_engines();
    EXPECT_EQ(engines.size(), 3U);
    EXPECT_TRUE(store.is_protected("Billing"));
    EXPECT_TRUE(store.is_protected("OrderItems"));
    EXPECT_TRUE(store.is_protected("Shipping"));
    EXPECT_FALSE(store.is_protected("LegacyTools"));
    EXPECT_FALSE(store.is_protected("README.md"));
    EXPECT_FALSE(store.is_protected("billing"));
}

TEST_F(PolicyStoreTest, NormalizesEnginesPath)
{
    const PolicyStore store(make_config());
    EXPECT_TRUE(store.engines_path().ends_with("/engines/"));
    EXPECT_FALSE(store.engines_path().ends_with("//"));
}

TEST_F(PolicyStoreTest, StronglyProtectedNamesAreCamelized)
{
    const PolicyStore store(make_config());
    EXPECT_TRUE(store.is_strongly_protected("Shipping"));
    EXPECT_FALSE(store.is_strongly_protected("Billing"));
}

TEST_F(PolicyStoreTest, RemembersEngineDirectories)
{
    const PolicyStore store(make_config());
    auto dir = store.engine_directory("OrderItems");
    ASSERT_TRUE(dir.has_value());
    EXPECT_EQ(dir->filename(), "order_items");
    EXPECT_FALSE(store.engine_directory("Unknown").has_value());
    EXPECT_EQ(store.engine_directories().size(), 4U);
}

TEST_F(PolicyStoreTest, OverridesAreKeyedByCamelizedEngine)
{
    auto config = make_config();
    config.overrides.push_back(
        EngineOverride{.engine = "shipping", .allowed_modules = {"Billing::InternalHelper"}});
    config.overrides.push_back(
        EngineOverride{.engine = "Shipping", .allowed_modules = {"Billing::Rates"}});
    const PolicyStore store(std::move(config));

    const auto* allowed = store.overrides_for("Shipping");
    ASSERT_NE(allowed, nullptr);
    ASSERT_EQ(allowed->size(), 2U);
    EXPECT_EQ((*allowed)[0], "Billing::InternalHelper");
    EXPECT_EQ((*allowed)[1], "Billing::Rates");
    EXPECT_EQ(store.overrides_for("Billing"), nullptr);
}

TEST_F(PolicyStoreTest, CurrentEngineFromFilePath)
{
    const PolicyStore store(make_config());
    const auto root = engines_root().string();
    EXPECT_EQ(store.current_engine(root + "/order_items/app/models/order_items/line.rb"),
              "OrderItems");
    EXPECT_EQ(store.current_engine(root + "/shipping/lib/shipping.rb"), "Shipping");
    EXPECT_FALSE(store.current_engine("app/models/user.rb").has_value());
}

TEST(PolicyStore, MissingEnginesPathYieldsNoEngines)
{
    PolicyConfig config;
    config.engines_path = "/nonexistent/engwall/engines";
    const PolicyStore store(std::move(config));
    EXPECT_TRUE(store.protected_engines().empty());
    EXPECT_FALSE(store.is_protected("Billing"));
}
