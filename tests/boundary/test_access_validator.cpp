/**
 * @file test_access_validator.cpp
 * @brief Tests for the layered access policy
 */

#include "boundary_fixture.hpp"

#include <gtest/gtest.h>

using engwall::boundary::AccessReason;
using engwall::boundary::AccessValidator;
using engwall::config::EngineOverride;
using engwall::test::BoundaryTest;
using engwall::test::TreeBuilder;

namespace {

class AccessValidatorTest : public BoundaryTest
{
protected:
    /// Evaluate the innermost constant of `full_name` referenced from `file`.
    engwall::boundary::AccessDecision evaluate_reference(const std::string& file,
                                                         std::string_view full_name,
                                                         std::string_view accessed_engine)
    {
        TreeBuilder builder(file);
        const auto chain = builder.add_constant(std::nullopt, full_name);
        const auto tree = builder.build();
        AccessValidator validator(policy(), metadata());
        return validator.evaluate(tree,
                                  tree.node(chain.front()),
                                  policy().current_engine(tree.file()),
                                  accessed_engine);
    }
};

}  // namespace

TEST_F(AccessValidatorTest, SameEngineIsAlwaysValid)
{
    config().strongly_protected_engines = {"billing"};
    const auto decision = evaluate_reference(engine_file("billing", "app/models/billing/invoice.rb"),
                                             "Billing::Invoice",
                                             "Billing");
    EXPECT_TRUE(decision.valid);
    EXPECT_EQ(decision.reason, AccessReason::kSameEngine);
}

TEST_F(AccessValidatorTest, UnexposedReferenceIsInvalid)
{
    const auto decision =
        evaluate_reference(app_file("models/order.rb"), "Billing::InvoiceService", "Billing");
    EXPECT_FALSE(decision.valid);
    EXPECT_EQ(decision.reason, AccessReason::kNotExposed);
}

TEST_F(AccessValidatorTest, ThroughApiIsValid)
{
    const auto decision =
        evaluate_reference(app_file("models/order.rb"), "Billing::Api::Charge", "Billing");
    EXPECT_TRUE(decision.valid);
    EXPECT_EQ(decision.reason, AccessReason::kThroughApi);
}

TEST_F(AccessValidatorTest, AllowlistedChainIsValid)
{
    write_allowlist("billing", {"Billing::InvoiceService"});
    const auto decision =
        evaluate_reference(app_file("models/order.rb"), "Billing::InvoiceService::Result", "Billing");
    EXPECT_TRUE(decision.valid);
    EXPECT_EQ(decision.reason, AccessReason::kAllowlisted);
}

TEST_F(AccessValidatorTest, AllowlistMatchIgnoresLeadingColons)
{
    write_allowlist("billing", {"Billing::InvoiceService"});
    TreeBuilder builder(app_file("models/order.rb"));
    const auto chain = builder.add_constant(std::nullopt, "Billing::InvoiceService");
    const auto tree = builder.build();
    auto nodes = std::vector<engwall::tree::Node>(tree.nodes().begin(), tree.nodes().end());
    nodes[chain[0]].source = "::Billing";
    nodes[chain[1]].source = "::Billing::InvoiceService";
    const engwall::tree::ReferenceTree rooted(tree.file(), std::move(nodes));

    AccessValidator validator(policy(), metadata());
    EXPECT_TRUE(validator.is_valid(rooted, rooted.node(chain[0]), std::nullopt, "Billing"));
}

TEST_F(AccessValidatorTest, AllowlistMatchIsExact)
{
    write_allowlist("billing", {"Billing::Invoice"});
    const auto decision =
        evaluate_reference(app_file("models/order.rb"), "Billing::InvoiceService", "Billing");
    EXPECT_FALSE(decision.valid);
}

TEST_F(AccessValidatorTest, AllowlistWalkStopsAfterFiveLevels)
{
    write_allowlist("billing", {"Billing::A::B::C::D::E"});
    EXPECT_TRUE(evaluate_reference(app_file("models/order.rb"), "Billing::A::B::C::D::E::F", "Billing")
                    .valid);

    write_allowlist("billing", {"Billing::A::B::C::D::E::F"});
    TreeBuilder builder(app_file("models/order.rb"));
    const auto chain = builder.add_constant(std::nullopt, "Billing::A::B::C::D::E::F");
    const auto tree = builder.build();
    engwall::api::ApiMetadataReader fresh_metadata(policy());
    AccessValidator validator(policy(), fresh_metadata);
    const auto decision = validator.evaluate(tree, tree.node(chain[0]), std::nullopt, "Billing");
    EXPECT_FALSE(decision.valid);
    EXPECT_EQ(decision.reason, AccessReason::kNotExposed);
}

TEST_F(AccessValidatorTest, ConstantChainIsBounded)
{
    TreeBuilder builder(app_file("models/order.rb"));
    const auto chain = builder.add_constant(std::nullopt, "Billing::A::B::C::D::E::F::G");
    const auto tree = builder.build();

    const auto walked = engwall::boundary::constant_chain(tree, tree.node(chain[0]));
    ASSERT_EQ(walked.size(), 6U);
    EXPECT_EQ(walked.front()->id, chain[0]);
    EXPECT_EQ(walked.back()->id, chain[5]);
}

TEST_F(AccessValidatorTest, LegacyDependentMatchesPathSubstring)
{
    write_legacy_dependents("billing", {"models/legacy"});
    const auto decision =
        evaluate_reference(app_file("models/legacy_order.rb"), "Billing::InvoiceService", "Billing");
    EXPECT_TRUE(decision.valid);
    EXPECT_EQ(decision.reason, AccessReason::kLegacyDependent);
}

TEST_F(AccessValidatorTest, StronglyProtectedAccessedIgnoresAllowlistAndLegacy)
{
    config().strongly_protected_engines = {"billing"};
    write_allowlist("billing", {"Billing::InvoiceService"});
    write_legacy_dependents("billing", {"models/order.rb"});
    const auto decision =
        evaluate_reference(app_file("models/order.rb"), "Billing::InvoiceService", "Billing");
    EXPECT_FALSE(decision.valid);
    EXPECT_EQ(decision.reason, AccessReason::kStronglyProtectedAccessed);
}

TEST_F(AccessValidatorTest, StronglyProtectedCurrentBlocksOutboundApiAccess)
{
    config().strongly_protected_engines = {"shipping"};
    const auto decision = evaluate_reference(engine_file("shipping", "app/models/shipping/box.rb"),
                                             "Billing::Api::Charge",
                                             "Billing");
    EXPECT_FALSE(decision.valid);
    EXPECT_EQ(decision.reason, AccessReason::kStronglyProtectedCurrent);
}

TEST_F(AccessValidatorTest, OverrideBeatsStrongProtection)
{
    config().strongly_protected_engines = {"shipping", "billing"};
    config().overrides.push_back(
        EngineOverride{.engine = "shipping", .allowed_modules = {"Billing::InternalHelper"}});
    const auto decision = evaluate_reference(engine_file("shipping", "app/models/shipping/box.rb"),
                                             "Billing::InternalHelper",
                                             "Billing");
    EXPECT_TRUE(decision.valid);
    EXPECT_EQ(decision.reason, AccessReason::kOverride);
}

TEST_F(AccessValidatorTest, OverrideOnlyAppliesToItsEngine)
{
    config().overrides.push_back(
        EngineOverride{.engine = "warehouse", .allowed_modules = {"Billing::InternalHelper"}});
    const auto decision = evaluate_reference(engine_file("shipping", "app/models/shipping/box.rb"),
                                             "Billing::InternalHelper",
                                             "Billing");
    EXPECT_FALSE(decision.valid);
}

TEST(AccessReasonNames, AreStable)
{
    EXPECT_EQ(engwall::boundary::to_string(AccessReason::kSameEngine), "same_engine");
    EXPECT_EQ(engwall::boundary::to_string(AccessReason::kStronglyProtectedCurrent),
              "strongly_protected_current");
    EXPECT_EQ(engwall::boundary::to_string(AccessReason::kNotExposed), "not_exposed");
}
