/**
 * @file association_inspector.cpp
 * @brief Association declarations that point into another engine
 */

#include "engwall/boundary.hpp"

#include "engwall/common.hpp"
#include "engwall/logging.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace engwall::boundary {

namespace {

constexpr std::array<std::string_view, 3> kAssociationMacros = {
    "belongs_to",
    "has_one",
    "has_many",
};

constexpr std::string_view kClassNameKey = "class_name";

// Value of the `class_name:` pair when it is a string literal.
[[nodiscard]] const tree::Node* class_name_literal(const tree::ReferenceTree& tree,
                                                   const tree::Node& hash)
{
    for (const tree::NodeId pair_id : hash.children) {
        const tree::Node& pair = tree.node(pair_id);
        if (pair.kind != tree::NodeKind::kPair || pair.children.size() != 2) {
            continue;
        }
        const tree::Node& key = tree.node(pair.children[0]);
        if (key.kind != tree::NodeKind::kSym || key.name != kClassNameKey) {
            continue;
        }
        const tree::Node& value = tree.node(pair.children[1]);
        if (value.kind != tree::NodeKind::kStr) {
            ENGWALL_LOG_DEBUG("{}:{}:{}: class_name is not a string literal, skipped",
                              tree.file(),
                              value.loc.line,
                              value.loc.col);
            return nullptr;
        }
        return &value;
    }
    return nullptr;
}

}  // namespace

bool is_association_macro(std::string_view method) noexcept
{
    return std::ranges::find(kAssociationMacros, method) != kAssociationMacros.end();
}

AssociationInspector::AssociationInspector(const policy::PolicyStore& policy)
    : m_policy(policy)
{}

std::optional<AssociationReference> AssociationInspector::inspect(const tree::ReferenceTree& tree,
                                                                  const tree::Node& send) const
{
    if (send.kind != tree::NodeKind::kSend || !is_association_macro(send.name)) {
        return std::nullopt;
    }
    // `has_many :name, { ... }`: exactly a symbol and a hash.
    const auto args = tree.arguments(send);
    if (args.size() != 2 || tree.node(args[0]).kind != tree::NodeKind::kSym
        || tree.node(args[1]).kind != tree::NodeKind::kHash) {
        return std::nullopt;
    }
    const tree::Node* literal = class_name_literal(tree, tree.node(args[1]));
    if (literal == nullptr) {
        return std::nullopt;
    }
    // "::Billing::Invoice" has an empty first segment and names no engine.
    std::string engine(common::first_segment(literal->name));
    if (engine.empty() || !m_policy.is_protected(engine)) {
        return std::nullopt;
    }
    return AssociationReference{.call = &send,
                                .class_name = literal,
                                .accessed_engine = std::move(engine)};
}

}  // namespace engwall::boundary
