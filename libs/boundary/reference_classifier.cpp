/**
 * @file reference_classifier.cpp
 * @brief Which constant references name a protected engine
 */

#include "engwall/boundary.hpp"

namespace engwall::boundary {

namespace {

[[nodiscard]] bool names_main_app(const tree::ReferenceTree& tree, const tree::Node& node)
{
    return tree.const_name(node).starts_with(policy::kMainAppName);
}

}  // namespace

const tree::Node& outermost_constant(const tree::ReferenceTree& tree, const tree::Node& node)
{
    const tree::Node* current = &node;
    for (const tree::Node* parent = tree.parent(*current);
         parent != nullptr && parent->kind == tree::NodeKind::kConst;
         parent = tree.parent(*current)) {
        current = parent;
    }
    return *current;
}

bool is_declaration_name(const tree::ReferenceTree& tree, const tree::Node& node)
{
    if (node.kind != tree::NodeKind::kConst) {
        return false;
    }
    const tree::Node& top = outermost_constant(tree, node);
    const tree::Node* owner = tree.parent(top);
    if (owner == nullptr
        || (owner->kind != tree::NodeKind::kModule && owner->kind != tree::NodeKind::kClass)) {
        return false;
    }
    return !owner->children.empty() && owner->children.front() == top.id;
}

bool is_call_receiver(const tree::ReferenceTree& tree, const tree::Node& node)
{
    const tree::Node* parent = tree.parent(node);
    if (parent == nullptr) {
        return false;
    }
    const tree::Node* receiver = tree.receiver(*parent);
    return receiver != nullptr && receiver->id == node.id;
}

ReferenceClassifier::ReferenceClassifier(const policy::PolicyStore& policy)
    : m_policy(policy)
{}

std::optional<std::string>
ReferenceClassifier::classify(const tree::ReferenceTree& tree,
                              const tree::Node& node,
                              const std::optional<std::string>& current_engine) const
{
    if (node.kind != tree::NodeKind::kConst) {
        return std::nullopt;
    }
    if (is_declaration_name(tree, node) || is_call_receiver(tree, node)) {
        return std::nullopt;
    }

    if (current_engine && m_policy.is_strongly_protected(*current_engine)
        && names_main_app(tree, node)) {
        return std::string(policy::kMainAppName);
    }

    auto name = tree.const_name(node);
    if (m_policy.is_protected(name)) {
        return name;
    }
    return std::nullopt;
}

}  // namespace engwall::boundary
