/**
 * @file access_validator.cpp
 * @brief Layered access policy for cross-engine references
 */

#include "engwall/boundary.hpp"

#include "engwall/common.hpp"
#include "engwall/logging.hpp"

#include <algorithm>

namespace engwall::boundary {

namespace {

constexpr std::string_view kApiNamespace = "Api";

}  // namespace

std::string_view to_string(AccessReason reason) noexcept
{
    switch (reason) {
        case AccessReason::kSameEngine:
            return "same_engine";
        case AccessReason::kOverride:
            return "override";
        case AccessReason::kStronglyProtectedCurrent:
            return "strongly_protected_current";
        case AccessReason::kStronglyProtectedAccessed:
            return "strongly_protected_accessed";
        case AccessReason::kLegacyDependent:
            return "legacy_dependent";
        case AccessReason::kThroughApi:
            return "through_api";
        case AccessReason::kAllowlisted:
            return "allowlisted";
        case AccessReason::kNotExposed:
            return "not_exposed";
    }
    return "not_exposed";
}

std::vector<const tree::Node*> constant_chain(const tree::ReferenceTree& tree,
                                              const tree::Node& node)
{
    std::vector<const tree::Node*> chain;
    const tree::Node* current = &node;
    while (current != nullptr && current->kind == tree::NodeKind::kConst
           && chain.size() <= static_cast<std::size_t>(kMaxAncestorWalk)) {
        chain.push_back(current);
        current = tree.parent(*current);
    }
    return chain;
}

std::string constant_source(const tree::ReferenceTree& tree, const tree::Node& node)
{
    return node.source.empty() ? tree.const_name(node) : node.source;
}

bool through_api(const tree::ReferenceTree& tree, const tree::Node& node)
{
    const tree::Node* parent = tree.parent(node);
    return parent != nullptr && parent->kind == tree::NodeKind::kConst
           && parent->name == kApiNamespace;
}

AccessValidator::AccessValidator(const policy::PolicyStore& policy,
                                 api::ApiMetadataReader& metadata)
    : m_policy(policy)
    , m_metadata(metadata)
{}

AccessDecision AccessValidator::evaluate(const tree::ReferenceTree& tree,
                                         const tree::Node& node,
                                         const std::optional<std::string>& current_engine,
                                         std::string_view accessed_engine)
{
    const auto decide = [&](bool valid, AccessReason reason) {
        ENGWALL_LOG_TRACE("{}:{}:{} {} -> {}: {}",
                          tree.file(),
                          node.loc.line,
                          node.loc.col,
                          current_engine.value_or(std::string(policy::kMainAppName)),
                          accessed_engine,
                          to_string(reason));
        return AccessDecision{.valid = valid, .reason = reason};
    };

    if (current_engine && *current_engine == accessed_engine) {
        return decide(true, AccessReason::kSameEngine);
    }
    if (overridden(tree, node, current_engine)) {
        return decide(true, AccessReason::kOverride);
    }
    if (current_engine && m_policy.is_strongly_protected(*current_engine)) {
        return decide(false, AccessReason::kStronglyProtectedCurrent);
    }
    if (m_policy.is_strongly_protected(accessed_engine)) {
        return decide(false, AccessReason::kStronglyProtectedAccessed);
    }
    if (in_legacy_dependent_file(tree, accessed_engine)) {
        return decide(true, AccessReason::kLegacyDependent);
    }
    if (through_api(tree, node)) {
        return decide(true, AccessReason::kThroughApi);
    }
    if (allowlisted(tree, node, accessed_engine)) {
        return decide(true, AccessReason::kAllowlisted);
    }
    return decide(false, AccessReason::kNotExposed);
}

bool AccessValidator::overridden(const tree::ReferenceTree& tree,
                                 const tree::Node& node,
                                 const std::optional<std::string>& current_engine) const
{
    if (!current_engine) {
        return false;
    }
    const auto* allowed = m_policy.overrides_for(*current_engine);
    if (allowed == nullptr) {
        return false;
    }
    return std::ranges::any_of(constant_chain(tree, node), [&](const tree::Node* link) {
        return std::ranges::find(*allowed, constant_source(tree, *link)) != allowed->end();
    });
}

bool AccessValidator::in_legacy_dependent_file(const tree::ReferenceTree& tree,
                                               std::string_view accessed_engine)
{
    const auto& dependents = m_metadata.legacy_dependents(accessed_engine);
    return std::ranges::any_of(dependents, [&](const std::string& fragment) {
        return !fragment.empty() && tree.file().find(fragment) != std::string::npos;
    });
}

bool AccessValidator::allowlisted(const tree::ReferenceTree& tree,
                                  const tree::Node& node,
                                  std::string_view accessed_engine)
{
    const auto& allowlist = m_metadata.allowlist(accessed_engine);
    if (allowlist.empty()) {
        return false;
    }
    return std::ranges::any_of(constant_chain(tree, node), [&](const tree::Node* link) {
        const std::string source = constant_source(tree, *link);
        const std::string_view name = common::strip_leading_colons(source);
        return std::ranges::find(allowlist, name) != allowlist.end();
    });
}

}  // namespace engwall::boundary
