/**
 * @file boundary_checker.cpp
 * @brief Per-file boundary check over a reference tree
 */

#include "engwall/boundary.hpp"

#include "engwall/logging.hpp"

namespace engwall::boundary {

BoundaryChecker::BoundaryChecker(const policy::PolicyStore& policy,
                                 api::ApiMetadataReader& metadata,
                                 oracle::ModelOracle& oracle)
    : m_policy(policy)
    , m_validator(policy, metadata)
    , m_classifier(policy)
    , m_associations(policy)
    , m_oracle(oracle)
{}

std::vector<Offense> BoundaryChecker::check(const tree::ReferenceTree& tree)
{
    const auto current_engine = m_policy.current_engine(tree.file());
    ENGWALL_LOG_DEBUG("checking {} ({} nodes, engine {})",
                      tree.file(),
                      tree.size(),
                      current_engine.value_or("<main app>"));

    std::vector<Offense> offenses;
    for (const tree::NodeId id : tree.preorder()) {
        const tree::Node& node = tree.node(id);
        switch (node.kind) {
            case tree::NodeKind::kConst:
                check_constant(tree, node, current_engine, offenses);
                break;
            case tree::NodeKind::kSend:
                check_association(tree, node, current_engine, offenses);
                break;
            default:
                break;
        }
    }
    return offenses;
}

void BoundaryChecker::check_constant(const tree::ReferenceTree& tree,
                                     const tree::Node& node,
                                     const std::optional<std::string>& current_engine,
                                     std::vector<Offense>& offenses)
{
    const auto accessed = m_classifier.classify(tree, node, current_engine);
    if (!accessed) {
        return;
    }
    if (m_validator.is_valid(tree, node, current_engine, *accessed)) {
        return;
    }
    // Only references that reach a persistence model are reported.
    const auto model_name = tree.const_name(outermost_constant(tree, node));
    if (!m_oracle.is_persistence_model(model_name)) {
        ENGWALL_LOG_DEBUG("{}:{}:{}: {} is not a model, not reported",
                          tree.file(),
                          node.loc.line,
                          node.loc.col,
                          model_name);
        return;
    }
    offenses.push_back(Offense{.file = tree.file(),
                               .loc = node.loc,
                               .message = offense_message(m_policy, *accessed, current_engine),
                               .accessed_engine = *accessed,
                               .kind = OffenseKind::kConstant});
}

void BoundaryChecker::check_association(const tree::ReferenceTree& tree,
                                        const tree::Node& node,
                                        const std::optional<std::string>& current_engine,
                                        std::vector<Offense>& offenses)
{
    const auto association = m_associations.inspect(tree, node);
    if (!association) {
        return;
    }
    if (m_validator.is_valid(tree, *association->call, current_engine,
                             association->accessed_engine)) {
        return;
    }
    offenses.push_back(
        Offense{.file = tree.file(),
                .loc = association->class_name->loc,
                .message = offense_message(m_policy, association->accessed_engine, current_engine),
                .accessed_engine = association->accessed_engine,
                .kind = OffenseKind::kAssociation});
}

}  // namespace engwall::boundary
