#pragma once

/**
 * @file boundary.hpp
 * @brief Engine boundary checks over a reference tree
 *
 * The checker walks each file's reference tree, classifies constant
 * references and association declarations that name a protected engine, and
 * asks the access validator whether the reference is allowed.
 */

#include "engwall/api_metadata.hpp"
#include "engwall/model_oracle.hpp"
#include "engwall/policy.hpp"
#include "engwall/reference_tree.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace engwall::boundary {

/// Ancestor levels examined above a constant when matching overrides and allow-lists.
inline constexpr int kMaxAncestorWalk = 5;

// ============================================================================
// Access validation
// ============================================================================

enum class AccessReason {
    kSameEngine,
    kOverride,
    kStronglyProtectedCurrent,
    kStronglyProtectedAccessed,
    kLegacyDependent,
    kThroughApi,
    kAllowlisted,
    kNotExposed,
};

[[nodiscard]] std::string_view to_string(AccessReason reason) noexcept;

struct AccessDecision
{
    bool valid = false;
    AccessReason reason = AccessReason::kNotExposed;
};

/**
 * Decides whether a reference from `current_engine` into `accessed_engine`
 * is allowed. Rules, first match wins:
 *
 *  1. same engine                                   -> valid
 *  2. constant chain listed in the current engine's overrides -> valid
 *  3. current engine strongly protected              -> invalid
 *  4. accessed engine strongly protected             -> invalid
 *  5. file is a legacy dependent, the reference goes through `Api`,
 *     or the constant chain is allow-listed          -> valid
 *  6. otherwise                                      -> invalid
 */
class AccessValidator
{
public:
    AccessValidator(const policy::PolicyStore& policy, api::ApiMetadataReader& metadata);

    [[nodiscard]] AccessDecision evaluate(const tree::ReferenceTree& tree,
                                          const tree::Node& node,
                                          const std::optional<std::string>& current_engine,
                                          std::string_view accessed_engine);

    [[nodiscard]] bool is_valid(const tree::ReferenceTree& tree,
                                const tree::Node& node,
                                const std::optional<std::string>& current_engine,
                                std::string_view accessed_engine)
    {
        return evaluate(tree, node, current_engine, accessed_engine).valid;
    }

private:
    [[nodiscard]] bool overridden(const tree::ReferenceTree& tree,
                                  const tree::Node& node,
                                  const std::optional<std::string>& current_engine) const;
    [[nodiscard]] bool in_legacy_dependent_file(const tree::ReferenceTree& tree,
                                                std::string_view accessed_engine);
    [[nodiscard]] bool allowlisted(const tree::ReferenceTree& tree,
                                   const tree::Node& node,
                                   std::string_view accessed_engine);

    const policy::PolicyStore& m_policy;
    api::ApiMetadataReader& m_metadata;
};

/**
 * `node` followed by its enclosing constants, at most kMaxAncestorWalk
 * levels up. Empty when `node` is not a constant.
 */
[[nodiscard]] std::vector<const tree::Node*> constant_chain(const tree::ReferenceTree& tree,
                                                           const tree::Node& node);

/// Source text of a constant node, or its full name when the frontend gave none.
[[nodiscard]] std::string constant_source(const tree::ReferenceTree& tree, const tree::Node& node);

/// True if `node`'s parent is a constant named `Api` (`Billing::Api`).
[[nodiscard]] bool through_api(const tree::ReferenceTree& tree, const tree::Node& node);

// ============================================================================
// Classification
// ============================================================================

/// True if `node` is (part of) the name of a module or class declaration.
[[nodiscard]] bool is_declaration_name(const tree::ReferenceTree& tree, const tree::Node& node);

/// True if `node` is the receiver of a method call (`Warehouse.new`).
[[nodiscard]] bool is_call_receiver(const tree::ReferenceTree& tree, const tree::Node& node);

/// Last constant of the chain `node` belongs to (`Billing::Invoice` for `Billing`).
[[nodiscard]] const tree::Node& outermost_constant(const tree::ReferenceTree& tree,
                                                   const tree::Node& node);

/**
 * Maps a constant reference to the engine it accesses.
 */
class ReferenceClassifier
{
public:
    explicit ReferenceClassifier(const policy::PolicyStore& policy);

    /**
     * Engine accessed by constant `node`, or nullopt if the node is not an
     * engine reference to check.
     *
     * From a strongly protected engine, every constant whose full name starts
     * with kMainAppName accesses kMainAppName, so a `MainApp::EngineApi::X`
     * chain yields one reference per matching constant.
     */
    [[nodiscard]] std::optional<std::string>
    classify(const tree::ReferenceTree& tree,
             const tree::Node& node,
             const std::optional<std::string>& current_engine) const;

private:
    const policy::PolicyStore& m_policy;
};

/// `belongs_to`, `has_one` or `has_many`.
[[nodiscard]] bool is_association_macro(std::string_view method) noexcept;

struct AssociationReference
{
    const tree::Node* call = nullptr;        ///< the association send
    const tree::Node* class_name = nullptr;  ///< the `class_name:` string literal
    std::string accessed_engine;
};

/**
 * Recognizes `has_many :invoices, class_name: "Billing::Invoice"` style
 * declarations that point into a protected engine.
 *
 * Only a string-literal `class_name` is considered; its first `::` segment
 * names the engine.
 */
class AssociationInspector
{
public:
    explicit AssociationInspector(const policy::PolicyStore& policy);

    [[nodiscard]] std::optional<AssociationReference> inspect(const tree::ReferenceTree& tree,
                                                              const tree::Node& send) const;

private:
    const policy::PolicyStore& m_policy;
};

// ============================================================================
// Offenses
// ============================================================================

enum class OffenseKind {
    kConstant,
    kAssociation,
};

[[nodiscard]] std::string_view to_string(OffenseKind kind) noexcept;

struct Offense
{
    std::string file;
    tree::Location loc;
    std::string message;
    std::string accessed_engine;
    OffenseKind kind = OffenseKind::kConstant;
};

/**
 * Offense text for an access of `accessed_engine`:
 *  - accessed engine strongly protected: all direct access disallowed
 *  - else current engine strongly protected: outbound access disallowed
 *  - else: access only via `<accessed_engine>::Api`
 */
[[nodiscard]] std::string offense_message(const policy::PolicyStore& policy,
                                          std::string_view accessed_engine,
                                          const std::optional<std::string>& current_engine);

/**
 * Per-file driver combining classifier, validator, association inspector
 * and model oracle.
 *
 * Holds references to the policy, metadata cache and oracle; those are
 * shared across every file of a run.
 */
class BoundaryChecker
{
public:
    BoundaryChecker(const policy::PolicyStore& policy,
                    api::ApiMetadataReader& metadata,
                    oracle::ModelOracle& oracle);

    /// Offenses in `tree`, in pre-order of the constants and calls that raised them.
    [[nodiscard]] std::vector<Offense> check(const tree::ReferenceTree& tree);

private:
    void check_constant(const tree::ReferenceTree& tree,
                        const tree::Node& node,
                        const std::optional<std::string>& current_engine,
                        std::vector<Offense>& offenses);
    void check_association(const tree::ReferenceTree& tree,
                           const tree::Node& node,
                           const std::optional<std::string>& current_engine,
                           std::vector<Offense>& offenses);

    const policy::PolicyStore& m_policy;
    AccessValidator m_validator;
    ReferenceClassifier m_classifier;
    AssociationInspector m_associations;
    oracle::ModelOracle& m_oracle;
};

}  // namespace engwall::boundary
