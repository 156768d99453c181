#pragma once

/**
 * @file reference_tree.hpp
 * @brief Parsed symbolic-reference tree of one source file (reference_tree.v1)
 */

#include "engwall/common.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace engwall::tree {

using NodeId = std::size_t;

enum class NodeKind {
    kConst,   ///< constant reference; name = last segment, child 0 = optional scope
    kSend,    ///< method call; name = method, child 0 = receiver when has_receiver
    kHash,    ///< keyword/hash argument; children = pairs
    kPair,    ///< key/value; children = {key, value}
    kSym,     ///< symbol literal; name = value
    kStr,     ///< string literal; name = value
    kModule,  ///< module declaration; child 0 = name const
    kClass,   ///< class declaration; child 0 = name const, child 1 = superclass
    kBegin,   ///< statement sequence
    kOther,   ///< anything else the frontend emits
};

[[nodiscard]] std::optional<NodeKind> node_kind_from_string(std::string_view text) noexcept;

struct Location
{
    int line = 0;
    int col = 0;
};

struct Node
{
    NodeId id = 0;
    NodeKind kind = NodeKind::kOther;
    std::string name;
    std::optional<NodeId> parent;
    std::vector<NodeId> children;
    bool has_receiver = false;
    std::string source;
    Location loc;
};

/**
 * Arena of nodes linked by parent/child indices.
 *
 * Constructed only through tree_from_json()/load_tree(), which verify that
 * every index is in range and that parent and child links agree.
 */
class ReferenceTree
{
public:
    ReferenceTree(std::string file, std::vector<Node> nodes);

    [[nodiscard]] const std::string& file() const noexcept { return m_file; }
    [[nodiscard]] std::span<const Node> nodes() const noexcept { return m_nodes; }
    [[nodiscard]] std::size_t size() const noexcept { return m_nodes.size(); }
    [[nodiscard]] const Node& node(NodeId id) const { return m_nodes.at(id); }

    [[nodiscard]] const Node* parent(const Node& node) const;

    /// Nodes without a parent, in id order.
    [[nodiscard]] std::vector<NodeId> roots() const;

    /// Scope constant of a kConst node (`Foo` in `Foo::Bar`), if it is a constant.
    [[nodiscard]] const Node* const_scope(const Node& node) const;

    /// Full constant name of a kConst node: "Foo::Bar" for `Foo::Bar` or `::Foo::Bar`.
    [[nodiscard]] std::string const_name(const Node& node) const;

    /// Receiver of a kSend node, if it has one.
    [[nodiscard]] const Node* receiver(const Node& send) const;

    /// Arguments of a kSend node (children after the receiver).
    [[nodiscard]] std::span<const NodeId> arguments(const Node& send) const;

    /// Depth-first pre-order traversal over all nodes.
    [[nodiscard]] std::vector<NodeId> preorder() const;

private:
    std::string m_file;
    std::vector<Node> m_nodes;
};

/**
 * Build a tree from a reference_tree.v1 document (schema already checked).
 * @return Error "InvalidTree" when ids, parents or children are inconsistent
 */
[[nodiscard]] engwall::Result<ReferenceTree> tree_from_json(const nlohmann::json& document);

/**
 * Read, schema-validate and build a tree document.
 */
[[nodiscard]] engwall::Result<ReferenceTree> load_tree(const std::filesystem::path& path,
                                                       const std::filesystem::path& schema_dir);

}  // namespace engwall::tree
