/**
 * @file reference_tree.cpp
 * @brief Reference tree arena and reference_tree.v1 loader
 */

#include "engwall/reference_tree.hpp"

#include "engwall/schema_validate.hpp"
#include "engwall/version.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <utility>

namespace engwall::tree {

namespace {

constexpr std::string_view kTreeSchema = kTreeSchemaVersion;

struct KindName
{
    std::string_view name;
    NodeKind kind;
};

constexpr std::array<KindName, 10> kKindNames = {
    {
     {.name = "const", .kind = NodeKind::kConst},
     {.name = "send", .kind = NodeKind::kSend},
     {.name = "hash", .kind = NodeKind::kHash},
     {.name = "pair", .kind = NodeKind::kPair},
     {.name = "sym", .kind = NodeKind::kSym},
     {.name = "str", .kind = NodeKind::kStr},
     {.name = "module", .kind = NodeKind::kModule},
     {.name = "class", .kind = NodeKind::kClass},
     {.name = "begin", .kind = NodeKind::kBegin},
     {.name = "other", .kind = NodeKind::kOther},
     }
};

[[nodiscard]] engwall::Error invalid_tree(std::string message)
{
    return Error::make("InvalidTree", std::move(message));
}

[[nodiscard]] engwall::Result<Node> node_from_json(const nlohmann::json& entry)
{
    Node node;
    node.id = entry.at("id").get<NodeId>();
    const auto kind_text = entry.at("kind").get<std::string>();
    const auto kind = node_kind_from_string(kind_text);
    if (!kind) {
        return std::unexpected(
            invalid_tree(std::format("node {} has unknown kind '{}'", node.id, kind_text)));
    }
    node.kind = *kind;
    node.name = entry.value("name", std::string{});
    if (const auto it = entry.find("parent"); it != entry.end() && !it->is_null()) {
        node.parent = it->get<NodeId>();
    }
    if (const auto it = entry.find("children"); it != entry.end()) {
        node.children = it->get<std::vector<NodeId>>();
    }
    node.has_receiver = entry.value("receiver", false);
    node.source = entry.value("source", std::string{});
    if (const auto it = entry.find("loc"); it != entry.end()) {
        node.loc.line = it->value("line", 0);
        node.loc.col = it->value("col", 0);
    }
    return node;
}

[[nodiscard]] engwall::VoidResult check_links(const std::vector<Node>& nodes)
{
    for (const auto& node : nodes) {
        if (node.parent) {
            // Parents precede their children, which also rules out cycles.
            if (*node.parent >= node.id) {
                return std::unexpected(invalid_tree(
                    std::format("node {} has parent {} that does not precede it",
                                node.id,
                                *node.parent)));
            }
            const auto& siblings = nodes[*node.parent].children;
            if (std::ranges::find(siblings, node.id) == siblings.end()) {
                return std::unexpected(invalid_tree(std::format(
                    "node {} is not listed as a child of its parent {}", node.id, *node.parent)));
            }
        }
        for (const NodeId child : node.children) {
            if (child >= nodes.size() || nodes[child].parent != node.id) {
                return std::unexpected(invalid_tree(
                    std::format("node {} lists {} as a child, but it is not", node.id, child)));
            }
        }
        if (node.kind == NodeKind::kSend && node.has_receiver && node.children.empty()) {
            return std::unexpected(
                invalid_tree(std::format("send node {} has a receiver but no children", node.id)));
        }
    }
    return {};
}

}  // namespace

std::optional<NodeKind> node_kind_from_string(std::string_view text) noexcept
{
    for (const auto& entry : kKindNames) {
        if (entry.name == text) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

ReferenceTree::ReferenceTree(std::string file, std::vector<Node> nodes)
    : m_file(std::move(file))
    , m_nodes(std::move(nodes))
{}

const Node* ReferenceTree::parent(const Node& node) const
{
    return node.parent ? &m_nodes.at(*node.parent) : nullptr;
}

std::vector<NodeId> ReferenceTree::roots() const
{
    std::vector<NodeId> result;
    for (const auto& node : m_nodes) {
        if (!node.parent) {
            result.push_back(node.id);
        }
    }
    return result;
}

const Node* ReferenceTree::const_scope(const Node& node) const
{
    if (node.kind != NodeKind::kConst || node.children.empty()) {
        return nullptr;
    }
    const Node& scope = m_nodes.at(node.children.front());
    return scope.kind == NodeKind::kConst ? &scope : nullptr;
}

std::string ReferenceTree::const_name(const Node& node) const
{
    if (const Node* scope = const_scope(node)) {
        return const_name(*scope) + "::" + node.name;
    }
    return node.name;
}

const Node* ReferenceTree::receiver(const Node& send) const
{
    if (send.kind != NodeKind::kSend || !send.has_receiver) {
        return nullptr;
    }
    return &m_nodes.at(send.children.front());
}

std::span<const NodeId> ReferenceTree::arguments(const Node& send) const
{
    std::span<const NodeId> children(send.children);
    if (send.kind == NodeKind::kSend && send.has_receiver) {
        return children.subspan(1);
    }
    return children;
}

std::vector<NodeId> ReferenceTree::preorder() const
{
    std::vector<NodeId> order;
    order.reserve(m_nodes.size());
    std::vector<NodeId> stack;
    const auto top_level = roots();
    stack.assign(top_level.rbegin(), top_level.rend());
    while (!stack.empty()) {
        const NodeId id = stack.back();
        stack.pop_back();
        order.push_back(id);
        const auto& children = m_nodes.at(id).children;
        stack.insert(stack.end(), children.rbegin(), children.rend());
    }
    return order;
}

engwall::Result<ReferenceTree> tree_from_json(const nlohmann::json& document)
{
    std::vector<Node> nodes;
    std::string file;
    try {
        const auto& entries = document.at("nodes");
        nodes.reserve(entries.size());
        for (const auto& entry : entries) {
            auto node = node_from_json(entry);
            if (!node) {
                return std::unexpected(node.error());
            }
            if (node->id != nodes.size()) {
                return std::unexpected(invalid_tree(
                    std::format("node at index {} has id {}", nodes.size(), node->id)));
            }
            nodes.push_back(std::move(*node));
        }
        file = document.at("file").get<std::string>();
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(invalid_tree(std::string("malformed tree document: ") + ex.what()));
    }
    if (auto links = check_links(nodes); !links) {
        return std::unexpected(links.error());
    }
    return ReferenceTree(common::normalize_path(file), std::move(nodes));
}

engwall::Result<ReferenceTree> load_tree(const std::filesystem::path& path,
                                         const std::filesystem::path& schema_dir)
{
    auto document = common::read_json_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    if (auto validation = common::validate_document(*document, kTreeSchema, schema_dir);
        !validation) {
        return std::unexpected(invalid_tree(path.string() + ": " + validation.error().message));
    }
    return tree_from_json(*document);
}

}  // namespace engwall::tree
