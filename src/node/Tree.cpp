#include "node/Tree.hpp"
#include "error/Errors.hpp"

#include <unordered_set>

using namespace canopy::node;
using namespace canopy::node::model;
using namespace canopy::error;

namespace {

std::string idStr(const canopy::ids::Snowflake id) { return std::to_string(id); }

}

Tree Tree::build(std::vector<Node> nodes, std::vector<rbac::model::Grant> grants) {
    Tree tree;
    tree.nodes_.reserve(nodes.size());

    for (auto& n : nodes) {
        if (n.isWorkspace() && n.parent_id)
            throw InvalidParentError("Workspace " + idStr(n.id) + " has a parent");
        if (!n.isWorkspace() && !n.parent_id)
            throw InvalidParentError(to_string(n.type) + " " + idStr(n.id) + " has no parent");
        const auto id = n.id;
        if (!tree.nodes_.emplace(id, std::move(n)).second)
            throw InvalidOperationError("Duplicate node id " + idStr(id));
    }

    for (const auto& [id, n] : tree.nodes_) {
        if (n.isWorkspace()) {
            tree.workspaces_.insert(id);
            continue;
        }
        const auto parent = tree.nodes_.find(*n.parent_id);
        if (parent == tree.nodes_.end())
            throw ParentNotFoundError("Node " + idStr(id) + " references missing parent " + idStr(*n.parent_id));
        if (!canHaveChildren(parent->second.type))
            throw InvalidParentError("Node " + idStr(id) + " sits under " + to_string(parent->second.type) + " " +
                                     idStr(parent->first));
        tree.children_[*n.parent_id].insert(id);
    }

    // Every chain must reach a workspace root within size() steps.
    std::unordered_set<ids::Snowflake> rooted(tree.workspaces_.begin(), tree.workspaces_.end());
    for (const auto& [id, n] : tree.nodes_) {
        std::vector<ids::Snowflake> path;
        auto cursor = id;
        while (!rooted.contains(cursor)) {
            if (path.size() > tree.nodes_.size())
                throw CycleError("Parent chain of node " + idStr(id) + " does not terminate");
            path.push_back(cursor);
            cursor = *tree.nodes_.at(cursor).parent_id;
        }
        rooted.insert(path.begin(), path.end());
    }

    for (auto& g : grants) {
        if (!tree.contains(g.node_id))
            throw NotFoundError("Grant references missing node " + idStr(g.node_id));
        if (g.level == rbac::PermissionLevel::None) continue;
        tree.grants_[g.node_id].insert_or_assign(g.subject_id, std::move(g));
    }

    return tree;
}

const Node* Tree::find(const ids::Snowflake id) const {
    const auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

const Node& Tree::get(const ids::Snowflake id) const {
    if (const auto* n = find(id)) return *n;
    throw NotFoundError("Node " + idStr(id) + " not found");
}

Node& Tree::mutableNode_(const ids::Snowflake id) {
    const auto it = nodes_.find(id);
    if (it == nodes_.end()) throw NotFoundError("Node " + idStr(id) + " not found");
    return it->second;
}

std::vector<const Node*> Tree::ancestors(const ids::Snowflake id) const {
    std::vector<const Node*> chain;
    auto parent = get(id).parent_id;
    while (parent) {
        const auto& p = get(*parent);
        chain.push_back(&p);
        parent = p.parent_id;
    }
    return chain;
}

bool Tree::isDescendant(const ids::Snowflake candidate, const ids::Snowflake ancestor) const {
    auto parent = get(candidate).parent_id;
    while (parent) {
        if (*parent == ancestor) return true;
        parent = get(*parent).parent_id;
    }
    return false;
}

bool Tree::isTrashed(const ids::Snowflake id) const {
    const auto& n = get(id);
    if (n.isDeleted()) return true;
    for (const auto* a : ancestors(id))
        if (a->isDeleted()) return true;
    return false;
}

std::vector<canopy::ids::Snowflake> Tree::children(const ids::Snowflake parentId) const {
    const auto it = children_.find(parentId);
    if (it == children_.end()) return {};
    return {it->second.begin(), it->second.end()};
}

std::optional<canopy::ids::Snowflake> Tree::nextChild(const ids::Snowflake parentId,
                                                     const std::optional<ids::Snowflake> after) const {
    const auto it = children_.find(parentId);
    if (it == children_.end()) return std::nullopt;
    const auto& set = it->second;
    const auto next = after ? set.upper_bound(*after) : set.begin();
    if (next == set.end()) return std::nullopt;
    return *next;
}

std::vector<canopy::ids::Snowflake> Tree::workspaces() const {
    return {workspaces_.begin(), workspaces_.end()};
}

std::optional<canopy::rbac::PermissionLevel> Tree::grantFor(const ids::Snowflake nodeId,
                                                           const identity::UserId subject) const {
    const auto* grants = grantsOn(nodeId);
    if (!grants) return std::nullopt;
    const auto it = grants->find(subject);
    if (it == grants->end()) return std::nullopt;
    return it->second.level;
}

const Tree::GrantMap* Tree::grantsOn(const ids::Snowflake nodeId) const {
    const auto it = grants_.find(nodeId);
    return it == grants_.end() ? nullptr : &it->second;
}

void Tree::validateCreate(const NodeType type, const std::optional<ids::Snowflake>& parentId) const {
    if (type == NodeType::Workspace) {
        if (parentId) throw InvalidParentError("A workspace cannot have a parent");
        return;
    }

    if (!parentId) throw InvalidParentError("A " + to_string(type) + " requires a parent");

    const auto* parent = find(*parentId);
    if (!parent) throw ParentNotFoundError("Parent " + idStr(*parentId) + " not found");
    if (!canHaveChildren(parent->type))
        throw InvalidParentError("A " + to_string(parent->type) + " cannot hold children");
    if (isTrashed(*parentId))
        throw InvalidParentError("Parent " + idStr(*parentId) + " is deleted");
}

void Tree::validateMove(const ids::Snowflake id, const ids::Snowflake newParentId) const {
    const auto& n = get(id);
    if (n.isWorkspace()) throw InvalidParentError("A workspace cannot be moved under another node");

    if (id == newParentId) throw CycleError("Node " + idStr(id) + " cannot be its own parent");

    const auto* parent = find(newParentId);
    if (!parent) throw NotFoundError("Node " + idStr(newParentId) + " not found");

    if (isDescendant(newParentId, id))
        throw CycleError("Node " + idStr(newParentId) + " is a descendant of " + idStr(id));

    if (!canHaveChildren(parent->type))
        throw InvalidParentError("A " + to_string(parent->type) + " cannot hold children");
    if (isTrashed(newParentId))
        throw InvalidParentError("Parent " + idStr(newParentId) + " is deleted");
}

void Tree::validateRestore(const ids::Snowflake id) const {
    const auto& n = get(id);
    if (!n.isDeleted()) throw InvalidOperationError("Node " + idStr(id) + " is not deleted");
    if (n.parent_id && isTrashed(*n.parent_id))
        throw InvalidParentError("Parent " + idStr(*n.parent_id) + " is deleted; restore it first");
}

void Tree::insert(Node node) {
    const auto id = node.id;
    if (node.parent_id) children_[*node.parent_id].insert(id);
    else workspaces_.insert(id);
    nodes_.insert_or_assign(id, std::move(node));
}

void Tree::reparent(const ids::Snowflake id, const ids::Snowflake newParentId, const std::time_t at) {
    auto& n = mutableNode_(id);
    if (n.parent_id) children_[*n.parent_id].erase(id);
    n.parent_id = newParentId;
    n.updated_at = at;
    children_[newParentId].insert(id);
}

void Tree::rename(const ids::Snowflake id, const std::string& name, const std::time_t at) {
    auto& n = mutableNode_(id);
    n.name = name;
    n.updated_at = at;
}

void Tree::markDeleted(const ids::Snowflake id, const std::time_t at) {
    auto& n = mutableNode_(id);
    n.deleted_at = at;
    n.updated_at = at;
}

void Tree::clearDeleted(const ids::Snowflake id, const std::time_t at) {
    auto& n = mutableNode_(id);
    n.deleted_at = std::nullopt;
    n.updated_at = at;
}

void Tree::putGrant(const rbac::model::Grant& grant) {
    if (!contains(grant.node_id)) throw NotFoundError("Node " + idStr(grant.node_id) + " not found");
    grants_[grant.node_id].insert_or_assign(grant.subject_id, grant);
}

bool Tree::eraseGrant(const ids::Snowflake nodeId, const identity::UserId subject) {
    const auto it = grants_.find(nodeId);
    if (it == grants_.end()) return false;
    const bool erased = it->second.erase(subject) > 0;
    if (it->second.empty()) grants_.erase(it);
    return erased;
}
