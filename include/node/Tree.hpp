#pragma once

#include "node/model/Node.hpp"
#include "rbac/model/Grant.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace canopy::node {

// Arena of nodes keyed by id, with a child index and the grant table.
// Not synchronized; node::Store owns the locking.
class Tree {
public:
    using GrantMap = std::map<identity::UserId, rbac::model::Grant>;

    Tree() = default;

    // Validates parent links, workspace roots, acyclicity and grant targets.
    [[nodiscard]] static Tree build(std::vector<model::Node> nodes, std::vector<rbac::model::Grant> grants);

    [[nodiscard]] size_t size() const { return nodes_.size(); }
    [[nodiscard]] bool contains(ids::Snowflake id) const { return nodes_.contains(id); }
    [[nodiscard]] const model::Node* find(ids::Snowflake id) const;
    [[nodiscard]] const model::Node& get(ids::Snowflake id) const;

    // Parent first, workspace root last. Empty for a workspace.
    [[nodiscard]] std::vector<const model::Node*> ancestors(ids::Snowflake id) const;

    // True when `ancestor` appears on the parent chain of `candidate`.
    [[nodiscard]] bool isDescendant(ids::Snowflake candidate, ids::Snowflake ancestor) const;

    // Deleted itself or sitting under a deleted ancestor.
    [[nodiscard]] bool isTrashed(ids::Snowflake id) const;

    [[nodiscard]] std::vector<ids::Snowflake> children(ids::Snowflake parentId) const;
    [[nodiscard]] std::optional<ids::Snowflake> nextChild(ids::Snowflake parentId,
                                                          std::optional<ids::Snowflake> after) const;
    [[nodiscard]] std::vector<ids::Snowflake> workspaces() const;

    [[nodiscard]] std::optional<rbac::PermissionLevel> grantFor(ids::Snowflake nodeId, identity::UserId subject) const;
    [[nodiscard]] const GrantMap* grantsOn(ids::Snowflake nodeId) const;

    void validateCreate(model::NodeType type, const std::optional<ids::Snowflake>& parentId) const;
    void validateMove(ids::Snowflake id, ids::Snowflake newParentId) const;
    void validateRestore(ids::Snowflake id) const;

    void insert(model::Node node);
    void reparent(ids::Snowflake id, ids::Snowflake newParentId, std::time_t at);
    void rename(ids::Snowflake id, const std::string& name, std::time_t at);
    void markDeleted(ids::Snowflake id, std::time_t at);
    void clearDeleted(ids::Snowflake id, std::time_t at);

    void putGrant(const rbac::model::Grant& grant);
    bool eraseGrant(ids::Snowflake nodeId, identity::UserId subject);

private:
    std::unordered_map<ids::Snowflake, model::Node> nodes_;
    std::unordered_map<ids::Snowflake, std::set<ids::Snowflake>> children_;
    std::unordered_map<ids::Snowflake, GrantMap> grants_;
    std::set<ids::Snowflake> workspaces_;

    model::Node& mutableNode_(ids::Snowflake id);
};

}
