#pragma once

#include "config/Config.hpp"
#include "identity/Identity.hpp"
#include "node/model/Node.hpp"
#include "rbac/PermissionLevel.hpp"
#include "security/Action.hpp"
#include "security/Capability.hpp"
#include "storage/ScopedStorageGrant.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace canopy::node { class Store; class Tree; }
namespace canopy::storage { class Presigner; }

namespace canopy::security {

// The only path from an identity to the node store or to object storage.
// Each call resolves and acts against one consistent view: reads under the
// store's shared lock, mutations under its exclusive lock.
//
// A caller below Read on a node gets the same NotFoundError as for a node that
// does not exist. Trashed nodes are visible to Owners only.
class AccessGateway {
public:
    AccessGateway(std::shared_ptr<node::Store> store,
                  std::shared_ptr<storage::Presigner> presigner,
                  config::AuditConfig auditing = {});

    // Throws NotFoundError or PermissionDeniedError; returns the node as observed.
    [[nodiscard]] node::model::Node authorize(const identity::Identity& who, ids::Snowflake nodeId,
                                              rbac::PermissionLevel required, Action action) const;

    node::model::Node createWorkspace(const identity::Identity& who, const std::string& name);
    node::model::Node createNode(const identity::Identity& who, ids::Snowflake parentId,
                                 node::model::NodeType type, const std::string& name);

    [[nodiscard]] node::model::Node readNode(const identity::Identity& who, ids::Snowflake id) const;

    // Deleted children are listed only with includeDeleted, which takes Owner.
    [[nodiscard]] std::vector<node::model::Node> listChildren(const identity::Identity& who, ids::Snowflake parentId,
                                                              bool includeDeleted = false) const;

    node::model::Node rename(const identity::Identity& who, ids::Snowflake id, const std::string& name);

    // Edit on the node and on the new parent. A mover below Owner may not give
    // anyone a level on the node above their own, which rules out handing
    // ownership to the new parent's owners or Owner-level grantees.
    node::model::Node move(const identity::Identity& who, ids::Snowflake id, ids::Snowflake newParentId);

    node::model::Node softDelete(const identity::Identity& who, ids::Snowflake id);
    node::model::Node restore(const identity::Identity& who, ids::Snowflake id);

    // Sharing at level None revokes.
    void share(const identity::Identity& who, ids::Snowflake nodeId, identity::UserId subject,
               rbac::PermissionLevel level);
    bool revoke(const identity::Identity& who, ids::Snowflake nodeId, identity::UserId subject);

    [[nodiscard]] std::map<identity::UserId, rbac::PermissionLevel>
    listEffectivePermissions(const identity::Identity& who, ids::Snowflake nodeId) const;

    // Read needs Read, Write needs Edit. Only documents and resources carry objects.
    [[nodiscard]] storage::ScopedStorageGrant authorizeStorageAccess(const identity::Identity& who,
                                                                     ids::Snowflake nodeId,
                                                                     storage::Operation op) const;

private:
    std::shared_ptr<node::Store> store_;
    std::shared_ptr<storage::Presigner> presigner_;
    config::AuditConfig auditing_;

    const node::model::Node& check_(const node::Tree& tree, const identity::Identity& who, ids::Snowflake nodeId,
                                    rbac::PermissionLevel required, Action action) const;

    void checkMoveEscalation_(const node::Tree& tree, const identity::Identity& who, ids::Snowflake id,
                              ids::Snowflake newParentId) const;

    [[nodiscard]] static Capability capability_(const identity::Identity& who, Action action,
                                                std::optional<ids::Snowflake> target, rbac::PermissionLevel level);

    void audit_(bool allowed, const identity::Identity& who, Action action, std::optional<ids::Snowflake> nodeId,
                rbac::PermissionLevel required, rbac::PermissionLevel effective, const std::string& reason) const;
};

}
