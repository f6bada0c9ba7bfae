#include "security/AccessGateway.hpp"
#include "node/Store.hpp"
#include "rbac/Resolver.hpp"
#include "storage/Presigner.hpp"
#include "error/Errors.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <stdexcept>

using namespace canopy::security;
using namespace canopy::node::model;
using namespace canopy::rbac;
using namespace canopy::error;
using canopy::identity::Identity;
using canopy::log::Registry;

namespace {

std::string notFound(const canopy::ids::Snowflake id) { return "Node " + std::to_string(id) + " not found"; }

}

AccessGateway::AccessGateway(std::shared_ptr<node::Store> store,
                             std::shared_ptr<storage::Presigner> presigner,
                             config::AuditConfig auditing)
    : store_(std::move(store)), presigner_(std::move(presigner)), auditing_(auditing) {
    if (!store_) throw std::invalid_argument("AccessGateway requires a node store");
}

void AccessGateway::audit_(const bool allowed, const Identity& who, const Action action,
                           const std::optional<ids::Snowflake> nodeId, const PermissionLevel required,
                           const PermissionLevel effective, const std::string& reason) const {
    if (allowed && !auditing_.log_allowed_decisions) return;

    const auto node = nodeId ? std::to_string(*nodeId) : "-";
    Registry::audit()->info("decision={} user={} auth={} action={} node={} required={} effective={} reason={}",
                            allowed ? "allow" : "deny", who.user_id, to_string(who.auth_method), to_string(action),
                            node, to_string(required), to_string(effective), reason);

    if (!allowed)
        Registry::gateway()->debug("[AccessGateway] Denied {} on {} for user {}: {}",
                                   to_string(action), node, who.user_id, reason);
}

Capability AccessGateway::capability_(const Identity& who, const Action action,
                                      const std::optional<ids::Snowflake> target, const PermissionLevel level) {
    return {who.user_id, action, target, level};
}

const Node& AccessGateway::check_(const node::Tree& tree, const Identity& who, const ids::Snowflake nodeId,
                                  const PermissionLevel required, const Action action) const {
    const auto* node = tree.find(nodeId);
    if (!node) {
        audit_(false, who, action, nodeId, required, PermissionLevel::None, "missing");
        throw NotFoundError(notFound(nodeId));
    }

    const auto resolution = Resolver::explain(tree, who.user_id, nodeId);

    if (resolution.level < PermissionLevel::Read) {
        audit_(false, who, action, nodeId, required, resolution.level, "no_access");
        throw NotFoundError(notFound(nodeId));
    }

    if (resolution.level < PermissionLevel::Owner && tree.isTrashed(nodeId)) {
        audit_(false, who, action, nodeId, required, resolution.level, "trashed");
        throw NotFoundError(notFound(nodeId));
    }

    if (resolution.level < required) {
        audit_(false, who, action, nodeId, required, resolution.level, "insufficient");
        throw PermissionDeniedError(to_string(action) + " requires " + to_string(required) + " on node " +
                                    std::to_string(nodeId));
    }

    audit_(true, who, action, nodeId, required, resolution.level,
           resolution.via_ownership ? "owner" : "grant");
    return *node;
}

Node AccessGateway::authorize(const Identity& who, const ids::Snowflake nodeId, const PermissionLevel required,
                              const Action action) const {
    const auto view = store_->snapshot();
    return check_(view.tree(), who, nodeId, required, action);
}

Node AccessGateway::createWorkspace(const Identity& who, const std::string& name) {
    auto view = store_->exclusive();
    audit_(true, who, Action::CreateWorkspace, std::nullopt, PermissionLevel::None, PermissionLevel::None, "any_user");
    const auto cap = capability_(who, Action::CreateWorkspace, std::nullopt, PermissionLevel::None);
    return view.create(cap, NodeType::Workspace, std::nullopt, who.user_id, name);
}

Node AccessGateway::createNode(const Identity& who, const ids::Snowflake parentId, const NodeType type,
                               const std::string& name) {
    auto view = store_->exclusive();
    (void)check_(view.tree(), who, parentId, requiredLevel(Action::CreateChild), Action::CreateChild);
    const auto cap = capability_(who, Action::CreateChild, parentId, requiredLevel(Action::CreateChild));
    return view.create(cap, type, parentId, who.user_id, name);
}

Node AccessGateway::readNode(const Identity& who, const ids::Snowflake id) const {
    return authorize(who, id, requiredLevel(Action::ReadNode), Action::ReadNode);
}

std::vector<Node> AccessGateway::listChildren(const Identity& who, const ids::Snowflake parentId,
                                              const bool includeDeleted) const {
    const auto action = includeDeleted ? Action::ListTrash : Action::ListChildren;
    const auto view = store_->snapshot();
    const auto& tree = view.tree();
    (void)check_(tree, who, parentId, requiredLevel(action), action);

    std::vector<Node> out;
    for (const auto childId : tree.children(parentId)) {
        const auto& child = tree.get(childId);
        if (child.isDeleted() && !includeDeleted) continue;
        out.push_back(child);
    }
    return out;
}

Node AccessGateway::rename(const Identity& who, const ids::Snowflake id, const std::string& name) {
    auto view = store_->exclusive();
    (void)check_(view.tree(), who, id, requiredLevel(Action::Rename), Action::Rename);
    return view.rename(capability_(who, Action::Rename, id, requiredLevel(Action::Rename)), id, name);
}

Node AccessGateway::move(const Identity& who, const ids::Snowflake id, const ids::Snowflake newParentId) {
    const auto required = requiredLevel(Action::Move);
    auto view = store_->exclusive();
    (void)check_(view.tree(), who, id, required, Action::Move);
    (void)check_(view.tree(), who, newParentId, required, Action::Move);
    checkMoveEscalation_(view.tree(), who, id, newParentId);
    return view.move(capability_(who, Action::Move, id, required), id, newParentId);
}

void AccessGateway::checkMoveEscalation_(const node::Tree& tree, const Identity& who, const ids::Snowflake id,
                                         const ids::Snowflake newParentId) const {
    // cycles are left for the store to reject
    if (id == newParentId || tree.isDescendant(newParentId, id)) return;

    const auto moverLevel = Resolver::resolve(tree, who.user_id, id);
    if (moverLevel == PermissionLevel::Owner) return;

    const auto before = Resolver::effectivePermissions(tree, id);
    for (const auto& [subject, level] : Resolver::effectivePermissionsUnder(tree, id, newParentId)) {
        if (level <= moverLevel) continue;
        if (const auto it = before.find(subject); it != before.end() && it->second >= level) continue;

        audit_(false, who, Action::Move, id, level, moverLevel, "escalation");
        throw PermissionDeniedError("Moving node " + std::to_string(id) + " under " + std::to_string(newParentId) +
                                    " would grant " + to_string(level) + " beyond the mover's " +
                                    to_string(moverLevel));
    }
}

Node AccessGateway::softDelete(const Identity& who, const ids::Snowflake id) {
    auto view = store_->exclusive();
    (void)check_(view.tree(), who, id, requiredLevel(Action::SoftDelete), Action::SoftDelete);
    return view.softDelete(capability_(who, Action::SoftDelete, id, PermissionLevel::Owner), id);
}

Node AccessGateway::restore(const Identity& who, const ids::Snowflake id) {
    auto view = store_->exclusive();
    (void)check_(view.tree(), who, id, requiredLevel(Action::Restore), Action::Restore);
    return view.restore(capability_(who, Action::Restore, id, PermissionLevel::Owner), id);
}

void AccessGateway::share(const Identity& who, const ids::Snowflake nodeId, const identity::UserId subject,
                          const PermissionLevel level) {
    if (level == PermissionLevel::None) {
        (void)revoke(who, nodeId, subject);
        return;
    }

    auto view = store_->exclusive();
    (void)check_(view.tree(), who, nodeId, requiredLevel(Action::Share), Action::Share);
    view.putGrant(capability_(who, Action::Share, nodeId, PermissionLevel::Owner),
                  rbac::model::Grant(nodeId, subject, level, who.user_id, util::now()));

    Registry::gateway()->info("[AccessGateway] User {} shared node {} with {} at {}",
                              who.user_id, nodeId, subject, to_string(level));
}

bool AccessGateway::revoke(const Identity& who, const ids::Snowflake nodeId, const identity::UserId subject) {
    auto view = store_->exclusive();
    (void)check_(view.tree(), who, nodeId, requiredLevel(Action::Share), Action::Share);
    const bool removed = view.revokeGrant(capability_(who, Action::Share, nodeId, PermissionLevel::Owner),
                                          nodeId, subject);
    if (removed)
        Registry::gateway()->info("[AccessGateway] User {} revoked {} on node {}", who.user_id, subject, nodeId);
    return removed;
}

std::map<canopy::identity::UserId, PermissionLevel>
AccessGateway::listEffectivePermissions(const Identity& who, const ids::Snowflake nodeId) const {
    const auto view = store_->snapshot();
    (void)check_(view.tree(), who, nodeId, requiredLevel(Action::ViewPermissions), Action::ViewPermissions);
    return Resolver::effectivePermissions(view.tree(), nodeId);
}

canopy::storage::ScopedStorageGrant AccessGateway::authorizeStorageAccess(const Identity& who,
                                                                          const ids::Snowflake nodeId,
                                                                          const storage::Operation op) const {
    if (!presigner_) throw std::logic_error("AccessGateway has no object storage configured");

    const auto action = op == storage::Operation::Read ? Action::StorageRead : Action::StorageWrite;
    const auto view = store_->snapshot();
    const auto& tree = view.tree();
    const auto& node = check_(tree, who, nodeId, requiredLevel(action), action);

    if (!carriesObject(node.type))
        throw InvalidOperationError("A " + to_string(node.type) + " has no storage object");
    if (op == storage::Operation::Write && tree.isTrashed(nodeId))
        throw InvalidOperationError("Node " + std::to_string(nodeId) + " is deleted");

    return presigner_->issue(nodeId, op);
}
