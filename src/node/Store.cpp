#include "node/Store.hpp"
#include "ids/SnowflakeGenerator.hpp"
#include "error/Errors.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <stdexcept>

using namespace canopy::node;
using namespace canopy::node::model;
using namespace canopy::security;
using namespace canopy::log;

namespace {

void requireName(const std::string& name) {
    if (name.empty()) throw canopy::error::InvalidOperationError("Node name must not be empty");
}

}

Store::Store(std::shared_ptr<Backend> backend, std::shared_ptr<ids::SnowflakeGenerator> ids)
    : backend_(std::move(backend)), ids_(std::move(ids)) {
    if (!backend_) throw std::invalid_argument("Store requires a backend");
    if (!ids_) throw std::invalid_argument("Store requires an id generator");
}

void Store::load() {
    auto snap = backend_->load();
    const auto nodeCount = snap.nodes.size(), grantCount = snap.grants.size();
    auto tree = Tree::build(std::move(snap.nodes), std::move(snap.grants));

    std::unique_lock lock(mutex_);
    tree_ = std::move(tree);
    Registry::canopy()->info("[Store] Hydrated {} nodes and {} grants", nodeCount, grantCount);
}

void Store::requireCapability_(const Capability& cap, const Action action,
                               const std::optional<ids::Snowflake>& target) {
    if (cap.action() != action || cap.target() != target)
        throw std::logic_error("Capability for " + to_string(cap.action()) + " does not cover " + to_string(action));
}

Node Store::get(const ids::Snowflake id) const {
    const auto view = snapshot();
    return view.tree().get(id);
}

ChildCursor Store::listChildren(const ids::Snowflake parentId, const bool includeDeleted) const {
    {
        const auto view = snapshot();
        (void)view.tree().get(parentId);
    }
    return {*this, parentId, includeDeleted};
}

size_t Store::size() const {
    const auto view = snapshot();
    return view.tree().size();
}

std::optional<Node> ChildCursor::next() {
    const auto view = store_->snapshot();
    const auto& tree = view.tree();

    while (const auto childId = tree.nextChild(parentId_, last_)) {
        last_ = childId;
        const auto& child = tree.get(*childId);
        if (!includeDeleted_ && child.isDeleted()) continue;
        return child;
    }
    return std::nullopt;
}

Node Store::WriteView::create(const Capability& cap, const NodeType type,
                              const std::optional<ids::Snowflake>& parentId, const identity::UserId ownerId,
                              const std::string& name) {
    requireCapability_(cap, parentId ? Action::CreateChild : Action::CreateWorkspace, parentId);
    requireName(name);

    try {
        tree().validateCreate(type, parentId);
    } catch (const error::Error& e) {
        Registry::store()->warn("[Store] Rejected create of {} under {}: {}", to_string(type),
                                parentId ? std::to_string(*parentId) : "<root>", e.what());
        throw;
    }

    Node node;
    node.id = store_->ids_->next();
    node.type = type;
    node.name = name;
    node.parent_id = parentId;
    node.owner_id = ownerId;
    node.created_at = node.updated_at = util::now();

    store_->backend_->insertNode(node);
    store_->tree_.insert(node);

    Registry::store()->debug("[Store] Created {}", to_string(node));
    return node;
}

Node Store::WriteView::move(const Capability& cap, const ids::Snowflake id, const ids::Snowflake newParentId) {
    requireCapability_(cap, Action::Move, id);

    try {
        tree().validateMove(id, newParentId);
    } catch (const error::Error& e) {
        Registry::store()->warn("[Store] Rejected move of {} under {}: {}", id, newParentId, e.what());
        throw;
    }

    auto updated = tree().get(id);
    if (updated.parent_id == newParentId) return updated;

    updated.parent_id = newParentId;
    updated.updated_at = util::now();

    store_->backend_->moveNode(updated);
    store_->tree_.reparent(id, newParentId, updated.updated_at);

    Registry::store()->debug("[Store] Moved {} under {}", id, newParentId);
    return updated;
}

Node Store::WriteView::rename(const Capability& cap, const ids::Snowflake id, const std::string& name) {
    requireCapability_(cap, Action::Rename, id);
    requireName(name);

    auto updated = tree().get(id);
    updated.name = name;
    updated.updated_at = util::now();

    store_->backend_->updateNode(updated);
    store_->tree_.rename(id, name, updated.updated_at);
    return updated;
}

Node Store::WriteView::softDelete(const Capability& cap, const ids::Snowflake id) {
    requireCapability_(cap, Action::SoftDelete, id);

    auto updated = tree().get(id);
    if (updated.isDeleted()) return updated;

    updated.updated_at = util::now();
    updated.deleted_at = updated.updated_at;

    store_->backend_->updateNode(updated);
    store_->tree_.markDeleted(id, updated.updated_at);

    Registry::store()->debug("[Store] Soft-deleted {}", id);
    return updated;
}

Node Store::WriteView::restore(const Capability& cap, const ids::Snowflake id) {
    requireCapability_(cap, Action::Restore, id);

    try {
        tree().validateRestore(id);
    } catch (const error::Error& e) {
        Registry::store()->warn("[Store] Rejected restore of {}: {}", id, e.what());
        throw;
    }

    auto updated = tree().get(id);
    updated.deleted_at = std::nullopt;
    updated.updated_at = util::now();

    store_->backend_->updateNode(updated);
    store_->tree_.clearDeleted(id, updated.updated_at);

    Registry::store()->debug("[Store] Restored {}", id);
    return updated;
}

void Store::WriteView::putGrant(const Capability& cap, const rbac::model::Grant& grant) {
    requireCapability_(cap, Action::Share, grant.node_id);
    if (grant.level == rbac::PermissionLevel::None)
        throw error::InvalidOperationError("A grant must carry a level above none");
    (void)tree().get(grant.node_id);

    store_->backend_->upsertGrant(grant);
    store_->tree_.putGrant(grant);
}

bool Store::WriteView::revokeGrant(const Capability& cap, const ids::Snowflake nodeId,
                                   const identity::UserId subjectId) {
    requireCapability_(cap, Action::Share, nodeId);
    if (!tree().grantFor(nodeId, subjectId)) return false;

    store_->backend_->deleteGrant(nodeId, subjectId);
    return store_->tree_.eraseGrant(nodeId, subjectId);
}
