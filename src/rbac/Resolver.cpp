#include "rbac/Resolver.hpp"
#include "node/Tree.hpp"

#include <nlohmann/json.hpp>

using namespace canopy::rbac;

namespace {

void raise(Resolution& best, const PermissionLevel level, const canopy::ids::Snowflake source) {
    if (level <= best.level) return;
    best.level = level;
    best.source = source;
}

}

void canopy::rbac::to_json(nlohmann::json& j, const Resolution& r) {
    j = {
        {"level", r.level},
        {"via_ownership", r.via_ownership}
    };
    if (r.source) j["source"] = std::to_string(*r.source);
    else j["source"] = nullptr;
}

PermissionLevel Resolver::resolve(const node::Tree& tree, const identity::UserId user, const ids::Snowflake nodeId) {
    return explain(tree, user, nodeId).level;
}

Resolution Resolver::explain(const node::Tree& tree, const identity::UserId user, const ids::Snowflake nodeId) {
    const auto& target = tree.get(nodeId);
    if (target.owner_id == user) return {PermissionLevel::Owner, nodeId, true};

    Resolution best;
    if (const auto level = tree.grantFor(nodeId, user)) raise(best, *level, nodeId);

    // The chain is finite: the arena refuses cycles on hydrate and on move.
    for (const auto* ancestor : tree.ancestors(nodeId)) {
        if (best.level == PermissionLevel::Owner) break;
        if (ancestor->owner_id == user) return {PermissionLevel::Owner, ancestor->id, true};
        if (const auto level = tree.grantFor(ancestor->id, user)) raise(best, *level, ancestor->id);
    }

    return best;
}

namespace {

using PermissionMap = std::map<canopy::identity::UserId, PermissionLevel>;

void collect(const canopy::node::Tree& tree, const canopy::node::model::Node& n, PermissionMap& out) {
    out[n.owner_id] = PermissionLevel::Owner;
    if (const auto* grants = tree.grantsOn(n.id))
        for (const auto& [subject, grant] : *grants)
            out[subject] = maxLevel(out[subject], grant.level);
}

PermissionMap withoutNone(PermissionMap out) {
    std::erase_if(out, [](const auto& kv) { return kv.second == PermissionLevel::None; });
    return out;
}

}

std::map<canopy::identity::UserId, PermissionLevel>
Resolver::effectivePermissions(const node::Tree& tree, const ids::Snowflake nodeId) {
    PermissionMap out;
    collect(tree, tree.get(nodeId), out);
    for (const auto* ancestor : tree.ancestors(nodeId)) collect(tree, *ancestor, out);
    return withoutNone(std::move(out));
}

std::map<canopy::identity::UserId, PermissionLevel>
Resolver::effectivePermissionsUnder(const node::Tree& tree, const ids::Snowflake nodeId,
                                    const ids::Snowflake newParentId) {
    PermissionMap out;
    collect(tree, tree.get(nodeId), out);
    collect(tree, tree.get(newParentId), out);
    for (const auto* ancestor : tree.ancestors(newParentId)) collect(tree, *ancestor, out);
    return withoutNone(std::move(out));
}
