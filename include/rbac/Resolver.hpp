#pragma once

#include "rbac/PermissionLevel.hpp"
#include "ids/Snowflake.hpp"
#include "identity/Identity.hpp"

#include <map>
#include <optional>
#include <nlohmann/json_fwd.hpp>

namespace canopy::node { class Tree; }

namespace canopy::rbac {

// Where an effective level came from.
struct Resolution {
    PermissionLevel level{PermissionLevel::None};
    std::optional<ids::Snowflake> source{}; // node holding the deciding grant or ownership
    bool via_ownership = false;
};

void to_json(nlohmann::json& j, const Resolution& r);

// Effective permission over a consistent view of the tree. Ownership of the
// node, or of any ancestor, resolves to Owner; otherwise the strongest explicit
// grant on the node or its ancestors wins.
class Resolver {
public:
    [[nodiscard]] static PermissionLevel resolve(const node::Tree& tree, identity::UserId user, ids::Snowflake nodeId);
    [[nodiscard]] static Resolution explain(const node::Tree& tree, identity::UserId user, ids::Snowflake nodeId);

    // Every subject with a level above None on the node, owners included.
    [[nodiscard]] static std::map<identity::UserId, PermissionLevel>
    effectivePermissions(const node::Tree& tree, ids::Snowflake nodeId);

    // The same mapping as if the node hung under newParentId instead of its
    // current parent.
    [[nodiscard]] static std::map<identity::UserId, PermissionLevel>
    effectivePermissionsUnder(const node::Tree& tree, ids::Snowflake nodeId, ids::Snowflake newParentId);
};

}
