#pragma once

#include "rbac/PermissionLevel.hpp"

#include <cstdint>
#include <string>

namespace canopy::security {

enum class Action : uint8_t {
    ReadNode,
    ListChildren,
    ListTrash,
    CreateWorkspace,
    CreateChild,
    Rename,
    Move,
    SoftDelete,
    Restore,
    Share,
    ViewPermissions,
    StorageRead,
    StorageWrite,
};

// Minimum effective level the gateway demands for an action.
[[nodiscard]] constexpr rbac::PermissionLevel requiredLevel(const Action action) {
    using rbac::PermissionLevel;
    switch (action) {
        case Action::ReadNode:
        case Action::ListChildren:
        case Action::StorageRead: return PermissionLevel::Read;
        case Action::CreateChild:
        case Action::Rename:
        case Action::Move:
        case Action::StorageWrite: return PermissionLevel::Edit;
        case Action::ListTrash:
        case Action::SoftDelete:
        case Action::Restore:
        case Action::Share:
        case Action::ViewPermissions: return PermissionLevel::Owner;
        case Action::CreateWorkspace: return PermissionLevel::None;
    }
    return PermissionLevel::Owner;
}

[[nodiscard]] std::string to_string(Action action);

}
