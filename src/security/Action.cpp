#include "security/Action.hpp"

#include <stdexcept>

std::string canopy::security::to_string(const Action action) {
    switch (action) {
        case Action::ReadNode: return "read_node";
        case Action::ListChildren: return "list_children";
        case Action::ListTrash: return "list_trash";
        case Action::CreateWorkspace: return "create_workspace";
        case Action::CreateChild: return "create_child";
        case Action::Rename: return "rename";
        case Action::Move: return "move";
        case Action::SoftDelete: return "soft_delete";
        case Action::Restore: return "restore";
        case Action::Share: return "share";
        case Action::ViewPermissions: return "view_permissions";
        case Action::StorageRead: return "storage_read";
        case Action::StorageWrite: return "storage_write";
    }
    throw std::invalid_argument("Unknown action");
}
