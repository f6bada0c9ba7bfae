#include "rbac/PermissionLevel.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace canopy::rbac {

std::string to_string(const PermissionLevel level) {
    switch (level) {
        case PermissionLevel::None: return "none";
        case PermissionLevel::Read: return "read";
        case PermissionLevel::Comment: return "comment";
        case PermissionLevel::Edit: return "edit";
        case PermissionLevel::Owner: return "owner";
    }
    throw std::invalid_argument("Unknown permission level: " + std::to_string(toInt(level)));
}

PermissionLevel permissionLevelFromString(const std::string& str) {
    std::string lower(str);
    std::ranges::transform(lower, lower.begin(), [](const unsigned char c) { return std::tolower(c); });

    if (lower == "none") return PermissionLevel::None;
    if (lower == "read") return PermissionLevel::Read;
    if (lower == "comment") return PermissionLevel::Comment;
    if (lower == "edit") return PermissionLevel::Edit;
    if (lower == "owner" || lower == "admin") return PermissionLevel::Owner;
    throw std::invalid_argument("Unknown permission level: " + str);
}

PermissionLevel permissionLevelFromInt(const int value) {
    if (value < toInt(PermissionLevel::None) || value > toInt(PermissionLevel::Owner))
        throw std::invalid_argument("Permission level out of range: " + std::to_string(value));
    return static_cast<PermissionLevel>(value);
}

void to_json(nlohmann::json& j, const PermissionLevel& level) {
    j = to_string(level);
}

void from_json(const nlohmann::json& j, PermissionLevel& level) {
    if (j.is_number_integer()) level = permissionLevelFromInt(j.get<int>());
    else level = permissionLevelFromString(j.get<std::string>());
}

}
