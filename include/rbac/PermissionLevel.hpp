#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace canopy::rbac {

// Total order; every level carries the capabilities of the ones below it.
enum class PermissionLevel : uint8_t {
    None = 0,
    Read = 1,
    Comment = 2,
    Edit = 3,
    Owner = 4,
};

[[nodiscard]] std::string to_string(PermissionLevel level);
[[nodiscard]] PermissionLevel permissionLevelFromString(const std::string& str);
[[nodiscard]] PermissionLevel permissionLevelFromInt(int value);

[[nodiscard]] constexpr uint8_t toInt(const PermissionLevel level) { return static_cast<uint8_t>(level); }

[[nodiscard]] constexpr PermissionLevel maxLevel(const PermissionLevel a, const PermissionLevel b) {
    return a < b ? b : a;
}

void to_json(nlohmann::json& j, const PermissionLevel& level);
void from_json(const nlohmann::json& j, PermissionLevel& level);

}
