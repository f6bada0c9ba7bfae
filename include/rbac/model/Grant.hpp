#pragma once

#include "ids/Snowflake.hpp"
#include "identity/Identity.hpp"
#include "rbac/PermissionLevel.hpp"

#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pqxx {
class row;
class result;
}

namespace canopy::rbac::model {

// An explicit share of one node to one subject. Inheritance is never stored.
struct Grant {
    ids::Snowflake node_id{};
    identity::UserId subject_id{};
    PermissionLevel level{PermissionLevel::None};
    std::optional<identity::UserId> granted_by{};
    std::time_t created_at{};

    Grant() = default;
    Grant(ids::Snowflake nodeId, identity::UserId subjectId, PermissionLevel level,
          std::optional<identity::UserId> grantedBy = std::nullopt, std::time_t createdAt = 0);
    explicit Grant(const pqxx::row& row);
};

void to_json(nlohmann::json& j, const Grant& grant);
void from_json(const nlohmann::json& j, Grant& grant);

std::vector<Grant> grants_from_pq_res(const pqxx::result& res);

}
