#include "rbac/model/Grant.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/result>

using namespace canopy::rbac;
using namespace canopy::rbac::model;

Grant::Grant(const ids::Snowflake nodeId, const identity::UserId subjectId, const PermissionLevel level,
             std::optional<identity::UserId> grantedBy, const std::time_t createdAt)
    : node_id(nodeId), subject_id(subjectId), level(level), granted_by(grantedBy), created_at(createdAt) {}

Grant::Grant(const pqxx::row& row)
    : node_id(row["node_id"].as<ids::Snowflake>()),
      subject_id(row["subject_id"].as<identity::UserId>()),
      level(permissionLevelFromInt(row["level"].as<int>())),
      created_at(row["created_at"].as<std::time_t>()) {
    if (row["granted_by"].is_null()) granted_by = std::nullopt;
    else granted_by = row["granted_by"].as<identity::UserId>();
}

std::vector<Grant> canopy::rbac::model::grants_from_pq_res(const pqxx::result& res) {
    std::vector<Grant> grants;
    grants.reserve(res.size());
    for (const auto& row : res) grants.emplace_back(row);
    return grants;
}

void canopy::rbac::model::to_json(nlohmann::json& j, const Grant& grant) {
    j = {
        {"node_id", std::to_string(grant.node_id)},
        {"subject_id", grant.subject_id},
        {"level", grant.level},
        {"created_at", util::timestampToString(grant.created_at)}
    };
    if (grant.granted_by) j["granted_by"] = *grant.granted_by;
}

void canopy::rbac::model::from_json(const nlohmann::json& j, Grant& grant) {
    grant.node_id = ids::parseSnowflake(j.at("node_id").get<std::string>());
    grant.subject_id = j.at("subject_id").get<identity::UserId>();
    grant.level = j.at("level").get<PermissionLevel>();
    grant.granted_by = j.contains("granted_by")
                           ? std::make_optional(j.at("granted_by").get<identity::UserId>())
                           : std::nullopt;
    grant.created_at = j.contains("created_at")
                           ? util::parseTimestampFromString(j.at("created_at").get<std::string>())
                           : 0;
}
