#include "db/DBConnection.hpp"

#include <pqxx/pqxx>

void canopy::db::DBConnection::initPreparedGrants() const {
    conn_->prepare("list_grants",
                   "SELECT node_id, subject_id, level, granted_by, "
                   "EXTRACT(EPOCH FROM created_at)::BIGINT AS created_at "
                   "FROM node_grants");

    conn_->prepare("upsert_grant",
                   R"SQL(
    INSERT INTO node_grants (node_id, subject_id, level, granted_by, created_at)
    VALUES ($1, $2, $3, $4, to_timestamp($5))
    ON CONFLICT (node_id, subject_id) DO UPDATE
    SET level = EXCLUDED.level,
        granted_by = EXCLUDED.granted_by,
        created_at = EXCLUDED.created_at
)SQL");

    conn_->prepare("delete_grant", "DELETE FROM node_grants WHERE node_id = $1 AND subject_id = $2");
}
