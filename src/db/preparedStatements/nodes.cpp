#include "db/DBConnection.hpp"

#include <pqxx/pqxx>

void canopy::db::DBConnection::initPreparedNodes() const {
    conn_->prepare("list_nodes",
                   "SELECT id, type, name, parent_id, owner_id, "
                   "EXTRACT(EPOCH FROM created_at)::BIGINT AS created_at, "
                   "EXTRACT(EPOCH FROM updated_at)::BIGINT AS updated_at, "
                   "EXTRACT(EPOCH FROM deleted_at)::BIGINT AS deleted_at "
                   "FROM nodes ORDER BY id");

    conn_->prepare("insert_node",
                   "INSERT INTO nodes (id, type, name, parent_id, owner_id, created_at, updated_at, deleted_at) "
                   "VALUES ($1, $2, $3, $4, $5, to_timestamp($6), to_timestamp($7), to_timestamp($8))");

    conn_->prepare("update_node",
                   "UPDATE nodes SET name = $2, updated_at = to_timestamp($3), deleted_at = to_timestamp($4) "
                   "WHERE id = $1");

    conn_->prepare("move_node",
                   "UPDATE nodes SET parent_id = $2, updated_at = to_timestamp($3) WHERE id = $1");

    conn_->prepare("node_exists", "SELECT EXISTS(SELECT 1 FROM nodes WHERE id = $1)");

    // UNION rather than UNION ALL so a corrupted chain still terminates.
    conn_->prepare("node_chain_contains",
                   R"SQL(
    WITH RECURSIVE chain AS (
        SELECT id, parent_id FROM nodes WHERE id = $1
        UNION
        SELECT n.id, n.parent_id FROM nodes n JOIN chain c ON n.id = c.parent_id
    )
    SELECT EXISTS(SELECT 1 FROM chain WHERE id = $2)
)SQL");

    conn_->prepare("lock_node_tree", "SELECT pg_advisory_xact_lock($1)");
}
