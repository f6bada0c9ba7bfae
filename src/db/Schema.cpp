#include "db/Schema.hpp"
#include "db/Transactions.hpp"

void canopy::db::schema::deploy() {
    Transactions::exec("schema::deploy", [&](pqxx::work& txn) {
        txn.exec(R"(
CREATE TABLE IF NOT EXISTS nodes
(
    id          BIGINT       PRIMARY KEY,
    type        SMALLINT     NOT NULL CHECK (type BETWEEN 0 AND 3),
    name        TEXT         NOT NULL,
    parent_id   BIGINT       REFERENCES nodes (id),
    owner_id    BIGINT       NOT NULL,
    created_at  TIMESTAMPTZ  NOT NULL DEFAULT CURRENT_TIMESTAMP,
    updated_at  TIMESTAMPTZ  NOT NULL DEFAULT CURRENT_TIMESTAMP,
    deleted_at  TIMESTAMPTZ,
    CHECK ((type = 0) = (parent_id IS NULL)),
    CHECK (parent_id IS NULL OR parent_id <> id)
);
        )");

        txn.exec("CREATE INDEX IF NOT EXISTS idx_nodes_parent ON nodes (parent_id)");

        txn.exec(R"(
CREATE TABLE IF NOT EXISTS node_grants
(
    node_id     BIGINT       NOT NULL REFERENCES nodes (id),
    subject_id  BIGINT       NOT NULL,
    level       SMALLINT     NOT NULL CHECK (level BETWEEN 1 AND 4),
    granted_by  BIGINT,
    created_at  TIMESTAMPTZ  NOT NULL DEFAULT CURRENT_TIMESTAMP,
    PRIMARY KEY (node_id, subject_id)
);
        )");

        txn.exec("CREATE INDEX IF NOT EXISTS idx_node_grants_subject ON node_grants (subject_id)");
    });

    log::Registry::db()->info("[schema] Node and grant tables ready");
}
