#pragma once

#include "node/Backend.hpp"

namespace canopy::config { struct DatabaseConfig; }

namespace canopy::db {

// Node store persistence over the pooled Postgres connections. Writers in other
// processes serialize on one advisory lock, and moves re-check the committed
// parent chain before rewriting parent_id.
class PostgresBackend final : public node::Backend {
public:
    // Opens the pool, deploys the schema and registers prepared statements.
    explicit PostgresBackend(const config::DatabaseConfig& cnf);

    [[nodiscard]] Snapshot load() override;
    void insertNode(const node::model::Node& node) override;
    void updateNode(const node::model::Node& node) override;
    void moveNode(const node::model::Node& node) override;
    void upsertGrant(const rbac::model::Grant& grant) override;
    void deleteGrant(ids::Snowflake nodeId, identity::UserId subjectId) override;
};

}
