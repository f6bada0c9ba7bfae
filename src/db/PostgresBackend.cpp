#include "db/PostgresBackend.hpp"
#include "db/Transactions.hpp"
#include "db/Schema.hpp"
#include "db/query/node/Node.hpp"
#include "db/query/rbac/Grant.hpp"
#include "config/Config.hpp"
#include "node/model/Node.hpp"
#include "rbac/model/Grant.hpp"

using namespace canopy::db;

PostgresBackend::PostgresBackend(const config::DatabaseConfig& cnf) {
    Transactions::init(cnf);
    schema::deploy();
    Transactions::initPrepared();
}

canopy::node::Backend::Snapshot PostgresBackend::load() {
    // One snapshot for both tables so every grant finds its node.
    return Transactions::exec("PostgresBackend::load", [&](pqxx::work& txn) {
        txn.exec("SET TRANSACTION ISOLATION LEVEL REPEATABLE READ READ ONLY");
        Snapshot snap;
        snap.nodes = node::model::nodes_from_pq_res(txn.exec(pqxx::prepped{"list_nodes"}));
        snap.grants = rbac::model::grants_from_pq_res(txn.exec(pqxx::prepped{"list_grants"}));
        return snap;
    });
}

void PostgresBackend::insertNode(const node::model::Node& node) { query::node::Node::insert(node); }

void PostgresBackend::updateNode(const node::model::Node& node) { query::node::Node::update(node); }

void PostgresBackend::moveNode(const node::model::Node& node) { query::node::Node::move(node); }

void PostgresBackend::upsertGrant(const rbac::model::Grant& grant) { query::rbac::Grant::upsert(grant); }

void PostgresBackend::deleteGrant(const ids::Snowflake nodeId, const identity::UserId subjectId) {
    query::rbac::Grant::remove(nodeId, subjectId);
}
