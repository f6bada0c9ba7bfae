#include "db/query/rbac/Grant.hpp"
#include "db/Transactions.hpp"
#include "rbac/model/Grant.hpp"

using namespace canopy::db::query::rbac;

void Grant::upsert(const GrantModel& grant) {
    Transactions::exec("Grant::upsert", [&](pqxx::work& txn) {
        pqxx::params p;
        p.append(grant.node_id);
        p.append(grant.subject_id);
        p.append(static_cast<int>(canopy::rbac::toInt(grant.level)));
        p.append(grant.granted_by);
        p.append(grant.created_at);
        txn.exec(pqxx::prepped{"upsert_grant"}, p);
    });
}

void Grant::remove(const ids::Snowflake nodeId, const identity::UserId subjectId) {
    Transactions::exec("Grant::remove", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"delete_grant"}, pqxx::params{nodeId, subjectId});
    });
}
