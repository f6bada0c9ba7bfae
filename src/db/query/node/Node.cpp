#include "db/query/node/Node.hpp"
#include "db/Transactions.hpp"
#include "node/model/Node.hpp"
#include "error/Errors.hpp"
#include "log/Registry.hpp"

using namespace canopy::db::query::node;

void Node::insert(const NodeModel& node) {
    Transactions::exec("Node::insert", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"lock_node_tree"}, pqxx::params{TREE_LOCK_KEY});

        if (node.parent_id && !txn.exec(pqxx::prepped{"node_exists"}, pqxx::params{*node.parent_id}).one_field().as<bool>())
            throw error::ParentNotFoundError("Parent " + std::to_string(*node.parent_id) + " not found");

        pqxx::params p;
        p.append(node.id);
        p.append(static_cast<int>(node.type));
        p.append(node.name);
        p.append(node.parent_id);
        p.append(node.owner_id);
        p.append(node.created_at);
        p.append(node.updated_at);
        p.append(node.deleted_at);

        txn.exec(pqxx::prepped{"insert_node"}, p);
    });
}

void Node::update(const NodeModel& node) {
    Transactions::exec("Node::update", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"update_node"},
                                  pqxx::params{node.id, node.name, node.updated_at, node.deleted_at});
        if (res.affected_rows() == 0)
            throw error::NotFoundError("Node " + std::to_string(node.id) + " not found");
    });
}

void Node::move(const NodeModel& node) {
    if (!node.parent_id) throw error::InvalidParentError("A workspace cannot be moved under another node");

    Transactions::exec("Node::move", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"lock_node_tree"}, pqxx::params{TREE_LOCK_KEY});

        const bool cycle = txn.exec(pqxx::prepped{"node_chain_contains"},
                                    pqxx::params{*node.parent_id, node.id}).one_field().as<bool>();
        if (cycle) {
            log::Registry::db()->warn("[Node::move] Committed tree puts {} under {}, refusing move",
                                      *node.parent_id, node.id);
            throw error::CycleError("Node " + std::to_string(*node.parent_id) + " is a descendant of " +
                                    std::to_string(node.id));
        }

        const auto res = txn.exec(pqxx::prepped{"move_node"},
                                  pqxx::params{node.id, *node.parent_id, node.updated_at});
        if (res.affected_rows() == 0)
            throw error::NotFoundError("Node " + std::to_string(node.id) + " not found");
    });
}
