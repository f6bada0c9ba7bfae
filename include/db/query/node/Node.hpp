#pragma once

#include "ids/Snowflake.hpp"

#include <cstdint>

namespace canopy::node::model { struct Node; }

namespace canopy::db::query::node {

class Node {
    using NodeModel = canopy::node::model::Node;

public:
    // Key shared by every writer of the node tree for pg_advisory_xact_lock.
    static constexpr int64_t TREE_LOCK_KEY = 0x63616e6f7079; // "canopy"

    static void insert(const NodeModel& node);

    static void update(const NodeModel& node);

    // Re-checks acyclicity against the committed tree under the advisory lock.
    static void move(const NodeModel& node);
};

}
