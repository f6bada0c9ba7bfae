#pragma once

#include "node/model/Node.hpp"
#include "rbac/model/Grant.hpp"

#include <vector>

namespace canopy::node {

// Durable side of the node store. Each call is one transaction; a throw means
// nothing was written.
class Backend {
public:
    struct Snapshot {
        std::vector<model::Node> nodes;
        std::vector<rbac::model::Grant> grants;
    };

    virtual ~Backend() = default;

    [[nodiscard]] virtual Snapshot load() = 0;

    virtual void insertNode(const model::Node& node) = 0;

    // Name, timestamps and the deleted flag.
    virtual void updateNode(const model::Node& node) = 0;

    // Rewrites parent_id. Implementations shared between processes re-check
    // acyclicity inside the same transaction.
    virtual void moveNode(const model::Node& node) = 0;

    virtual void upsertGrant(const rbac::model::Grant& grant) = 0;
    virtual void deleteGrant(ids::Snowflake nodeId, identity::UserId subjectId) = 0;
};

// Keeps nothing. For tests and ephemeral runs.
class VolatileBackend final : public Backend {
public:
    VolatileBackend() = default;
    explicit VolatileBackend(Snapshot seed) : seed_(std::move(seed)) {}

    [[nodiscard]] Snapshot load() override { return seed_; }
    void insertNode(const model::Node&) override {}
    void updateNode(const model::Node&) override {}
    void moveNode(const model::Node&) override {}
    void upsertGrant(const rbac::model::Grant&) override {}
    void deleteGrant(ids::Snowflake, identity::UserId) override {}

private:
    Snapshot seed_;
};

}
