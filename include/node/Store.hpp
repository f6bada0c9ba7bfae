#pragma once

#include "node/Tree.hpp"
#include "node/Backend.hpp"
#include "security/Capability.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

namespace canopy::ids { class SnowflakeGenerator; }

namespace canopy::node {

class Store;

// Lazy listing of a node's children in id order. Every next() observes the
// tree as it is at that moment; restart() begins again from the first child.
class ChildCursor {
public:
    [[nodiscard]] std::optional<model::Node> next();
    void restart() { last_.reset(); }

private:
    friend class Store;

    ChildCursor(const Store& store, ids::Snowflake parentId, bool includeDeleted)
        : store_(&store), parentId_(parentId), includeDeleted_(includeDeleted) {}

    const Store* store_;
    ids::Snowflake parentId_;
    bool includeDeleted_;
    std::optional<ids::Snowflake> last_;
};

// Owns the node arena. Readers share the tree; every mutation runs under the
// exclusive lock, is persisted through the backend first and only then applied
// in memory, so a failed write leaves both sides untouched.
class Store {
public:
    Store(std::shared_ptr<Backend> backend, std::shared_ptr<ids::SnowflakeGenerator> ids);

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    // Replaces the arena with whatever the backend holds.
    void load();

    class ReadView {
    public:
        [[nodiscard]] const Tree& tree() const { return *tree_; }

    private:
        friend class Store;
        explicit ReadView(const Store& store) : lock_(store.mutex_), tree_(&store.tree_) {}

        std::shared_lock<std::shared_mutex> lock_;
        const Tree* tree_;
    };

    class WriteView {
    public:
        [[nodiscard]] const Tree& tree() const { return store_->tree_; }

        model::Node create(const security::Capability& cap, model::NodeType type,
                           const std::optional<ids::Snowflake>& parentId, identity::UserId ownerId,
                           const std::string& name);

        model::Node move(const security::Capability& cap, ids::Snowflake id, ids::Snowflake newParentId);
        model::Node rename(const security::Capability& cap, ids::Snowflake id, const std::string& name);

        // Idempotent; a node already deleted keeps its original deleted_at.
        model::Node softDelete(const security::Capability& cap, ids::Snowflake id);
        model::Node restore(const security::Capability& cap, ids::Snowflake id);

        void putGrant(const security::Capability& cap, const rbac::model::Grant& grant);
        bool revokeGrant(const security::Capability& cap, ids::Snowflake nodeId, identity::UserId subjectId);

    private:
        friend class Store;
        explicit WriteView(Store& store) : lock_(store.mutex_), store_(&store) {}

        std::unique_lock<std::shared_mutex> lock_;
        Store* store_;
    };

    [[nodiscard]] ReadView snapshot() const { return ReadView(*this); }
    [[nodiscard]] WriteView exclusive() { return WriteView(*this); }

    // Unauthorized reads for administration (canopy-admin) and for the gateway's
    // own tests. Anything acting for an identity reads through AccessGateway.
    [[nodiscard]] model::Node get(ids::Snowflake id) const;
    [[nodiscard]] ChildCursor listChildren(ids::Snowflake parentId, bool includeDeleted = false) const;
    [[nodiscard]] size_t size() const;

private:
    std::shared_ptr<Backend> backend_;
    std::shared_ptr<ids::SnowflakeGenerator> ids_;
    mutable std::shared_mutex mutex_;
    Tree tree_;

    static void requireCapability_(const security::Capability& cap, security::Action action,
                                   const std::optional<ids::Snowflake>& target);
};

}
