#pragma once

#include "config/Config.hpp"
#include "storage/ScopedStorageGrant.hpp"

#include <chrono>
#include <ctime>
#include <functional>
#include <string>

namespace canopy::storage {

// AWS Signature Version 4 query-string signing for single-object requests.
class Presigner {
public:
    using Clock = std::function<std::time_t()>;

    static constexpr std::chrono::seconds MAX_TTL{604800}; // SigV4 ceiling, 7 days

    explicit Presigner(config::StorageConfig cnf, Clock clock = {});

    // "<key_prefix>/<node id>". Independent of the node's position in the tree.
    [[nodiscard]] std::string objectKey(ids::Snowflake nodeId) const;

    [[nodiscard]] ScopedStorageGrant issue(ids::Snowflake nodeId, Operation op) const;

    [[nodiscard]] std::string presign(const std::string& method, const std::string& key,
                                      std::chrono::seconds ttl, std::time_t at) const;

    [[nodiscard]] const config::StorageConfig& config() const { return cnf_; }

private:
    config::StorageConfig cnf_;
    Clock clock_;
    std::string scheme_, endpointHost_;

    [[nodiscard]] std::string host_() const;
    [[nodiscard]] std::string canonicalPath_(const std::string& key) const;
};

}
