#include "storage/ScopedStorageGrant.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

std::string canopy::storage::to_string(const Operation op) {
    switch (op) {
        case Operation::Read: return "read";
        case Operation::Write: return "write";
    }
    throw std::invalid_argument("Unknown storage operation");
}

canopy::storage::Operation canopy::storage::operationFromString(const std::string& str) {
    if (str == "read") return Operation::Read;
    if (str == "write") return Operation::Write;
    throw std::invalid_argument("Unknown storage operation: " + str);
}

void canopy::storage::to_json(nlohmann::json& j, const ScopedStorageGrant& grant) {
    j = {
        {"node_id", std::to_string(grant.node_id)},
        {"object_key", grant.object_key},
        {"operation", to_string(grant.operation)},
        {"method", grant.method},
        {"url", grant.url},
        {"issued_at", util::timestampToString(grant.issued_at)},
        {"expires_at", util::timestampToString(grant.expires_at)}
    };
}
