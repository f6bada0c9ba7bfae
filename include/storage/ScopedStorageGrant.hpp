#pragma once

#include "ids/Snowflake.hpp"

#include <cstdint>
#include <ctime>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace canopy::storage {

enum class Operation : uint8_t { Read, Write };

[[nodiscard]] std::string to_string(Operation op);
[[nodiscard]] Operation operationFromString(const std::string& str);

// HTTP verb a presigned reference is issued for.
[[nodiscard]] constexpr const char* httpMethod(const Operation op) { return op == Operation::Read ? "GET" : "PUT"; }

// A pre-signed reference to exactly one object, valid for one operation until
// expires_at. Never carries the bucket credentials themselves.
struct ScopedStorageGrant {
    ids::Snowflake node_id{};
    std::string object_key;
    Operation operation{Operation::Read};
    std::string method;
    std::string url;
    std::time_t issued_at{}, expires_at{};
};

void to_json(nlohmann::json& j, const ScopedStorageGrant& grant);

}
