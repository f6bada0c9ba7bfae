#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace canopy::ids {

using Snowflake = uint64_t;

// 2024-01-01T00:00:00Z
inline constexpr uint64_t EPOCH_MS = 1704067200000ULL;

inline constexpr unsigned TIMESTAMP_BITS = 41;
inline constexpr unsigned GENERATOR_BITS = 10;
inline constexpr unsigned SEQUENCE_BITS = 12;

inline constexpr uint64_t MAX_TIMESTAMP = (1ULL << TIMESTAMP_BITS) - 1;
inline constexpr uint16_t MAX_GENERATOR_ID = (1U << GENERATOR_BITS) - 1;
inline constexpr uint16_t MAX_SEQUENCE = (1U << SEQUENCE_BITS) - 1;

struct SnowflakeParts {
    uint64_t timestamp_ms{};   // milliseconds since EPOCH_MS
    uint16_t generator_id{};
    uint16_t sequence{};

    [[nodiscard]] uint64_t unixMillis() const { return timestamp_ms + EPOCH_MS; }
};

[[nodiscard]] constexpr Snowflake compose(const uint64_t timestampMs, const uint16_t generatorId, const uint16_t sequence) {
    return (timestampMs & MAX_TIMESTAMP) << (GENERATOR_BITS + SEQUENCE_BITS)
           | static_cast<uint64_t>(generatorId & MAX_GENERATOR_ID) << SEQUENCE_BITS
           | (sequence & MAX_SEQUENCE);
}

[[nodiscard]] constexpr SnowflakeParts decompose(const Snowflake id) {
    return {
        .timestamp_ms = id >> (GENERATOR_BITS + SEQUENCE_BITS),
        .generator_id = static_cast<uint16_t>((id >> SEQUENCE_BITS) & MAX_GENERATOR_ID),
        .sequence = static_cast<uint16_t>(id & MAX_SEQUENCE)
    };
}

void to_json(nlohmann::json& j, const SnowflakeParts& parts);

std::string to_string(const SnowflakeParts& parts);

// Strict decimal parse; throws std::invalid_argument on anything else.
Snowflake parseSnowflake(const std::string& str);

}
