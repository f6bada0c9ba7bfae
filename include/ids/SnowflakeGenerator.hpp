#pragma once

#include "ids/Snowflake.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>

namespace canopy::config { struct IdsConfig; }

namespace canopy::ids {

// Mints time-ordered 64-bit ids. The generator id must be unique among every
// process sharing the id space; nothing here can detect a collision.
class SnowflakeGenerator {
public:
    // Wall clock in Unix milliseconds.
    using Clock = std::function<uint64_t()>;

    explicit SnowflakeGenerator(uint16_t generatorId,
                                std::chrono::milliseconds skewTolerance = std::chrono::milliseconds(10),
                                Clock clock = systemClock);

    SnowflakeGenerator(const SnowflakeGenerator&) = delete;
    SnowflakeGenerator& operator=(const SnowflakeGenerator&) = delete;

    // Throws error::ClockSkewError while the clock sits behind the last issued
    // timestamp by more than the tolerance.
    [[nodiscard]] Snowflake next();

    [[nodiscard]] uint16_t generatorId() const { return generatorId_; }

    static uint64_t systemClock();

    // Stable 10-bit id from an instance token (host name, pod name, ...).
    [[nodiscard]] static uint16_t deriveGeneratorId(std::string_view instanceToken);
    [[nodiscard]] static uint16_t deriveGeneratorIdFromHost();

private:
    [[nodiscard]] uint64_t currentTimestamp_() const;
    [[nodiscard]] uint64_t waitUntil_(uint64_t targetTimestamp) const;

    const uint16_t generatorId_;
    const std::chrono::milliseconds skewTolerance_;
    Clock clock_;

    std::mutex mutex_;
    uint64_t lastTimestamp_ = 0;
    uint16_t sequence_ = 0;
    bool issued_ = false;
};

std::shared_ptr<SnowflakeGenerator> makeGenerator(const config::IdsConfig& cnf);

}
