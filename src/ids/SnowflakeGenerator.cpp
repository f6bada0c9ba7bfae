#include "ids/SnowflakeGenerator.hpp"
#include "error/Errors.hpp"
#include "log/Registry.hpp"
#include "config/Config.hpp"

#include <sodium.h>
#include <unistd.h>
#include <array>
#include <climits>
#include <stdexcept>
#include <string>
#include <thread>

using namespace canopy::ids;
using namespace canopy::log;

SnowflakeGenerator::SnowflakeGenerator(const uint16_t generatorId,
                                       const std::chrono::milliseconds skewTolerance,
                                       Clock clock)
    : generatorId_(generatorId), skewTolerance_(skewTolerance), clock_(std::move(clock)) {
    if (generatorId_ > MAX_GENERATOR_ID)
        throw std::invalid_argument("Generator id " + std::to_string(generatorId_) + " does not fit in "
                                    + std::to_string(GENERATOR_BITS) + " bits");
    if (skewTolerance_.count() < 0) throw std::invalid_argument("Clock skew tolerance must not be negative");
    if (!clock_) throw std::invalid_argument("SnowflakeGenerator requires a clock");
}

uint64_t SnowflakeGenerator::systemClock() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

uint64_t SnowflakeGenerator::currentTimestamp_() const {
    const auto unixMs = clock_();
    if (unixMs < EPOCH_MS)
        throw error::ClockSkewError("System clock reads " + std::to_string(unixMs) + "ms, before the id epoch");

    const auto ts = unixMs - EPOCH_MS;
    if (ts > MAX_TIMESTAMP) throw std::overflow_error("Snowflake timestamp space exhausted");
    return ts;
}

uint64_t SnowflakeGenerator::waitUntil_(const uint64_t targetTimestamp) const {
    auto now = currentTimestamp_();
    while (now < targetTimestamp) {
        std::this_thread::yield();
        now = currentTimestamp_();
    }
    return now;
}

Snowflake SnowflakeGenerator::next() {
    std::lock_guard lock(mutex_);

    auto now = currentTimestamp_();

    if (issued_ && now < lastTimestamp_) {
        const auto drift = lastTimestamp_ - now;
        if (drift > static_cast<uint64_t>(skewTolerance_.count())) {
            Registry::ids()->error("[SnowflakeGenerator] Clock moved back {}ms (tolerance {}ms), refusing to mint",
                                   drift, skewTolerance_.count());
            throw error::ClockSkewError("Clock moved backwards by " + std::to_string(drift) + "ms");
        }
        Registry::ids()->warn("[SnowflakeGenerator] Clock moved back {}ms, waiting for it to catch up", drift);
        now = waitUntil_(lastTimestamp_);
    }

    if (issued_ && now == lastTimestamp_) {
        sequence_ = static_cast<uint16_t>((sequence_ + 1) & MAX_SEQUENCE);
        if (sequence_ == 0) {
            Registry::ids()->debug("[SnowflakeGenerator] Sequence exhausted at {}, waiting for next millisecond", now);
            now = waitUntil_(lastTimestamp_ + 1);
        }
    } else {
        sequence_ = 0;
    }

    lastTimestamp_ = now;
    issued_ = true;
    return compose(now, generatorId_, sequence_);
}

uint16_t SnowflakeGenerator::deriveGeneratorId(const std::string_view instanceToken) {
    if (instanceToken.empty()) throw std::invalid_argument("Cannot derive a generator id from an empty token");
    if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");

    std::array<unsigned char, 16> digest{};
    crypto_generichash(digest.data(), digest.size(),
                       reinterpret_cast<const unsigned char*>(instanceToken.data()), instanceToken.size(),
                       /*key=*/nullptr, 0);

    const auto value = static_cast<uint16_t>(digest[0] << 8 | digest[1]);
    return static_cast<uint16_t>(value & MAX_GENERATOR_ID);
}

uint16_t SnowflakeGenerator::deriveGeneratorIdFromHost() {
    std::array<char, HOST_NAME_MAX + 1> host{};
    if (gethostname(host.data(), host.size()) != 0)
        throw std::runtime_error("gethostname failed, set ids.generator_id explicitly");

    const std::string_view name(host.data());
    const auto id = deriveGeneratorId(name);
    Registry::ids()->info("[SnowflakeGenerator] Derived generator id {} from host '{}'", id, name);
    return id;
}

std::shared_ptr<SnowflakeGenerator> canopy::ids::makeGenerator(const config::IdsConfig& cnf) {
    const auto id = cnf.generator_id == config::AUTO_GENERATOR_ID
                        ? SnowflakeGenerator::deriveGeneratorIdFromHost()
                        : cnf.generator_id;
    return std::make_shared<SnowflakeGenerator>(id, cnf.clock_skew_tolerance);
}
