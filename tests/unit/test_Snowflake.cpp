#include <gtest/gtest.h>
#include "ids/SnowflakeGenerator.hpp"
#include "error/Errors.hpp"

#include <algorithm>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace canopy::ids;
using canopy::error::ClockSkewError;

namespace {

// Replays a fixed list of readings, then repeats the last one forever.
SnowflakeGenerator::Clock scriptedClock(std::vector<uint64_t> readings) {
    auto state = std::make_shared<std::pair<std::vector<uint64_t>, size_t>>(std::move(readings), 0);
    return [state] {
        auto& [values, idx] = *state;
        const auto v = values[std::min(idx, values.size() - 1)];
        ++idx;
        return v;
    };
}

constexpr uint64_t T = EPOCH_MS + 5'000'000;

}

TEST(SnowflakeLayoutTest, ComposeDecomposeKeepsFields) {
    const auto id = compose(123456789, 513, 4000);
    const auto parts = decompose(id);
    EXPECT_EQ(parts.timestamp_ms, 123456789u);
    EXPECT_EQ(parts.generator_id, 513);
    EXPECT_EQ(parts.sequence, 4000);
}

TEST(SnowflakeLayoutTest, TopBitStaysClear) {
    const auto id = compose(MAX_TIMESTAMP, MAX_GENERATOR_ID, MAX_SEQUENCE);
    EXPECT_EQ(id >> 63, 0u);
    EXPECT_LE(id, static_cast<uint64_t>(INT64_MAX));
}

TEST(SnowflakeLayoutTest, TimestampDominatesOrdering) {
    EXPECT_LT(compose(10, MAX_GENERATOR_ID, MAX_SEQUENCE), compose(11, 0, 0));
}

TEST(SnowflakeLayoutTest, ParseIsStrict) {
    EXPECT_EQ(parseSnowflake("42"), 42u);
    EXPECT_THROW(parseSnowflake(""), std::invalid_argument);
    EXPECT_THROW(parseSnowflake("-1"), std::invalid_argument);
    EXPECT_THROW(parseSnowflake("12x"), std::invalid_argument);
    EXPECT_THROW(parseSnowflake("99999999999999999999999"), std::invalid_argument);
}

TEST(SnowflakeGeneratorTest, RejectsGeneratorIdOutOfRange) {
    EXPECT_THROW(SnowflakeGenerator(MAX_GENERATOR_ID + 1), std::invalid_argument);
    EXPECT_NO_THROW(SnowflakeGenerator{MAX_GENERATOR_ID});
}

TEST(SnowflakeGeneratorTest, EmbedsGeneratorAndTimestamp) {
    SnowflakeGenerator gen(77, std::chrono::milliseconds(10), scriptedClock({T}));
    const auto parts = decompose(gen.next());
    EXPECT_EQ(parts.generator_id, 77);
    EXPECT_EQ(parts.unixMillis(), T);
    EXPECT_EQ(parts.sequence, 0);
}

TEST(SnowflakeGeneratorTest, SameMillisecondIncrementsSequence) {
    SnowflakeGenerator gen(1, std::chrono::milliseconds(10), scriptedClock({T}));
    const auto a = gen.next(), b = gen.next(), c = gen.next();
    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
    EXPECT_EQ(decompose(c).sequence, 2);
}

TEST(SnowflakeGeneratorTest, SequenceOverflowWaitsForNextMillisecond) {
    std::vector<uint64_t> readings(MAX_SEQUENCE + 1 + 50, T);
    readings.push_back(T + 1);
    SnowflakeGenerator gen(1, std::chrono::milliseconds(10), scriptedClock(readings));

    Snowflake last = 0;
    for (uint32_t i = 0; i <= MAX_SEQUENCE; ++i) {
        const auto id = gen.next();
        EXPECT_GT(id, last);
        last = id;
    }
    EXPECT_EQ(decompose(last).sequence, MAX_SEQUENCE);

    const auto rolled = gen.next();
    EXPECT_GT(rolled, last);
    EXPECT_EQ(decompose(rolled).unixMillis(), T + 1);
    EXPECT_EQ(decompose(rolled).sequence, 0);
}

TEST(SnowflakeGeneratorTest, SmallBackwardStepWaitsInsteadOfFailing) {
    SnowflakeGenerator gen(1, std::chrono::milliseconds(10), scriptedClock({T, T - 5, T - 3, T}));
    const auto first = gen.next();
    const auto second = gen.next();
    EXPECT_GT(second, first);
    EXPECT_EQ(decompose(second).unixMillis(), T);
}

TEST(SnowflakeGeneratorTest, LargeBackwardStepRaisesClockSkew) {
    SnowflakeGenerator gen(1, std::chrono::milliseconds(10), scriptedClock({T, T - 500}));
    (void)gen.next();
    EXPECT_THROW((void)gen.next(), ClockSkewError);
}

TEST(SnowflakeGeneratorTest, KeepsRefusingUntilTheClockCatchesUp) {
    SnowflakeGenerator gen(1, std::chrono::milliseconds(10),
                           scriptedClock({T, T - 500, T - 500, T - 300, T, T + 1}));
    const auto first = gen.next();

    EXPECT_THROW((void)gen.next(), ClockSkewError);
    EXPECT_THROW((void)gen.next(), ClockSkewError);
    EXPECT_THROW((void)gen.next(), ClockSkewError);

    // back at the last issued millisecond: the refused calls consumed no sequence
    const auto resumed = gen.next();
    EXPECT_GT(resumed, first);
    EXPECT_EQ(resumed, compose(T - EPOCH_MS, 1, 1));

    const auto later = gen.next();
    EXPECT_EQ(decompose(later).unixMillis(), T + 1);
    EXPECT_EQ(decompose(later).sequence, 0);
}

TEST(SnowflakeGeneratorTest, ClockBeforeEpochRaisesClockSkew) {
    SnowflakeGenerator gen(1, std::chrono::milliseconds(10), scriptedClock({EPOCH_MS - 1}));
    EXPECT_THROW((void)gen.next(), ClockSkewError);
}

TEST(SnowflakeGeneratorTest, ConcurrentCallersGetUniqueIncreasingIds) {
    SnowflakeGenerator gen(3);
    constexpr int threads = 8, perThread = 5000;

    std::vector<std::vector<Snowflake>> minted(threads);
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t)
        workers.emplace_back([&, t] {
            minted[t].reserve(perThread);
            for (int i = 0; i < perThread; ++i) minted[t].push_back(gen.next());
        });
    for (auto& w : workers) w.join();

    std::unordered_set<Snowflake> seen;
    for (const auto& ids : minted) {
        EXPECT_TRUE(std::is_sorted(ids.begin(), ids.end()));
        for (const auto id : ids) EXPECT_TRUE(seen.insert(id).second) << "duplicate id " << id;
    }
    EXPECT_EQ(seen.size(), static_cast<size_t>(threads * perThread));
}

TEST(SnowflakeGeneratorTest, DerivedGeneratorIdIsStableAndInRange) {
    const auto a = SnowflakeGenerator::deriveGeneratorId("canopy-node-a");
    EXPECT_EQ(a, SnowflakeGenerator::deriveGeneratorId("canopy-node-a"));
    EXPECT_LE(a, MAX_GENERATOR_ID);
    EXPECT_THROW((void)SnowflakeGenerator::deriveGeneratorId(""), std::invalid_argument);
}
