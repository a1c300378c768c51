/**
 * @file RateCache_uTest.cpp
 * @brief Unit tests for proxwatch::collector::RateCache and rate math.
 *
 * Notes:
 *  - Time is passed explicitly, so no test sleeps.
 */

#include "src/collector/inc/RateCache.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>

using proxwatch::collector::calculateBps;
using proxwatch::collector::counterDelta;
using proxwatch::collector::InterfaceTraffic;
using proxwatch::collector::MAX_RATE_INTERVAL_SEC;
using proxwatch::collector::MIN_RATE_INTERVAL_SEC;
using proxwatch::collector::RateCache;

namespace {

constexpr std::uint64_t U64_MAX = std::numeric_limits<std::uint64_t>::max();

} // namespace

class RateCacheTest : public ::testing::Test {
protected:
  RateCache cache_;
};

/* ----------------------------- Rate Math Tests ----------------------------- */

/** @test Plain increase: octets * 8 / seconds. */
TEST(RateMathTest, PlainIncrease) {
  EXPECT_EQ(counterDelta(1000, 2000), 1000U);
  EXPECT_DOUBLE_EQ(calculateBps(1000, 2000, 2.0), 4000.0);
  EXPECT_DOUBLE_EQ(calculateBps(5, 5, 1.0), 0.0);
}

/** @test A counter below its previous value is corrected as a 64-bit wrap. */
TEST(RateMathTest, WraparoundCorrected) {
  const std::uint64_t PREV = 4294967290ULL;
  const std::uint64_t EXPECTED_DIFF = (U64_MAX - PREV) + 5 + 1;

  EXPECT_EQ(counterDelta(PREV, 5), EXPECTED_DIFF);

  const double BPS = calculateBps(PREV, 5, 2.0);
  EXPECT_GT(BPS, 0.0);
  EXPECT_TRUE(std::isfinite(BPS));
  EXPECT_DOUBLE_EQ(BPS, static_cast<double>(EXPECTED_DIFF) * 8.0 / 2.0);
}

/** @test Wrap at the very top of the range is a difference of one. */
TEST(RateMathTest, WrapFromMax) { EXPECT_EQ(counterDelta(U64_MAX, 0), 1U); }

/** @test Non-positive elapsed time yields zero. */
TEST(RateMathTest, NonPositiveElapsed) {
  EXPECT_DOUBLE_EQ(calculateBps(0, 1000, 0.0), 0.0);
  EXPECT_DOUBLE_EQ(calculateBps(0, 1000, -1.0), 0.0);
}

/* ----------------------------- RateCache Tests ----------------------------- */

/** @test First poll seeds the cache without emitting traffic. */
TEST_F(RateCacheTest, FirstPollSeedsOnly) {
  EXPECT_FALSE(cache_.update(1, "eth0", 1000, 2000, 100.0).has_value());

  ASSERT_EQ(cache_.size(), 1U);
  const auto SAMPLE = cache_.lookup(1, "eth0");
  ASSERT_TRUE(SAMPLE.has_value());
  EXPECT_EQ(SAMPLE->inOctets, 1000U);
  EXPECT_EQ(SAMPLE->outOctets, 2000U);
  EXPECT_DOUBLE_EQ(SAMPLE->observedAtSec, 100.0);
}

/** @test Second poll inside the window emits both directions. */
TEST_F(RateCacheTest, SecondPollEmits) {
  (void)cache_.update(1, "eth0", 1000, 2000, 100.0);
  const auto T = cache_.update(1, "eth0", 2250, 4500, 110.0);

  ASSERT_TRUE(T.has_value());
  EXPECT_EQ(T->name, "eth0");
  EXPECT_DOUBLE_EQ(T->inBps, 1000.0);
  EXPECT_DOUBLE_EQ(T->outBps, 2000.0);
}

/** @test Window bounds are inclusive. */
TEST_F(RateCacheTest, WindowInclusive) {
  (void)cache_.update(1, "a", 0, 0, 0.0);
  EXPECT_TRUE(cache_.update(1, "a", 100, 0, MIN_RATE_INTERVAL_SEC).has_value());

  (void)cache_.update(1, "b", 0, 0, 0.0);
  EXPECT_TRUE(cache_.update(1, "b", 100, 0, MAX_RATE_INTERVAL_SEC).has_value());
}

/** @test Too-frequent and stale polls emit nothing but still refresh the baseline. */
TEST_F(RateCacheTest, OutsideWindowRefreshesBaseline) {
  (void)cache_.update(1, "eth0", 1000, 1000, 100.0);

  EXPECT_FALSE(cache_.update(1, "eth0", 5000, 5000, 100.5).has_value());
  EXPECT_EQ(cache_.lookup(1, "eth0")->inOctets, 5000U);

  EXPECT_FALSE(cache_.update(1, "eth0", 9000, 9000, 500.0).has_value());
  EXPECT_DOUBLE_EQ(cache_.lookup(1, "eth0")->observedAtSec, 500.0);

  const auto T = cache_.update(1, "eth0", 9800, 9000, 510.0);
  ASSERT_TRUE(T.has_value());
  EXPECT_DOUBLE_EQ(T->inBps, 640.0);
  EXPECT_DOUBLE_EQ(T->outBps, 0.0);
}

/** @test Idle interface (no counter movement) emits nothing. */
TEST_F(RateCacheTest, IdleNotEmitted) {
  (void)cache_.update(1, "eth0", 42, 42, 0.0);
  EXPECT_FALSE(cache_.update(1, "eth0", 42, 42, 10.0).has_value());
}

/** @test A missing direction rates as zero and is stored as zero. */
TEST_F(RateCacheTest, MissingDirection) {
  (void)cache_.update(1, "eth0", 1000, 1000, 0.0);
  const auto T = cache_.update(1, "eth0", 2000, std::nullopt, 10.0);

  ASSERT_TRUE(T.has_value());
  EXPECT_DOUBLE_EQ(T->inBps, 800.0);
  EXPECT_DOUBLE_EQ(T->outBps, 0.0);
  EXPECT_EQ(cache_.lookup(1, "eth0")->outOctets, 0U);
}

/** @test A wrapped counter between polls yields a positive rate. */
TEST_F(RateCacheTest, WrapBetweenPolls) {
  (void)cache_.update(3, "wan", 4294967290ULL, 0, 0.0);
  const auto T = cache_.update(3, "wan", 5, 0, 2.0);

  ASSERT_TRUE(T.has_value());
  EXPECT_GT(T->inBps, 0.0);
}

/** @test Keys are independent per device and interface. */
TEST_F(RateCacheTest, KeysIndependent) {
  (void)cache_.update(1, "eth0", 0, 0, 0.0);
  (void)cache_.update(2, "eth0", 0, 0, 0.0);
  (void)cache_.update(1, "eth1", 0, 0, 0.0);

  EXPECT_EQ(cache_.size(), 3U);
  EXPECT_FALSE(cache_.lookup(3, "eth0").has_value());

  cache_.clear();
  EXPECT_EQ(cache_.size(), 0U);
}

/** @test shared() returns one process-wide instance. */
TEST(RateCacheSharedTest, SingleInstance) {
  EXPECT_EQ(RateCache::shared().get(), RateCache::shared().get());
}
