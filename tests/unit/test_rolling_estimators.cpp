#include <gtest/gtest.h>
#include "common/ring_buffer.hpp"
#include "strategy/rolling_estimators.hpp"

#include <stdexcept>

using namespace mpmm;

// --- RingBuffer ---

TEST(RingBufferTest, OverwritesOldestWhenFull) {
    RingBuffer<int> buf(3);
    for (int i = 1; i <= 4; ++i) buf.push_back(i);

    EXPECT_TRUE(buf.full());
    EXPECT_EQ(buf.size(), 3u);
    EXPECT_EQ(buf.front(), 2);
    EXPECT_EQ(buf.back(), 4);
    EXPECT_EQ(buf[1], 3);

    buf.pop_front();
    EXPECT_EQ(buf.front(), 3);
    EXPECT_EQ(buf.size(), 2u);

    buf.clear();
    EXPECT_TRUE(buf.empty());
    buf.pop_front();
    EXPECT_TRUE(buf.empty());
}

TEST(RingBufferTest, ZeroCapacityThrows) {
    EXPECT_THROW(RingBuffer<int>(0), std::invalid_argument);
}

// --- VolatilityEstimator ---

TEST(VolatilityEstimatorTest, EmptyUntilTwoSamples) {
    VolatilityEstimator vol(0, 10, 1.0);
    EXPECT_FALSE(vol.update().has_value());
    vol.record(1, 100.0);
    EXPECT_FALSE(vol.update().has_value());
    vol.record(2, 101.0);
    EXPECT_TRUE(vol.update().has_value());
}

TEST(VolatilityEstimatorTest, ConstantPriceIsZero) {
    VolatilityEstimator vol(0, 10, 1.0);
    for (Timestamp ts = 0; ts < 50; ts += 10) vol.record(ts, 102.0);
    auto est = vol.update();
    ASSERT_TRUE(est.has_value());
    EXPECT_EQ(*est, 0.0);
}

TEST(VolatilityEstimatorTest, CooldownDropsCloseSamples) {
    VolatilityEstimator vol(5, 10, 1.0);
    EXPECT_TRUE(vol.record(0, 100.0));
    EXPECT_FALSE(vol.record(5, 101.0));
    EXPECT_TRUE(vol.record(6, 101.0));
    EXPECT_EQ(vol.sample_count(), 2u);
}

TEST(VolatilityEstimatorTest, VarianceOverHorizonScaled) {
    VolatilityEstimator vol(0, 3, 2.0);
    vol.record(1, 100.0);
    vol.record(2, 101.0);
    vol.record(3, 102.0);
    // pvariance {100, 101, 102} = 2/3
    EXPECT_NEAR(*vol.update(), (2.0 / 3.0) / 2.0, 1e-12);

    vol.record(4, 106.0);
    // window is now {101, 102, 106}: pvariance = 14/3
    EXPECT_EQ(vol.sample_count(), 3u);
    EXPECT_NEAR(*vol.update(), (14.0 / 3.0) / 2.0, 1e-12);
    EXPECT_NEAR(*vol.estimate(), 7.0 / 3.0, 1e-12);
}

// --- OrderIntensityEstimator ---

TEST(OrderIntensityEstimatorTest, NeedsMoreThanMinSamples) {
    OrderIntensityEstimator oi(100, 3, 1.0, 1.0, 1000);
    oi.record(0, 1.0);
    oi.record(10, 1.0);
    oi.record(20, 1.0);
    EXPECT_FALSE(oi.update().has_value());
    EXPECT_FALSE(oi.last_window_span().has_value());

    oi.record(30, 1.0);
    auto est = oi.update();
    ASSERT_TRUE(est.has_value());
    EXPECT_NEAR(*est, 4.0 / 30.0, 1e-12);
    EXPECT_EQ(oi.last_window_span().value_or(-1), 30);
}

TEST(OrderIntensityEstimatorTest, EvictsRecordsOutsideWindow) {
    OrderIntensityEstimator oi(10, 0, 1.0, 10.0, 1000);
    oi.record(0, 5.0);
    oi.record(10, 0.3);
    oi.record(20, 0.4);

    EXPECT_NEAR(*oi.update(), 0.7, 1e-12);
    EXPECT_EQ(oi.sample_count(), 2u);
    EXPECT_EQ(oi.last_window_span().value_or(-1), 10);
}

TEST(OrderIntensityEstimatorTest, NormalizedByReferenceSizeAndTime) {
    OrderIntensityEstimator oi(100, 0, 2.0, 10.0, 1000);
    oi.record(0, 2.0);
    oi.record(10, 1.5);
    EXPECT_NEAR(*oi.update(), 1.75, 1e-12);
}

TEST(OrderIntensityEstimatorTest, ZeroSpanKeepsPreviousEstimate) {
    OrderIntensityEstimator oi(100, 0, 1.0, 1.0, 1000);
    oi.record(5, 1.0);
    oi.record(5, 2.0);
    EXPECT_FALSE(oi.update().has_value());
    EXPECT_EQ(oi.last_window_span().value_or(-1), 0);

    oi.record(15, 1.0);
    EXPECT_NEAR(*oi.update(), 0.4, 1e-12);
}

TEST(OrderIntensityEstimatorTest, CapacityBoundsRecords) {
    OrderIntensityEstimator oi(1'000'000, 0, 1.0, 1.0, 3);
    for (Timestamp ts = 0; ts < 10; ++ts) oi.record(ts, 1.0);
    EXPECT_EQ(oi.sample_count(), 3u);
    // records 7, 8, 9
    EXPECT_NEAR(*oi.update(), 3.0 / 2.0, 1e-12);
}
