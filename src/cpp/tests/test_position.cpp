#include <gtest/gtest.h>

#include <chrono>
#include <cmath>

#include "nexstar/constants.hpp"
#include "nexstar/errors.hpp"
#include "nexstar/position.hpp"

namespace nexstar {
namespace {

PositionSample sample_at(double seconds, double alt, double az,
                         double ra = 0.0, double dec = 0.0) {
    PositionSample s;
    s.timestamp = Clock::time_point{} + std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(seconds));
    s.monotonic = MonotonicClock::time_point{} +
        std::chrono::duration_cast<MonotonicClock::duration>(
            std::chrono::duration<double>(seconds));
    s.altitude = alt;
    s.azimuth = az;
    s.ra_hours = ra;
    s.dec_degrees = dec;
    return s;
}

// ---- Angular separation ----

TEST(SeparationTest, ZeroForSamePoint) {
    EXPECT_NEAR(angular_separation(123.0, 45.0, 123.0, 45.0), 0.0, 1e-12);
}

TEST(SeparationTest, AlongMeridian) {
    EXPECT_NEAR(angular_separation(10.0, 20.0, 10.0, 35.0), 15.0, 1e-9);
}

TEST(SeparationTest, AlongEquator) {
    EXPECT_NEAR(angular_separation(0.0, 0.0, 90.0, 0.0), 90.0, 1e-9);
}

TEST(SeparationTest, AcrossZeroAzimuth) {
    EXPECT_NEAR(angular_separation(359.0, 0.0, 1.0, 0.0), 2.0, 1e-9);
}

TEST(SeparationTest, PoleIsAzimuthIndependent) {
    EXPECT_NEAR(angular_separation(0.0, 90.0, 180.0, 90.0), 0.0, 1e-6);
}

TEST(SeparationTest, EquatorialUsesHours) {
    PositionSample a = sample_at(0.0, 0.0, 0.0, 1.0, 0.0);
    PositionSample b = sample_at(0.0, 0.0, 0.0, 2.0, 0.0);
    EXPECT_NEAR(equatorial_separation(a, b), 15.0, 1e-9);
}

// ---- wrap_delta ----

TEST(WrapDeltaTest, FoldsIntoHalfPeriod) {
    EXPECT_DOUBLE_EQ(wrap_delta(10.0, 360.0), 10.0);
    EXPECT_DOUBLE_EQ(wrap_delta(350.0, 360.0), -10.0);
    EXPECT_DOUBLE_EQ(wrap_delta(-350.0, 360.0), 10.0);
    EXPECT_DOUBLE_EQ(wrap_delta(23.5, 24.0), -0.5);
}

// ---- Velocity ----

TEST(VelocityTest, AltitudeRate) {
    VelocityVector v = compute_velocity(sample_at(0.0, 10.0, 100.0),
                                        sample_at(2.0, 12.0, 100.0));
    EXPECT_NEAR(v.alt_per_sec, 1.0, 1e-9);
    EXPECT_NEAR(v.az_per_sec, 0.0, 1e-9);
    EXPECT_NEAR(v.total_deg_per_sec, 1.0, 1e-9);
}

TEST(VelocityTest, AzimuthWrapsAtNorth) {
    VelocityVector v = compute_velocity(sample_at(0.0, 0.0, 359.0),
                                        sample_at(1.0, 0.0, 1.0));
    EXPECT_NEAR(v.az_per_sec, 2.0, 1e-9);
    EXPECT_NEAR(v.total_deg_per_sec, 2.0, 1e-9);
}

TEST(VelocityTest, RaWrapsAtMidnight) {
    VelocityVector v = compute_velocity(sample_at(0.0, 0.0, 0.0, 23.9, 0.0),
                                        sample_at(1.0, 0.0, 0.0, 0.1, 0.0));
    EXPECT_NEAR(v.ra_per_sec, 0.2, 1e-9);
}

TEST(VelocityTest, ZeroWhenTimeDoesNotAdvance) {
    VelocityVector v = compute_velocity(sample_at(5.0, 0.0, 0.0),
                                        sample_at(5.0, 40.0, 40.0));
    EXPECT_DOUBLE_EQ(v.total_deg_per_sec, 0.0);
    EXPECT_DOUBLE_EQ(v.alt_per_sec, 0.0);
}

TEST(VelocityTest, WallClockStepDoesNotAffectRate) {
    PositionSample prev = sample_at(10.0, 10.0, 100.0);
    PositionSample curr = sample_at(12.0, 12.0, 100.0);
    // Wall clock set back an hour between the two polls.
    curr.timestamp = prev.timestamp - std::chrono::hours(1);

    VelocityVector v = compute_velocity(prev, curr);
    EXPECT_NEAR(v.alt_per_sec, 1.0, 1e-9);
    EXPECT_NEAR(v.total_deg_per_sec, 1.0, 1e-9);
}

// ---- PositionHistory ----

TEST(PositionHistoryTest, ZeroCapacityRejected) {
    EXPECT_THROW(PositionHistory(0), InvalidParameterError);
}

TEST(PositionHistoryTest, DefaultCapacity) {
    PositionHistory history;
    EXPECT_EQ(history.capacity(), HISTORY_CAPACITY);
    EXPECT_TRUE(history.empty());
}

TEST(PositionHistoryTest, KeepsNewestWhenFull) {
    PositionHistory history(HISTORY_CAPACITY);
    for (int i = 0; i < 1500; ++i) {
        history.append(sample_at(i, i * 0.01, 0.0));
    }
    ASSERT_EQ(history.size(), HISTORY_CAPACITY);

    auto samples = history.snapshot();
    ASSERT_EQ(samples.size(), HISTORY_CAPACITY);
    EXPECT_NEAR(samples.front().altitude, 500 * 0.01, 1e-9);
    EXPECT_NEAR(samples.back().altitude, 1499 * 0.01, 1e-9);
    for (std::size_t i = 1; i < samples.size(); ++i) {
        EXPECT_LT(samples[i - 1].timestamp, samples[i].timestamp);
    }
}

TEST(PositionHistoryTest, LimitKeepsNewest) {
    PositionHistory history(10);
    for (int i = 0; i < 10; ++i) {
        history.append(sample_at(i, i, 0.0));
    }
    auto samples = history.snapshot(3);
    ASSERT_EQ(samples.size(), 3u);
    EXPECT_DOUBLE_EQ(samples[0].altitude, 7.0);
    EXPECT_DOUBLE_EQ(samples[2].altitude, 9.0);
}

TEST(PositionHistoryTest, SinceFiltersThenLimit) {
    PositionHistory history(10);
    for (int i = 0; i < 10; ++i) {
        history.append(sample_at(i, i, 0.0));
    }
    auto since = sample_at(4.0, 0.0, 0.0).timestamp;

    auto all_since = history.snapshot(std::nullopt, since);
    ASSERT_EQ(all_since.size(), 6u);
    EXPECT_DOUBLE_EQ(all_since.front().altitude, 4.0);

    auto limited = history.snapshot(2, since);
    ASSERT_EQ(limited.size(), 2u);
    EXPECT_DOUBLE_EQ(limited.front().altitude, 8.0);
}

TEST(PositionHistoryTest, Clear) {
    PositionHistory history(4);
    history.append(sample_at(0.0, 1.0, 1.0));
    history.clear();
    EXPECT_TRUE(history.empty());
    EXPECT_TRUE(history.snapshot().empty());
}

} // namespace
} // namespace nexstar
