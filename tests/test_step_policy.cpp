#include <gtest/gtest.h>

#include "include/StepPolicy.hpp"

using gfc::TemperatureRange;
using gfc::stepSpeedFor;

namespace {

const std::vector<TemperatureRange> kRanges{
    {0, 40, 30, 3},
    {40, 60, 40, 3},
    {60, 80, 70, 3},
};

} // namespace

TEST(StepPolicy, ReturnsBandSpeedWhenSpeedDiffers) {
    EXPECT_EQ(stepSpeedFor(50, 50, 30, kRanges), 40);
    EXPECT_EQ(stepSpeedFor(70, 69, 40, kRanges), 70);
}

TEST(StepPolicy, LowerBoundIsExclusive) {
    // 40 belongs to (0,40], not (40,60]
    EXPECT_EQ(stepSpeedFor(40, 40, 99, kRanges), 30);
    EXPECT_EQ(stepSpeedFor(41, 40, 99, kRanges), 40);
}

TEST(StepPolicy, HoldsSpeedInsideBand) {
    EXPECT_EQ(stepSpeedFor(51, 50, 40, kRanges), 40);
}

TEST(StepPolicy, NoMatchKeepsPreviousSpeed) {
    EXPECT_EQ(stepSpeedFor(0, 10, 55, kRanges), 55);
    EXPECT_EQ(stepSpeedFor(-5, 10, 55, kRanges), 55);
    EXPECT_EQ(stepSpeedFor(81, 79, 55, kRanges), 55);
    EXPECT_EQ(stepSpeedFor(50, 50, 55, {}), 55);
}

TEST(StepPolicy, FirstMatchWinsOnOverlap) {
    const std::vector<TemperatureRange> overlapping{{0, 100, 20, 0}, {50, 60, 90, 0}};
    EXPECT_EQ(stepSpeedFor(55, 55, 0, overlapping), 20);
}

TEST(StepPolicy, InvertedBandNeverMatches) {
    const std::vector<TemperatureRange> inverted{{60, 40, 80, 0}};
    EXPECT_EQ(stepSpeedFor(50, 50, 10, inverted), 10);
}

TEST(StepPolicy, IsDeterministic) {
    for (int t = -10; t <= 100; ++t) {
        EXPECT_EQ(stepSpeedFor(t, t - 2, 35, kRanges), stepSpeedFor(t, t - 2, 35, kRanges));
    }
}
