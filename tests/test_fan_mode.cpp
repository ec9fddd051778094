#include <gtest/gtest.h>

#include "include/FanMode.hpp"

using namespace gfc;

namespace {

CurveProfile floorAt40() {
    CurveProfile p;
    p.floorEndTemp = 40;
    p.floorSpeed = 30;
    p.floorHysteresis = 3;
    return p;
}

} // namespace

TEST(FanMode, InitialModeFollowsFloor) {
    const CurveProfile p = floorAt40();
    EXPECT_EQ(initialFanMode(20, p), FanMode::Auto);
    EXPECT_EQ(initialFanMode(39, p), FanMode::Auto);
    EXPECT_EQ(initialFanMode(40, p), FanMode::Manual);
}

TEST(FanMode, AutoLeavesOnlyAboveDeadband) {
    const CurveProfile p = floorAt40();
    FanMode m = initialFanMode(20, p);
    ASSERT_EQ(m, FanMode::Auto);

    m = nextFanMode(m, 42, p, false);
    EXPECT_EQ(m, FanMode::Auto);
    m = nextFanMode(m, 43, p, false);
    EXPECT_EQ(m, FanMode::Manual);
}

TEST(FanMode, ManualReturnsOnlyBelowDeadband) {
    const CurveProfile p = floorAt40();
    FanMode m = FanMode::Manual;

    m = nextFanMode(m, 38, p, false);
    EXPECT_EQ(m, FanMode::Manual);
    m = nextFanMode(m, 37, p, false);
    EXPECT_EQ(m, FanMode::Auto);
}

TEST(FanMode, GameModeKeepsManual) {
    const CurveProfile p = floorAt40();
    EXPECT_EQ(nextFanMode(FanMode::Manual, 10, p, true), FanMode::Manual);
    EXPECT_EQ(nextFanMode(FanMode::Manual, 10, p, false), FanMode::Auto);
}

TEST(FanMode, GameModeDoesNotBlockManualEntry) {
    const CurveProfile p = floorAt40();
    EXPECT_EQ(nextFanMode(FanMode::Auto, 43, p, true), FanMode::Manual);
    EXPECT_EQ(nextFanMode(FanMode::Auto, 30, p, true), FanMode::Auto);
}

TEST(FanMode, ZeroWidthDeadband) {
    CurveProfile p = floorAt40();
    p.floorHysteresis = 0;
    EXPECT_EQ(nextFanMode(FanMode::Auto, 40, p, false), FanMode::Manual);
    EXPECT_EQ(nextFanMode(FanMode::Manual, 40, p, false), FanMode::Auto);
}

TEST(FanMode, Names) {
    EXPECT_STREQ(toString(FanMode::Auto), "AUTO");
    EXPECT_STREQ(toString(FanMode::Manual), "MANUAL");
}
