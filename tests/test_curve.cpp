#include <gtest/gtest.h>

#include "include/Curve.hpp"
#include "include/Errors.hpp"

using namespace gfc;

namespace {

const std::vector<TemperatureRange> kExample{
    {0, 40, 30, 3},
    {40, 60, 40, 3},
    {60, 80, 70, 3},
    {80, 100, 100, 3},
    {100, 200, 100, 0},
};

} // namespace

TEST(CurveProfile, BuildsFloorAndSetpoints) {
    const CurveProfile p = buildCurveProfile(kExample);
    EXPECT_EQ(p.floorEndTemp, 40);
    EXPECT_EQ(p.floorSpeed, 30);
    EXPECT_EQ(p.floorHysteresis, 3);

    ASSERT_EQ(p.setpoints.size(), 4u);
    EXPECT_EQ(p.setpoints[0].temp, 40);
    EXPECT_EQ(p.setpoints[0].speed, 40);
    EXPECT_EQ(p.setpoints[0].hysteresis, 3);
    EXPECT_EQ(p.setpoints[1].temp, 60);
    EXPECT_EQ(p.setpoints[1].speed, 70);
    EXPECT_EQ(p.setpoints[2].temp, 80);
    EXPECT_EQ(p.setpoints[2].speed, 100);
    EXPECT_EQ(p.setpoints[3].temp, 100);
    EXPECT_EQ(p.setpoints[3].speed, 100);
    EXPECT_EQ(p.setpoints[3].hysteresis, 0);

    EXPECT_EQ(describeSetpoints(p), "[(40,40%,h3) (60,70%,h3) (80,100%,h3) (100,100%,h0)]");
}

TEST(CurveProfile, InputOrderDoesNotMatter) {
    const std::vector<TemperatureRange> shuffled{
        kExample[3], kExample[0], kExample[4], kExample[2], kExample[1]};
    EXPECT_EQ(describeSetpoints(buildCurveProfile(shuffled)), describeSetpoints(buildCurveProfile(kExample)));
    EXPECT_EQ(buildCurveProfile(shuffled).floorEndTemp, 40);
}

TEST(CurveProfile, FloorIsLowestMinThenMax) {
    const CurveProfile p = buildCurveProfile({{0, 50, 60, 1}, {0, 40, 20, 2}, {50, 70, 80, 1}});
    EXPECT_EQ(p.floorEndTemp, 40);
    EXPECT_EQ(p.floorSpeed, 20);
    EXPECT_EQ(p.floorHysteresis, 2);
    ASSERT_EQ(p.setpoints.size(), 2u);
    EXPECT_EQ(p.setpoints[0].temp, 0);
    EXPECT_EQ(p.setpoints[1].temp, 50);
}

TEST(CurveProfile, DuplicateTempKeepsLater) {
    const CurveProfile p = buildCurveProfile({{0, 40, 30, 1}, {50, 60, 50, 1}, {50, 70, 80, 2}});
    ASSERT_EQ(p.setpoints.size(), 1u);
    EXPECT_EQ(p.setpoints[0].temp, 50);
    EXPECT_EQ(p.setpoints[0].speed, 80);
    EXPECT_EQ(p.setpoints[0].hysteresis, 2);
}

TEST(CurveProfile, SpeedsAreClamped) {
    const CurveProfile p = buildCurveProfile({{0, 40, -5, 0}, {40, 60, 150, 0}});
    EXPECT_EQ(p.floorSpeed, 0);
    ASSERT_EQ(p.setpoints.size(), 1u);
    EXPECT_EQ(p.setpoints[0].speed, 100);
}

TEST(CurveProfile, EmptyRangesThrow) {
    EXPECT_THROW(buildCurveProfile({}), EmptyRangesError);
}

TEST(CurveSpeed, InterpolatesBetweenSetpoints) {
    const CurveProfile p = buildCurveProfile(kExample);
    const CurveTarget t = curveSpeedAt(50, p);
    EXPECT_EQ(t.speed, 55);
    EXPECT_EQ(t.hysteresis, 3);
    EXPECT_EQ(curveSpeedAt(70, p).speed, 85);
}

TEST(CurveSpeed, FloorBelowFloorEnd) {
    const CurveProfile p = buildCurveProfile(kExample);
    EXPECT_EQ(curveSpeedAt(39, p).speed, 30);
    EXPECT_EQ(curveSpeedAt(-20, p).speed, 30);
    EXPECT_EQ(curveSpeedAt(39, p).hysteresis, 3);
}

TEST(CurveSpeed, CeilingAtAndAboveLastSetpoint) {
    const CurveProfile p = buildCurveProfile(kExample);
    EXPECT_EQ(curveSpeedAt(150, p).speed, 100);
    EXPECT_EQ(curveSpeedAt(150, p).hysteresis, 0);
    EXPECT_EQ(curveSpeedAt(100, p).speed, 100);
}

TEST(CurveSpeed, ExactSetpointUsesItsSpeed) {
    const CurveProfile p = buildCurveProfile(kExample);
    EXPECT_EQ(curveSpeedAt(40, p).speed, 40);
    EXPECT_EQ(curveSpeedAt(60, p).speed, 70);
}

TEST(CurveSpeed, GapBeforeFirstSetpointStaysAtFloor) {
    const CurveProfile p = buildCurveProfile({{0, 40, 30, 3}, {50, 70, 60, 2}});
    EXPECT_EQ(curveSpeedAt(45, p).speed, 30);
    EXPECT_EQ(curveSpeedAt(45, p).hysteresis, 3);
    EXPECT_EQ(curveSpeedAt(50, p).speed, 60);
    EXPECT_EQ(curveSpeedAt(50, p).hysteresis, 2);
}

TEST(CurveSpeed, HalfRoundsAwayFromZero) {
    // 40 + 10/20 * 31 = 55.5
    const CurveProfile p = buildCurveProfile({{0, 40, 30, 3}, {40, 60, 40, 3}, {60, 80, 71, 3}});
    EXPECT_EQ(curveSpeedAt(50, p).speed, 56);
}

TEST(CurveSpeed, NoSetpointsIsConstantFloor) {
    const CurveProfile p = buildCurveProfile({{0, 40, 35, 2}});
    EXPECT_TRUE(p.setpoints.empty());
    EXPECT_EQ(curveSpeedAt(10, p).speed, 35);
    EXPECT_EQ(curveSpeedAt(1000, p).speed, 35);
}

TEST(CurveSpeed, LowerSetpointHysteresisGuardsSegment) {
    const CurveProfile p = buildCurveProfile({{0, 40, 30, 3}, {40, 60, 40, 5}, {60, 80, 70, 1}});
    EXPECT_EQ(curveSpeedAt(50, p).hysteresis, 5);
    EXPECT_EQ(curveSpeedAt(65, p).hysteresis, 1);
}
