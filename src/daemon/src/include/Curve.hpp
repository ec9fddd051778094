/*
 * GPU Fan Control — Curve profile (header)
 * - Floor + ordered setpoints + ceiling, built once from the range table
 * (c) 2025 GpuFanControl contributors
 */
#pragma once

#include <string>
#include <vector>

#include "RangeTable.hpp"

namespace gfc {

struct CurvePoint {
    int temp {0};
    int speed {0};       // clamped to [0,100]
    int hysteresis {0};
};

/*
 * temps < floorEndTemp run at floorSpeed; setpoints are strictly increasing
 * in temp and may be empty (constant floor speed).
 */
struct CurveProfile {
    int floorEndTemp {0};
    int floorSpeed {0};
    int floorHysteresis {0};
    std::vector<CurvePoint> setpoints;
};

/* Speed chosen by the curve together with the hysteresis that guards it. */
struct CurveTarget {
    int speed {0};
    int hysteresis {0};
};

/*
 * Lowest (minTemp, maxTemp) range becomes the floor; every other range is a
 * setpoint at its minTemp. Equal-temp setpoints keep the later one.
 * Throws EmptyRangesError when `ranges` is empty.
 */
CurveProfile buildCurveProfile(const std::vector<TemperatureRange>& ranges);

/*
 * Floor below floorEndTemp and in the gap before the first setpoint,
 * last setpoint at and above its temp, linear interpolation (rounded half
 * away from zero) in between using the lower setpoint's hysteresis.
 */
CurveTarget curveSpeedAt(int temp, const CurveProfile& profile);

/* Human-readable "[(40,40%,h3) (60,70%,h3)]" for logs. */
std::string describeSetpoints(const CurveProfile& profile);

int clampPercent(int v);

} // namespace gfc
