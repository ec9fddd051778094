/*
 * GPU Fan Control — AUTO/MANUAL mode machine (curve mode only)
 * (c) 2025 GpuFanControl contributors
 */
#pragma once

#include "Curve.hpp"

namespace gfc {

enum class FanMode {
    Auto,    // firmware controls the fan
    Manual   // curve speeds are written explicitly
};

const char* toString(FanMode m);

/* AUTO iff the first sample is below floorEndTemp. */
FanMode initialFanMode(int temp, const CurveProfile& profile);

/*
 * Deadband of width floorHysteresis around floorEndTemp:
 *   AUTO   -> MANUAL when temp >= floorEndTemp + floorHysteresis
 *   MANUAL -> AUTO   when temp <= floorEndTemp - floorHysteresis
 * With gameModeLatched the MANUAL -> AUTO edge is suppressed.
 */
FanMode nextFanMode(FanMode current, int temp, const CurveProfile& profile, bool gameModeLatched);

} // namespace gfc
