/*
 * GPU Fan Control — Step policy
 * (c) 2025 GpuFanControl contributors
 */
#pragma once

#include <vector>

#include "RangeTable.hpp"

namespace gfc {

/*
 * Pure step lookup. The first range with minTemp < temp <= maxTemp wins.
 * Its speed is returned when |temp - prevTemp| >= hysteresis or prevSpeed
 * differs from it; otherwise, and when no range matches, prevSpeed is kept.
 */
int stepSpeedFor(int temp, int prevTemp, int prevSpeed,
                 const std::vector<TemperatureRange>& ranges);

} // namespace gfc
