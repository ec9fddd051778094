/*
 * GPU Fan Control — Step policy (implementation)
 * (c) 2025 GpuFanControl contributors
 */

#include "include/StepPolicy.hpp"

#include <cstdlib>

namespace gfc {

int stepSpeedFor(int temp, int prevTemp, int prevSpeed,
                 const std::vector<TemperatureRange>& ranges)
{
    for (const auto& r : ranges) {
        if (temp > r.minTemp && temp <= r.maxTemp) {
            if (std::abs(temp - prevTemp) >= r.hysteresis || prevSpeed != r.fanSpeed) {
                return r.fanSpeed;
            }
            return prevSpeed;
        }
    }
    return prevSpeed;
}

} // namespace gfc
