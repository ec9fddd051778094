/*
 * GPU Fan Control — AUTO/MANUAL mode machine (implementation)
 * (c) 2025 GpuFanControl contributors
 */

#include "include/FanMode.hpp"

namespace gfc {

const char* toString(FanMode m) {
    switch (m) {
        case FanMode::Auto:   return "AUTO";
        case FanMode::Manual: return "MANUAL";
    }
    return "?";
}

FanMode initialFanMode(int temp, const CurveProfile& profile) {
    return temp < profile.floorEndTemp ? FanMode::Auto : FanMode::Manual;
}

FanMode nextFanMode(FanMode current, int temp, const CurveProfile& profile, bool gameModeLatched) {
    if (current == FanMode::Auto) {
        if (temp >= profile.floorEndTemp + profile.floorHysteresis) return FanMode::Manual;
        return FanMode::Auto;
    }
    if (!gameModeLatched && temp <= profile.floorEndTemp - profile.floorHysteresis) {
        return FanMode::Auto;
    }
    return FanMode::Manual;
}

} // namespace gfc
