/*
 * GPU Fan Control — Curve profile (implementation)
 * (c) 2025 GpuFanControl contributors
 */

#include "include/Curve.hpp"
#include "include/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace gfc {

int clampPercent(int v) {
    return v < 0 ? 0 : (v > 100 ? 100 : v);
}

CurveProfile buildCurveProfile(const std::vector<TemperatureRange>& ranges) {
    if (ranges.empty()) {
        throw EmptyRangesError("no temperature_ranges provided");
    }

    std::vector<TemperatureRange> rs(ranges);
    std::stable_sort(rs.begin(), rs.end(), [](const TemperatureRange& a, const TemperatureRange& b) {
        if (a.minTemp == b.minTemp) return a.maxTemp < b.maxTemp;
        return a.minTemp < b.minTemp;
    });

    CurveProfile prof;
    const TemperatureRange& floor = rs.front();
    prof.floorEndTemp    = floor.maxTemp;
    prof.floorSpeed      = clampPercent(floor.fanSpeed);
    prof.floorHysteresis = floor.hysteresis;

    std::vector<CurvePoint> pts;
    pts.reserve(rs.size() - 1);
    for (size_t i = 1; i < rs.size(); ++i) {
        pts.push_back(CurvePoint{rs[i].minTemp, clampPercent(rs[i].fanSpeed), rs[i].hysteresis});
    }

    std::stable_sort(pts.begin(), pts.end(), [](const CurvePoint& a, const CurvePoint& b) {
        return a.temp < b.temp;
    });

    // Dedupe by temp, last wins
    prof.setpoints.reserve(pts.size());
    for (const auto& p : pts) {
        if (!prof.setpoints.empty() && prof.setpoints.back().temp == p.temp) {
            prof.setpoints.back() = p;
            continue;
        }
        prof.setpoints.push_back(p);
    }
    return prof;
}

CurveTarget curveSpeedAt(int temp, const CurveProfile& profile) {
    const CurveTarget floorTarget{profile.floorSpeed, profile.floorHysteresis};

    if (temp < profile.floorEndTemp) return floorTarget;

    const auto& pts = profile.setpoints;
    if (pts.empty() || temp < pts.front().temp) return floorTarget;

    const CurvePoint& last = pts.back();
    if (temp >= last.temp) return CurveTarget{last.speed, last.hysteresis};

    for (size_t i = 1; i < pts.size(); ++i) {
        const CurvePoint& a = pts[i - 1];
        const CurvePoint& b = pts[i];
        if (temp >= a.temp && temp < b.temp) {
            const int den = b.temp - a.temp;
            if (den <= 0) return CurveTarget{a.speed, a.hysteresis};
            const double u = static_cast<double>(temp - a.temp) / static_cast<double>(den);
            const double y = static_cast<double>(a.speed) +
                             u * static_cast<double>(b.speed - a.speed);
            return CurveTarget{clampPercent(static_cast<int>(std::lround(y))), a.hysteresis};
        }
    }
    return CurveTarget{last.speed, last.hysteresis};
}

std::string describeSetpoints(const CurveProfile& profile) {
    std::ostringstream os;
    os << '[';
    for (size_t i = 0; i < profile.setpoints.size(); ++i) {
        const auto& p = profile.setpoints[i];
        if (i) os << ' ';
        os << '(' << p.temp << ',' << p.speed << "%,h" << p.hysteresis << ')';
    }
    os << ']';
    return os.str();
}

} // namespace gfc
