/*
 * GPU Fan Control — Range table (implementation)
 * (c) 2025 GpuFanControl contributors
 */

#include "include/RangeTable.hpp"
#include "include/Errors.hpp"
#include "include/Log.hpp"

#include <cstdint>
#include <limits>
#include <string>

using nlohmann::json;

namespace gfc {

void to_json(json& j, const TemperatureRange& r) {
    j = json{
        {"min_temperature", r.minTemp},
        {"max_temperature", r.maxTemp},
        {"fan_speed", r.fanSpeed},
        {"hysteresis", r.hysteresis}
    };
}

void readIntField(const json& j, const char* key, int& out) {
    if (!j.contains(key)) return;
    const json& v = j.at(key);
    if (v.is_null()) return;
    if (!v.is_number_integer()) {
        throw ConfigError(std::string(key) + ": expected an integer, got " + v.dump());
    }

    constexpr std::int64_t lo = std::numeric_limits<int>::min();
    constexpr std::int64_t hi = std::numeric_limits<int>::max();
    const bool fits = v.is_number_unsigned()
        ? v.get<std::uint64_t>() <= static_cast<std::uint64_t>(hi)
        : (v.get<std::int64_t>() >= lo && v.get<std::int64_t>() <= hi);
    if (!fits) {
        throw ConfigError(std::string(key) + ": " + v.dump() + " is out of range");
    }
    out = v.get<int>();
}

void from_json(const json& j, TemperatureRange& r) {
    if (j.is_null()) return;
    if (!j.is_object()) {
        throw ConfigError("temperature range must be an object, got " + j.dump());
    }
    readIntField(j, "min_temperature", r.minTemp);
    readIntField(j, "max_temperature", r.maxTemp);
    readIntField(j, "fan_speed",       r.fanSpeed);
    readIntField(j, "hysteresis",      r.hysteresis);
}

int validateRanges(const std::vector<TemperatureRange>& ranges, Logger& log) {
    if (ranges.empty()) {
        LOG_WARN(log, "temperature_ranges is empty.");
        return 1;
    }

    int warnings = 0;
    for (size_t i = 0; i < ranges.size(); ++i) {
        const auto& r = ranges[i];
        if (r.minTemp >= r.maxTemp) {
            LOG_WARN(log, "temperature_ranges[%zu]: min_temperature %d >= max_temperature %d; band can never match in step mode",
                     i, r.minTemp, r.maxTemp);
            ++warnings;
        }
        if (r.fanSpeed < 0 || r.fanSpeed > 100) {
            LOG_WARN(log, "temperature_ranges[%zu]: fan_speed %d outside 0..100", i, r.fanSpeed);
            ++warnings;
        }
        if (r.hysteresis < 0) {
            LOG_WARN(log, "temperature_ranges[%zu]: negative hysteresis %d", i, r.hysteresis);
            ++warnings;
        }
    }
    LOG_DEBUG(log, "range table: %zu band(s), %d warning(s)", ranges.size(), warnings);
    return warnings;
}

} // namespace gfc
