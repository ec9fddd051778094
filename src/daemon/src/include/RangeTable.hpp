/*
 * GPU Fan Control — Range table (header)
 * - Temperature bands with speed and hysteresis; input to both policies
 * (c) 2025 GpuFanControl contributors
 */
#pragma once

#include <vector>
#include <nlohmann/json.hpp>

namespace gfc {

class Logger;

/* One configured band, Celsius / percent. minTemp < maxTemp is expected but not enforced. */
struct TemperatureRange {
    int minTemp {0};
    int maxTemp {0};
    int fanSpeed {0};
    int hysteresis {0};
};

// JSON: {"min_temperature", "max_temperature", "fan_speed", "hysteresis"}
// Each key must be an integer; a null or absent key leaves the field unchanged.
void to_json(nlohmann::json& j, const TemperatureRange& r);
void from_json(const nlohmann::json& j, TemperatureRange& r);

/*
 * Reads j[key] into out when present and not null. Fractional numbers, other
 * types and values outside int range throw ConfigError.
 */
void readIntField(const nlohmann::json& j, const char* key, int& out);

/*
 * Boundary checks only. An empty table is a warning; inverted bands and
 * out-of-range speeds are reported but kept as configured.
 * Returns the number of warnings issued.
 */
int validateRanges(const std::vector<TemperatureRange>& ranges, Logger& log);

} // namespace gfc
