/*
 * GPU Fan Control — Configuration (public interface)
 * (c) 2025 GpuFanControl contributors
 *
 * NOTE:
 *  - FanConfig is the JSON control file (config.json).
 *  - DaemonOptions are process settings: defaults -> ENV -> command line.
 */
#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "RangeTable.hpp"

namespace gfc {

class Logger;

inline constexpr int kDefaultTimeToUpdateSec = 5;

/* ----------------------------------------------------------------------------
 * Control configuration model
 * ----------------------------------------------------------------------------*/
struct FanConfig {
    int                           timeToUpdate{kDefaultTimeToUpdateSec};  // seconds between ticks
    std::vector<TemperatureRange> temperatureRanges;
    bool                          curve{false};                           // false = step policy
};

// JSON (de)serialization
void to_json(nlohmann::json& j, const FanConfig& c);
void from_json(const nlohmann::json& j, FanConfig& c);

/* Parse a JSON document; type errors become ConfigError. No normalization. */
FanConfig parseFanConfig(const nlohmann::json& j, const std::string& origin);

/*
 * Read, parse and normalize a config file (throws ConfigError).
 *  - time_to_update <= 0 is replaced by 5 seconds with a warning.
 *  - an empty or odd range table only produces warnings.
 */
FanConfig loadFanConfig(const std::string& path, Logger& log);

/* Apply the time_to_update default and range warnings in place. */
void normalizeFanConfig(FanConfig& c, Logger& log);

/* ----------------------------------------------------------------------------
 * Daemon process options
 * ----------------------------------------------------------------------------*/
struct DaemonOptions {
    std::string configPath;
    std::string logPath;
    std::string gameModePath;
    bool        curve{false};   // force curve mode regardless of config
    bool        debug{false};
};

/* Defaults, then GFC_CONFIG / GFC_LOGFILE / GFC_GAMEMODE_FILE as fallbacks. */
DaemonOptions defaultDaemonOptions();

/* Expand "~", "$VAR", "${VAR}" in every path field. */
void expandPaths(DaemonOptions& o);

namespace Config {
    std::string defaultConfigPath();
    std::string defaultLogfilePath();
    std::string defaultGameModePath();
}

} // namespace gfc
