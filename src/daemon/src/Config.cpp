/*
 * GPU Fan Control — Configuration (implementation)
 * (c) 2025 GpuFanControl contributors
 *
 * Goals:
 *  - config.json is the source of truth for control behavior; keys are read
 *    only when present, missing numbers stay 0 / defaults.
 *  - Process options layer: Defaults -> ENV -> command line.
 */

#include "include/Config.hpp"
#include "include/Errors.hpp"
#include "include/GameMode.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <stdexcept>
#include <string>

using nlohmann::json;

namespace gfc {

/* ----------------------------------------------------------------------------
 * json (de)serialization
 * ----------------------------------------------------------------------------*/

void to_json(json& j, const FanConfig& c) {
    j = json{
        {"time_to_update", c.timeToUpdate},
        {"temperature_ranges", c.temperatureRanges},
        {"curve", c.curve}
    };
}

void from_json(const json& j, FanConfig& c) {
    readIntField(j, "time_to_update", c.timeToUpdate);
    if (j.contains("temperature_ranges")) {
        const json& ranges = j.at("temperature_ranges");
        if (ranges.is_null()) c.temperatureRanges.clear();
        else ranges.get_to(c.temperatureRanges);
    }
    if (j.contains("curve") && !j.at("curve").is_null()) j.at("curve").get_to(c.curve);
}

FanConfig parseFanConfig(const json& j, const std::string& origin) {
    if (!j.is_object()) {
        throw ConfigError("config " + origin + ": top-level value must be an object");
    }
    FanConfig c;
    c.timeToUpdate = 0;
    try {
        from_json(j, c);
    } catch (const json::exception& ex) {
        throw ConfigError("config " + origin + ": " + ex.what());
    } catch (const ConfigError& ex) {
        throw ConfigError("config " + origin + ": " + ex.what());
    }
    return c;
}

void normalizeFanConfig(FanConfig& c, Logger& log) {
    if (c.timeToUpdate <= 0) {
        LOG_WARN(log, "time_to_update (%d) is invalid, defaulting to %d seconds.",
                 c.timeToUpdate, kDefaultTimeToUpdateSec);
        c.timeToUpdate = kDefaultTimeToUpdateSec;
    }
    (void)validateRanges(c.temperatureRanges, log);
}

FanConfig loadFanConfig(const std::string& path, Logger& log) {
    json j;
    try {
        j = util::read_json_file(path);
    } catch (const std::exception& ex) {
        throw ConfigError(std::string("failed to load config ") + path + ": " + ex.what());
    }

    FanConfig c = parseFanConfig(j, path);
    normalizeFanConfig(c, log);
    LOG_INFO(log, "Configuration loaded and validated (%s: interval=%ds ranges=%zu curve=%s).",
             path.c_str(), c.timeToUpdate, c.temperatureRanges.size(), c.curve ? "true" : "false");
    return c;
}

/* ----------------------------------------------------------------------------
 * Defaults + ENV fallbacks
 * ----------------------------------------------------------------------------*/

DaemonOptions defaultDaemonOptions() {
    DaemonOptions o;
    o.configPath   = Config::defaultConfigPath();
    o.logPath      = Config::defaultLogfilePath();
    o.gameModePath = Config::defaultGameModePath();

    if (auto v = util::getenv_str("GFC_CONFIG");        v && !v->empty()) o.configPath = *v;
    if (auto v = util::getenv_str("GFC_LOGFILE");       v && !v->empty()) o.logPath = *v;
    if (auto v = util::getenv_str("GFC_GAMEMODE_FILE"); v && !v->empty()) o.gameModePath = *v;
    return o;
}

void expandPaths(DaemonOptions& o) {
    o.configPath   = util::expandUserPath(o.configPath);
    o.logPath      = util::expandUserPath(o.logPath);
    o.gameModePath = util::expandUserPath(o.gameModePath);
}

/* ----------------------------------------------------------------------------
 * Namespace-style helpers
 * ----------------------------------------------------------------------------*/
namespace Config {
std::string defaultConfigPath()   { return "config.json"; }
std::string defaultLogfilePath()  { return "/var/log/gpufanctl.log"; }
std::string defaultGameModePath() {
    if (auto v = util::getenv_str("GFC_GAMEMODE_FILE"); v && !v->empty()) return *v;
    return GameModeFlag::defaultPath();
}
} // namespace Config

} // namespace gfc
