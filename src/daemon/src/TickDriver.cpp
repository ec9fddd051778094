/*
 * GPU Fan Control — Tick driver (implementation)
 * (c) 2025 GpuFanControl contributors
 *
 * Notes:
 * - One temperature read per device per tick, shared by all its fans.
 * - A failed call skips that fan (or the whole device for the temperature read)
 *   for the current tick only; history is updated on successful writes only.
 * - Step and curve writes both force the MANUAL policy before the speed write.
 */

#include "include/TickDriver.hpp"
#include "include/Config.hpp"
#include "include/Errors.hpp"
#include "include/GameMode.hpp"
#include "include/Log.hpp"
#include "include/StepPolicy.hpp"
#include "include/Utils.hpp"

#include <cstdlib>
#include <string>
#include <utility>

namespace gfc {

const char* toString(ControlPolicy p) {
    return p == ControlPolicy::Curve ? "curve" : "step";
}

static std::string speedList(const std::vector<int>& speeds) {
    std::vector<std::string> parts;
    parts.reserve(speeds.size());
    for (int s : speeds) parts.push_back(std::to_string(s));
    return "[" + util::join(parts, " ") + "]";
}

TickDriver::TickDriver(FanBackend& backend, Logger& log, const GameModeSource* gameMode)
    : backend_(backend), log_(log), gameMode_(gameMode) {}

void TickDriver::useStepPolicy(std::vector<TemperatureRange> ranges) {
    ranges_ = std::move(ranges);
    profile_ = CurveProfile{};
    policy_ = ControlPolicy::Step;
    LOG_INFO(log_, "Step mode enabled (%zu temperature ranges).", ranges_.size());
    resetModes();
}

void TickDriver::useCurvePolicy(const std::vector<TemperatureRange>& ranges) {
    CurveProfile prof = buildCurveProfile(ranges);   // throws before any state changes
    ranges_ = ranges;
    profile_ = std::move(prof);
    policy_ = ControlPolicy::Curve;
    LOG_INFO(log_, "Curve mode enabled: floor(<%d°C)=AUTO, setpoints=%s (floor hyst=%d°C)",
             profile_.floorEndTemp, describeSetpoints(profile_).c_str(), profile_.floorHysteresis);
    resetModes();
}

ControlPolicy TickDriver::configure(const FanConfig& cfg) {
    if (cfg.curve) {
        try {
            useCurvePolicy(cfg.temperatureRanges);
            return policy_;
        } catch (const EmptyRangesError& ex) {
            LOG_WARN(log_, "curve mode requested but invalid curve profile: %s. Falling back to step mode.",
                     ex.what());
        }
    }
    useStepPolicy(cfg.temperatureRanges);
    return policy_;
}

void TickDriver::resetModes() {
    for (auto& dev : devices_) {
        dev.mode = (policy_ == ControlPolicy::Curve) ? initialFanMode(dev.lastKnownTemp, profile_)
                                                     : FanMode::Manual;
    }
}

bool TickDriver::hasControllableFans() const {
    for (const auto& dev : devices_) {
        if (dev.fanCount > 0) return true;
    }
    return false;
}

/* ----------------------------------------------------------------------------
 * Device enumeration
 * ----------------------------------------------------------------------------*/

void TickDriver::initialize() {
    devices_.clear();

    HwValue<int> count = backend_.deviceCount();
    if (!count.ok()) {
        throw HardwareError(count.status.message);
    }
    if (count.value <= 0) {
        throw HardwareError("no NVIDIA devices found");
    }
    LOG_INFO(log_, "Found %d NVIDIA device(s).", count.value);

    int initialized = 0;
    for (int i = 0; i < count.value; ++i) {
        DeviceState dev;
        dev.index = i;

        HwValue<int> fans = backend_.fanCount(i);
        if (!fans.ok()) {
            LOG_WARN(log_, "Unable to get fan count for device %d: %s. Assuming 0 fans or fan control not supported.",
                     i, fans.status.message.c_str());
            devices_.push_back(std::move(dev));
            continue;
        }
        ++initialized;

        if (fans.value <= 0) {
            LOG_INFO(log_, "Device %d reports %d controllable fans. Skipping fan initialization.", i, fans.value);
            devices_.push_back(std::move(dev));
            continue;
        }

        dev.fanCount = fans.value;
        dev.fanSpeeds.assign(static_cast<size_t>(dev.fanCount), 0);
        LOG_INFO(log_, "Device %d has %d controllable fan(s). Initializing state.", i, dev.fanCount);

        HwValue<int> temp = backend_.temperature(i);
        if (temp.ok()) {
            dev.lastKnownTemp = temp.value;
        } else {
            LOG_WARN(log_, "Failed to get initial temperature for device %d: %s. Using 0.",
                     i, temp.status.message.c_str());
        }
        dev.lastChangeTemp = dev.lastKnownTemp;

        for (int f = 0; f < dev.fanCount; ++f) {
            HwValue<int> speed = backend_.fanSpeed(i, f);
            if (speed.ok()) {
                dev.fanSpeeds[static_cast<size_t>(f)] = speed.value;
            } else {
                LOG_WARN(log_, "Failed to get initial speed for device %d Fan %d: %s. Using 0.",
                         i, f, speed.status.message.c_str());
            }
        }

        LOG_INFO(log_, "Initial state for device %d: Temp=%d°C, Fan Speeds=%s%%",
                 i, dev.lastKnownTemp, speedList(dev.fanSpeeds).c_str());
        devices_.push_back(std::move(dev));
    }

    if (initialized == 0) {
        throw HardwareError("found " + std::to_string(count.value) +
                            " devices, but failed to initialize any for monitoring/control");
    }

    resetModes();
    LOG_INFO(log_, "Device initialization complete. Monitoring %d devices.", initialized);
}

/* ----------------------------------------------------------------------------
 * Tick
 * ----------------------------------------------------------------------------*/

void TickDriver::tick() {
    // one latch sample per tick, shared by all devices
    const bool latched = policy_ == ControlPolicy::Curve &&
                         gameMode_ != nullptr && gameMode_->active();
    for (auto& dev : devices_) {
        if (dev.fanCount <= 0) continue;
        tickDevice(dev, latched);
    }
}

void TickDriver::tickDevice(DeviceState& dev, bool latched) {
    HwValue<int> temp = backend_.temperature(dev.index);
    if (!temp.ok()) {
        LOG_ERROR(log_, "Unable to get temperature for device %d: %s. Skipping cycle for this device.",
                  dev.index, temp.status.message.c_str());
        return;
    }

    if (policy_ == ControlPolicy::Curve) {
        tickCurve(dev, temp.value, latched);
    } else {
        tickStep(dev, temp.value);
    }
}

bool TickDriver::writeManualSpeed(const DeviceState& dev, int fan, int speed) {
    HwStatus st = backend_.setFanPolicy(dev.index, fan, FanPolicy::Manual);
    if (st.notSupported()) {
        LOG_WARN(log_, "MANUAL fan policy not supported for GPU %d Fan %d. Cannot set speed.", dev.index, fan);
        return false;
    }
    if (!st.ok()) {
        LOG_ERROR(log_, "Unable to set MANUAL fan policy for GPU %d Fan %d: %s",
                  dev.index, fan, st.message.c_str());
        return false;
    }

    st = backend_.setFanSpeed(dev.index, fan, speed);
    if (!st.ok()) {
        LOG_ERROR(log_, "Unable to set fan speed for GPU %d Fan %d to %d%%: %s",
                  dev.index, fan, speed, st.message.c_str());
        return false;
    }
    return true;
}

void TickDriver::tickCurve(DeviceState& dev, int temp, bool latched) {
    const FanMode next = nextFanMode(dev.mode, temp, profile_, latched);

    if (next != dev.mode) {
        LOG_INFO(log_, "GPU %d crossing %s floor: switching to %s control (temp=%d°C)",
                 dev.index, next == FanMode::Manual ? "above" : "below", toString(next), temp);
        dev.mode = next;
    } else if (latched && next == FanMode::Manual &&
               nextFanMode(dev.mode, temp, profile_, false) == FanMode::Auto) {
        LOG_DEBUG(log_, "GPU %d below floor (temp=%d°C) but game mode is active: staying MANUAL",
                  dev.index, temp);
    }

    if (dev.mode == FanMode::Auto) {
        for (int f = 0; f < dev.fanCount; ++f) {
            HwStatus st = backend_.setFanPolicy(dev.index, f, FanPolicy::Auto);
            if (st.notSupported()) {
                LOG_WARN(log_, "AUTO fan policy not supported for GPU %d Fan %d.", dev.index, f);
            } else if (!st.ok()) {
                LOG_ERROR(log_, "Unable to set AUTO fan policy for GPU %d Fan %d: %s",
                          dev.index, f, st.message.c_str());
            }
        }
        // Re-entering MANUAL must not inherit a stale hysteresis reference.
        dev.lastChangeTemp = temp;
        dev.lastKnownTemp = temp;
        return;
    }

    const CurveTarget target = curveSpeedAt(temp, profile_);
    bool anyUpdated = false;
    for (int f = 0; f < dev.fanCount; ++f) {
        int& prevSpeed = dev.fanSpeeds[static_cast<size_t>(f)];
        if (target.speed == prevSpeed) continue;
        if (std::abs(temp - dev.lastChangeTemp) < target.hysteresis) continue;

        if (!writeManualSpeed(dev, f, target.speed)) continue;

        LOG_INFO(log_, "Updated GPU %d Fan %d (curve): Temp=%d°C, PrevSpeed=%d%%, NewSpeed=%d%%, Hyst=%d°C",
                 dev.index, f, temp, prevSpeed, target.speed, target.hysteresis);
        prevSpeed = target.speed;
        anyUpdated = true;
    }

    if (anyUpdated) dev.lastChangeTemp = temp;
    dev.lastKnownTemp = temp;
}

void TickDriver::tickStep(DeviceState& dev, int temp) {
    for (int f = 0; f < dev.fanCount; ++f) {
        int& prevSpeed = dev.fanSpeeds[static_cast<size_t>(f)];
        const int next = stepSpeedFor(temp, dev.lastKnownTemp, prevSpeed, ranges_);
        if (next == prevSpeed) continue;

        if (!writeManualSpeed(dev, f, next)) continue;

        LOG_INFO(log_, "Updated GPU %d Fan %d: Temp=%d°C, PrevSpeed=%d%%, NewSpeed=%d%%",
                 dev.index, f, temp, prevSpeed, next);
        prevSpeed = next;
    }
    dev.lastKnownTemp = temp;
}

} // namespace gfc
