/*
 * GPU Fan Control — Tick driver (header)
 * - Per-device, per-fan orchestration of the step or curve policy
 * (c) 2025 GpuFanControl contributors
 */
#pragma once

#include "Curve.hpp"
#include "FanBackend.hpp"
#include "FanMode.hpp"
#include "RangeTable.hpp"

#include <vector>

namespace gfc {

class Logger;
class GameModeSource;
struct FanConfig;

enum class ControlPolicy {
    Step,
    Curve
};

const char* toString(ControlPolicy p);

/* In-memory history of one device; fan speeds are indexed by fan id. */
struct DeviceState {
    int              index {0};
    int              fanCount {0};
    int              lastKnownTemp {0};
    int              lastChangeTemp {0};   // temp at the last curve-mode speed change
    FanMode          mode {FanMode::Manual};
    std::vector<int> fanSpeeds;
};

class TickDriver {
public:
    /* `gameMode` may be null (latch never active). Both references must outlive the driver. */
    TickDriver(FanBackend& backend, Logger& log, const GameModeSource* gameMode = nullptr);

    void useStepPolicy(std::vector<TemperatureRange> ranges);

    /* Throws EmptyRangesError; the previous policy is kept in that case. */
    void useCurvePolicy(const std::vector<TemperatureRange>& ranges);

    /* Picks the policy from cfg.curve; an empty curve table falls back to step with a warning. */
    ControlPolicy configure(const FanConfig& cfg);

    /*
     * Enumerate devices and record their initial temperature and fan speeds.
     * Throws HardwareError when the count query fails, no device exists,
     * or no device could be initialized.
     */
    void initialize();

    /* One pass over every device with fans. Hardware failures are logged and skipped. */
    void tick();

    const std::vector<DeviceState>& devices() const noexcept { return devices_; }
    ControlPolicy policy() const noexcept { return policy_; }
    const CurveProfile& profile() const noexcept { return profile_; }
    bool hasControllableFans() const;

private:
    void tickDevice(DeviceState& dev, bool latched);
    void tickCurve(DeviceState& dev, int temp, bool latched);
    void tickStep(DeviceState& dev, int temp);

    /* MANUAL policy, then speed. Returns true when both writes succeeded. */
    bool writeManualSpeed(const DeviceState& dev, int fan, int speed);

    void resetModes();

private:
    FanBackend&           backend_;
    Logger&               log_;
    const GameModeSource* gameMode_;

    ControlPolicy                 policy_{ControlPolicy::Step};
    std::vector<TemperatureRange> ranges_;
    CurveProfile                  profile_;

    std::vector<DeviceState> devices_;
};

} // namespace gfc
