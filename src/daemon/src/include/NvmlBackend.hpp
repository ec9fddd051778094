/*
 * GPU Fan Control — NVIDIA backend via NVML
 * (c) 2025 GpuFanControl contributors
 */
#pragma once

#include "FanBackend.hpp"

namespace gfc {

class Logger;

class NvmlBackend : public FanBackend {
public:
    explicit NvmlBackend(Logger& log);
    ~NvmlBackend() override;

    NvmlBackend(const NvmlBackend&) = delete;
    NvmlBackend& operator=(const NvmlBackend&) = delete;

    HwStatus init() override;
    void     shutdown() override;

    HwValue<int> deviceCount() override;
    HwValue<int> fanCount(int device) override;
    HwValue<int> temperature(int device) override;

    /* fanSpeed_v2 first; the legacy single-fan query is used for fan 0 only. */
    HwValue<int> fanSpeed(int device, int fan) override;

    HwStatus setFanPolicy(int device, int fan, FanPolicy policy) override;
    HwStatus setFanSpeed(int device, int fan, int percent) override;

private:
    Logger& log_;
    bool    initialized_{false};
};

} // namespace gfc
