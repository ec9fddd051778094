/*
 * GPU Fan Control — NVIDIA backend via NVML (implementation)
 * (c) 2025 GpuFanControl contributors
 */

#include "include/NvmlBackend.hpp"
#include "include/Log.hpp"

#include <nvml.h>

#include <algorithm>
#include <string>

namespace gfc {

static HwStatus statusOf(nvmlReturn_t r, const std::string& what) {
    if (r == NVML_SUCCESS) return HwStatus::success();
    const std::string msg = what + ": " + nvmlErrorString(r);
    if (r == NVML_ERROR_NOT_SUPPORTED) return HwStatus::unsupported(msg);
    return HwStatus::failure(msg);
}

static HwStatus handleOf(int device, nvmlDevice_t& out) {
    if (device < 0) return HwStatus::failure("invalid device index " + std::to_string(device));
    nvmlReturn_t r = nvmlDeviceGetHandleByIndex_v2(static_cast<unsigned int>(device), &out);
    return statusOf(r, "unable to get handle for device " + std::to_string(device));
}

NvmlBackend::NvmlBackend(Logger& log)
    : log_(log) {}

NvmlBackend::~NvmlBackend() {
    shutdown();
}

HwStatus NvmlBackend::init() {
    if (initialized_) return HwStatus::success();
    nvmlReturn_t r = nvmlInit_v2();
    if (r != NVML_SUCCESS) {
        return HwStatus::failure(std::string("unable to initialize NVML: ") + nvmlErrorString(r));
    }
    initialized_ = true;
    LOG_INFO(log_, "NVML initialized successfully.");
    return HwStatus::success();
}

void NvmlBackend::shutdown() {
    if (!initialized_) return;
    initialized_ = false;
    LOG_INFO(log_, "Shutting down NVML...");
    nvmlReturn_t r = nvmlShutdown();
    if (r != NVML_SUCCESS) {
        LOG_ERROR(log_, "Unable to shutdown NVML cleanly: %s", nvmlErrorString(r));
    } else {
        LOG_INFO(log_, "NVML shutdown complete.");
    }
}

HwValue<int> NvmlBackend::deviceCount() {
    unsigned int count = 0;
    nvmlReturn_t r = nvmlDeviceGetCount_v2(&count);
    return HwValue<int>{statusOf(r, "unable to get NVIDIA device count"), static_cast<int>(count)};
}

HwValue<int> NvmlBackend::fanCount(int device) {
    nvmlDevice_t dev{};
    HwStatus st = handleOf(device, dev);
    if (!st.ok()) return HwValue<int>{st, 0};

    unsigned int n = 0;
    nvmlReturn_t r = nvmlDeviceGetNumFans(dev, &n);
    return HwValue<int>{statusOf(r, "unable to get fan count for device " + std::to_string(device)),
                        static_cast<int>(n)};
}

HwValue<int> NvmlBackend::temperature(int device) {
    nvmlDevice_t dev{};
    HwStatus st = handleOf(device, dev);
    if (!st.ok()) return HwValue<int>{st, 0};

    unsigned int t = 0;
    nvmlReturn_t r = nvmlDeviceGetTemperature(dev, NVML_TEMPERATURE_GPU, &t);
    return HwValue<int>{statusOf(r, "unable to get temperature for device " + std::to_string(device)),
                        static_cast<int>(t)};
}

HwValue<int> NvmlBackend::fanSpeed(int device, int fan) {
    nvmlDevice_t dev{};
    HwStatus st = handleOf(device, dev);
    if (!st.ok()) return HwValue<int>{st, 0};

    unsigned int speed = 0;
    nvmlReturn_t r = nvmlDeviceGetFanSpeed_v2(dev, static_cast<unsigned int>(fan), &speed);
    if (r == NVML_SUCCESS) return HwValue<int>{HwStatus::success(), static_cast<int>(speed)};

    if (fan == 0) {
        unsigned int legacy = 0;
        nvmlReturn_t rl = nvmlDeviceGetFanSpeed(dev, &legacy);
        if (rl == NVML_SUCCESS) {
            LOG_DEBUG(log_, "device %d fan 0: using legacy fan speed query", device);
            return HwValue<int>{HwStatus::success(), static_cast<int>(legacy)};
        }
        return HwValue<int>{HwStatus::failure(std::string("fan speed v2 failed (") + nvmlErrorString(r) +
                                              ") and legacy failed (" + nvmlErrorString(rl) + ")"),
                            0};
    }
    return HwValue<int>{statusOf(r, "fan speed v2 not available for fan " + std::to_string(fan)), 0};
}

HwStatus NvmlBackend::setFanPolicy(int device, int fan, FanPolicy policy) {
    nvmlDevice_t dev{};
    HwStatus st = handleOf(device, dev);
    if (!st.ok()) return st;

    const nvmlFanControlPolicy_t p = (policy == FanPolicy::Auto)
        ? NVML_FAN_POLICY_TEMPERATURE_CONTINOUS_SW
        : NVML_FAN_POLICY_MANUAL;
    nvmlReturn_t r = nvmlDeviceSetFanControlPolicy(dev, static_cast<unsigned int>(fan), p);
    return statusOf(r, std::string("unable to set ") + (policy == FanPolicy::Auto ? "AUTO" : "MANUAL") +
                       " fan policy for GPU " + std::to_string(device) + " Fan " + std::to_string(fan));
}

HwStatus NvmlBackend::setFanSpeed(int device, int fan, int percent) {
    nvmlDevice_t dev{};
    HwStatus st = handleOf(device, dev);
    if (!st.ok()) return st;

    const unsigned int d = static_cast<unsigned int>(std::max(0, std::min(100, percent)));
    nvmlReturn_t r = nvmlDeviceSetFanSpeed_v2(dev, static_cast<unsigned int>(fan), d);
    return statusOf(r, "unable to set fan speed for GPU " + std::to_string(device) + " Fan " +
                       std::to_string(fan) + " to " + std::to_string(d) + "%");
}

} // namespace gfc
