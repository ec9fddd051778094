/*
 * GPU Fan Control — Hardware collaborator interface
 * - Every call is fallible and reports through HwStatus; none throws.
 * (c) 2025 GpuFanControl contributors
 */
#pragma once

#include <string>
#include <utility>

namespace gfc {

enum class HwCode {
    Ok,
    NotSupported,
    Failed
};

struct HwStatus {
    HwCode      code {HwCode::Ok};
    std::string message;

    bool ok() const noexcept { return code == HwCode::Ok; }
    bool notSupported() const noexcept { return code == HwCode::NotSupported; }

    static HwStatus success() { return HwStatus{}; }
    static HwStatus unsupported(std::string msg) { return HwStatus{HwCode::NotSupported, std::move(msg)}; }
    static HwStatus failure(std::string msg) { return HwStatus{HwCode::Failed, std::move(msg)}; }
};

template <typename T>
struct HwValue {
    HwStatus status;
    T        value {};

    bool ok() const noexcept { return status.ok(); }
};

enum class FanPolicy {
    Auto,   // temperature-controlled by the device firmware
    Manual  // explicit speed writes
};

/*
 * Device and fan ids are zero-based indices as enumerated by the backend.
 * init() must succeed before any other call; shutdown() is idempotent.
 */
class FanBackend {
public:
    virtual ~FanBackend() = default;

    virtual HwStatus init() = 0;
    virtual void     shutdown() = 0;

    virtual HwValue<int> deviceCount() = 0;
    virtual HwValue<int> fanCount(int device) = 0;

    /* Core temperature in whole degrees Celsius. */
    virtual HwValue<int> temperature(int device) = 0;

    /* Current fan speed in percent. */
    virtual HwValue<int> fanSpeed(int device, int fan) = 0;

    virtual HwStatus setFanPolicy(int device, int fan, FanPolicy policy) = 0;
    virtual HwStatus setFanSpeed(int device, int fan, int percent) = 0;
};

} // namespace gfc
