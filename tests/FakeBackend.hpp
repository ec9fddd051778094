/*
 * GPU Fan Control — Scriptable hardware double for tests
 * (c) 2025 GpuFanControl contributors
 */
#pragma once

#include "include/FanBackend.hpp"

#include <cstddef>
#include <vector>

namespace gfc { namespace test {

struct FakeFan {
    int       speed {0};
    FanPolicy policy {FanPolicy::Auto};
    HwStatus  readStatus;
    HwStatus  policyStatus;
    HwStatus  speedStatus;
};

struct FakeDevice {
    int                  temp {0};
    HwStatus             tempStatus;
    HwStatus             fanCountStatus;
    std::vector<FakeFan> fans;
};

struct WriteCall {
    enum Kind { Policy, Speed };
    Kind kind;
    int  device;
    int  fan;
    int  value;   // percent, or 0 = AUTO / 1 = MANUAL
};

/* State shared by every FakeBackend view; owned by the test. */
struct FakeHardware {
    HwStatus                initStatus;
    HwStatus                countStatus;
    std::vector<FakeDevice> devices;
    std::vector<WriteCall>  writes;
    int                     inits {0};
    int                     shutdowns {0};

    FakeDevice& addDevice(int temp, int fans, int speed = 0);

    size_t countWrites(WriteCall::Kind kind) const;
    size_t countPolicyWrites(FanPolicy policy) const;
    void   clearWrites() { writes.clear(); }
};

class FakeBackend : public FanBackend {
public:
    explicit FakeBackend(FakeHardware& hw) : hw_(hw) {}

    HwStatus init() override;
    void     shutdown() override;

    HwValue<int> deviceCount() override;
    HwValue<int> fanCount(int device) override;
    HwValue<int> temperature(int device) override;
    HwValue<int> fanSpeed(int device, int fan) override;

    HwStatus setFanPolicy(int device, int fan, FanPolicy policy) override;
    HwStatus setFanSpeed(int device, int fan, int percent) override;

private:
    FakeDevice* device(int idx);
    FakeFan*    fan(int dev, int idx);

    FakeHardware& hw_;
};

}} // namespace gfc::test
