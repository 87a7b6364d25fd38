#pragma once

#include <cstdint>
#include <functional>
#include <memory>

#include "device.hpp"

struct DriverConfig;

class Transport {
public:
    enum HotplugEvent {
        HOTPLUG_EVENT_ARRIVED,
        HOTPLUG_EVENT_LEFT,
    };

    using HotplugCallback = std::function<void(HotplugEvent event, std::unique_ptr<Device> device)>;

    Transport()
    {}
    virtual ~Transport()
    {}

    virtual int Init(uint16_t vendorId, uint16_t productId) = 0;
    virtual void Shutdown() = 0;

    // Devices already attached are reported as arrivals before or shortly
    // after this returns
    virtual int StartMonitoring(HotplugCallback hotplugCallback) = 0;
    virtual void StopMonitoring() = 0;

    // Reports every matching device still attached as an arrival again
    virtual void Rescan() = 0;

    virtual bool IsDevicePresent() = 0;
};

std::unique_ptr<Transport> CreateUSBTransport(const DriverConfig &config);
