#pragma once

#include <cstdint>
#include <cstddef>
#include <functional>
#include <string>

class Device {
public:
    enum DeviceEvent {
        DEVICE_EVENT_DATA,
        DEVICE_EVENT_NO_DEVICE,
        DEVICE_EVENT_TRANSFER_ERROR,
    };

    using EventCallback = std::function<void(DeviceEvent event, const uint8_t *buf, size_t size)>;

    Device()
    {}
    virtual ~Device()
    {}

    // Claims the device and starts the read loop. The callback runs on the
    // transport's event thread and must not block.
    virtual int Open(EventCallback eventCallback) = 0;
    virtual void Close() = 0;

    virtual int Write(const uint8_t *data, size_t size, int *transferred) = 0;

    virtual const std::string &GetUSBPath() const = 0;
};
