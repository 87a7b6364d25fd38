#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "device.hpp"
#include "transport.hpp"

// State of one simulated BusyTag, shared between the test and every Device
// object the fake transport hands out for it.
struct FakeDeviceState {
    explicit FakeDeviceState(const std::string &path) : usbPath{path}
    {}

    std::mutex mutex;
    std::string usbPath;

    int openResult = 0;
    int openCount = 0;
    int closeCount = 0;
    bool open = false;
    Device::EventCallback eventCallback;

    std::vector<uint8_t> written;
    std::vector<size_t> writeSizes;
    size_t maxWriteChunk = std::numeric_limits<size_t>::max();
    int failWriteCall = -1;
    int writeCalls = 0;

    // Plays the role of a read completion on the libusb event thread
    bool Emit(Device::DeviceEvent event, const std::vector<uint8_t> &data = {})
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!open || !eventCallback) {
            return false;
        }

        eventCallback(event, data.data(), data.size());
        return true;
    }

    bool Emit(const std::string &text)
    {
        return Emit(Device::DEVICE_EVENT_DATA, std::vector<uint8_t>(text.begin(), text.end()));
    }

    std::string WrittenText()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return std::string(written.begin(), written.end());
    }

    bool IsOpen()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return open;
    }
};

class FakeDevice : public Device {
public:
    explicit FakeDevice(std::shared_ptr<FakeDeviceState> state) : m_state{std::move(state)}
    {}

    ~FakeDevice() override
    {
        Close();
    }

    int Open(EventCallback eventCallback) override
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->openCount++;
        if (m_state->openResult < 0) {
            return m_state->openResult;
        }

        m_state->open = true;
        m_state->eventCallback = std::move(eventCallback);
        m_opened = true;

        return 0;
    }

    void Close() override
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (!m_opened) {
            return;
        }

        m_opened = false;
        m_state->open = false;
        m_state->eventCallback = nullptr;
        m_state->closeCount++;
    }

    int Write(const uint8_t *data, size_t size, int *transferred) override
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);

        int call = m_state->writeCalls++;
        if (call == m_state->failWriteCall) {
            return -1;
        }

        size_t chunk = std::min(size, m_state->maxWriteChunk);
        m_state->written.insert(m_state->written.end(), data, data + chunk);
        m_state->writeSizes.push_back(size);
        *transferred = static_cast<int>(chunk);

        return 0;
    }

    const std::string &GetUSBPath() const override
    {
        return m_state->usbPath;
    }

private:
    std::shared_ptr<FakeDeviceState> m_state;
    bool m_opened = false;
};

// The simulated USB bus. Tests plug and unplug devices here while the
// monitor owns the FakeTransport that watches it.
struct FakeBus {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<FakeDeviceState>> devices;
    Transport::HotplugCallback hotplugCallback;

    int initResult = 0;
    int startResult = 0;
    int initCount = 0;
    int shutdownCount = 0;
    int startCount = 0;
    int stopCount = 0;
    int rescanCount = 0;

    std::shared_ptr<FakeDeviceState> Plug(const std::string &path)
    {
        auto state = std::make_shared<FakeDeviceState>(path);

        std::lock_guard<std::mutex> lock(mutex);
        devices[path] = state;
        if (hotplugCallback) {
            hotplugCallback(Transport::HOTPLUG_EVENT_ARRIVED, std::unique_ptr<Device>(new FakeDevice(state)));
        }

        return state;
    }

    // A physical unplug fails the outstanding read before the hotplug
    // notification arrives
    void Unplug(const std::string &path)
    {
        std::shared_ptr<FakeDeviceState> state;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = devices.find(path);
            if (it == devices.end()) {
                return;
            }
            state = it->second;
            devices.erase(it);
        }

        state->Emit(Device::DEVICE_EVENT_NO_DEVICE);

        std::lock_guard<std::mutex> lock(mutex);
        if (hotplugCallback) {
            hotplugCallback(Transport::HOTPLUG_EVENT_LEFT, std::unique_ptr<Device>(new FakeDevice(state)));
        }
    }

    bool IsMonitoring()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return static_cast<bool>(hotplugCallback);
    }
};

class FakeTransport : public Transport {
public:
    explicit FakeTransport(std::shared_ptr<FakeBus> bus) : m_bus{std::move(bus)}
    {}

    int Init(uint16_t vendorId, uint16_t productId) override
    {
        std::lock_guard<std::mutex> lock(m_bus->mutex);
        m_bus->initCount++;
        m_vendorId = vendorId;
        m_productId = productId;

        return m_bus->initResult;
    }

    void Shutdown() override
    {
        StopMonitoring();

        std::lock_guard<std::mutex> lock(m_bus->mutex);
        m_bus->shutdownCount++;
    }

    int StartMonitoring(HotplugCallback hotplugCallback) override
    {
        std::lock_guard<std::mutex> lock(m_bus->mutex);
        m_bus->startCount++;
        if (m_bus->startResult < 0) {
            return m_bus->startResult;
        }

        m_bus->hotplugCallback = hotplugCallback;
        for (auto &device : m_bus->devices) {
            hotplugCallback(HOTPLUG_EVENT_ARRIVED, std::unique_ptr<Device>(new FakeDevice(device.second)));
        }
        m_monitoring = true;

        return 0;
    }

    void StopMonitoring() override
    {
        std::lock_guard<std::mutex> lock(m_bus->mutex);
        if (!m_monitoring) {
            return;
        }

        m_monitoring = false;
        m_bus->hotplugCallback = nullptr;
        m_bus->stopCount++;
    }

    void Rescan() override
    {
        std::lock_guard<std::mutex> lock(m_bus->mutex);
        if (!m_monitoring) {
            return;
        }

        m_bus->rescanCount++;
        for (auto &device : m_bus->devices) {
            m_bus->hotplugCallback(HOTPLUG_EVENT_ARRIVED, std::unique_ptr<Device>(new FakeDevice(device.second)));
        }
    }

    bool IsDevicePresent() override
    {
        std::lock_guard<std::mutex> lock(m_bus->mutex);
        return !m_bus->devices.empty();
    }

    uint16_t GetVendorId() const { return m_vendorId; }
    uint16_t GetProductId() const { return m_productId; }

private:
    std::shared_ptr<FakeBus> m_bus;
    bool m_monitoring = false;
    uint16_t m_vendorId = 0;
    uint16_t m_productId = 0;
};
