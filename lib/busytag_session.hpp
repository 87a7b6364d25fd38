#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "device.hpp"
#include "driver_config.hpp"

class BusyTagSession {
public:
    BusyTagSession(std::unique_ptr<Device> device, uint64_t id, const DriverConfig &config);
    ~BusyTagSession();

    int Open(Device::EventCallback eventCallback);
    void Close();

    // Returns size once every byte has been written, or a negative btusb_error
    int Send(const uint8_t *data, size_t size);

    bool IsHealthy() const { return m_open.load() && !m_failed.load(); }
    bool IsSendInProgress() const { return m_sendInProgress.load(); }
    void MarkFailed() { m_failed.store(true); }

    uint64_t GetId() const { return m_id; }
    const std::string &GetUSBPath() const { return m_usbPath; }

private:
    std::unique_ptr<Device> m_device;
    uint64_t m_id;
    std::string m_usbPath;
    size_t m_maxTransferSize;

    std::atomic<bool> m_open{false};
    std::atomic<bool> m_failed{false};
    std::atomic<bool> m_sendInProgress{false};
    std::mutex m_writeMutex;
};
