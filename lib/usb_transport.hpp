#pragma once
#include <cstdint>
#include <memory>
#include <thread>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <map>
#include <string>
#include <libusb-1.0/libusb.h>

#include "transport.hpp"
#include "driver_config.hpp"

class USBTransport : public Transport {
public:
    explicit USBTransport(const DriverConfig &config) : m_config{config}, m_ctx{nullptr}, m_callbackHandle{0}, m_running{false}
    {}
    ~USBTransport() override;

    int Init(uint16_t vendorId, uint16_t productId) override;
    void Shutdown() override;

    int StartMonitoring(HotplugCallback hotplugCallback) override;
    void StopMonitoring() override;
    void Rescan() override;

    bool IsDevicePresent() override;

protected:
    DriverConfig m_config;
    libusb_context *m_ctx;
    libusb_hotplug_callback_handle m_callbackHandle;
    HotplugCallback m_hotplugCallback;
    std::thread m_deviceMonitorThread;
    std::thread m_devicePollingThread;
    std::atomic<bool> m_running;
    std::mutex m_shutdownMutex;
    std::mutex m_pollMutex;
    std::condition_variable m_pollCV;
    std::map<std::string, libusb_device *> m_knownDevices;
    uint16_t m_vendorId = 0;
    uint16_t m_productId = 0;

    void DeviceMonitorThread();
    void DevicePollingThread();
    void PollDevices();
    bool MatchesDevice(libusb_device *device);
    void ReportDevice(HotplugEvent event, libusb_device *device);
    void ForgetKnownDevices();

    static int LIBUSB_CALL HotplugEventCallback(libusb_context *ctx, libusb_device *device,
                                                libusb_hotplug_event event, void *user_data);
};
