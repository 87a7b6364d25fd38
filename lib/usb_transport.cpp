#include <iomanip>
#include <libusb-1.0/libusb.h>
#include <thread>
#include <atomic>
#include <chrono>
#include <exception>

#include "usb_transport.hpp"
#include "usb_device.hpp"
#include "device_matcher.hpp"
#include "btusb_log.hpp"

std::unique_ptr<Transport> CreateUSBTransport(const DriverConfig &config)
{
    return std::make_unique<USBTransport>(config);
}

USBTransport::~USBTransport()
{
    BTUSB_LOG;
    Shutdown();
}

void USBTransport::DeviceMonitorThread()
{
    BTUSB_LOG;

    int ret;

    while (m_running.load()) {
        ret = libusb_handle_events(m_ctx);
        if (ret < 0 && ret != LIBUSB_ERROR_INTERRUPTED) {
            log(BTUSB_LOG_LEVEL_ERROR) << "Failed to handle events: " << libusb_error_name(ret) << endLog;
            break;
        }
    }
}

void USBTransport::DevicePollingThread()
{
    BTUSB_LOG;

    while (m_running.load()) {
        PollDevices();

        std::unique_lock<std::mutex> lock(m_pollMutex);
        m_pollCV.wait_for(lock, std::chrono::milliseconds(m_config.pollIntervalMs), [this] {
            return !m_running.load();
        });
    }
}

void USBTransport::PollDevices()
{
    BTUSB_LOG;

    libusb_device **device_list;
    ssize_t count = libusb_get_device_list(m_ctx, &device_list);
    if (count < 0) {
        log(BTUSB_LOG_LEVEL_ERROR) << "Failed to get device list: " << libusb_error_name(static_cast<int>(count)) << endLog;
        return;
    }

    std::map<std::string, libusb_device *> present;
    for (ssize_t i = 0; i < count; ++i) {
        libusb_device *device = device_list[i];
        if (MatchesDevice(device)) {
            present.emplace(USBDevice::MakeUSBPath(device), device);
        }
    }

    for (auto it = m_knownDevices.begin(); it != m_knownDevices.end();) {
        if (present.find(it->first) == present.end()) {
            log(BTUSB_LOG_LEVEL_INFO) << "Device left: " << it->first << endLog;
            ReportDevice(HOTPLUG_EVENT_LEFT, it->second);
            libusb_unref_device(it->second);
            it = m_knownDevices.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto &entry : present) {
        if (m_knownDevices.find(entry.first) == m_knownDevices.end()) {
            log(BTUSB_LOG_LEVEL_INFO) << "Device arrived: " << entry.first << endLog;
            m_knownDevices.emplace(entry.first, libusb_ref_device(entry.second));
            ReportDevice(HOTPLUG_EVENT_ARRIVED, entry.second);
        }
    }

    libusb_free_device_list(device_list, 1);
}

void USBTransport::ForgetKnownDevices()
{
    for (auto &entry : m_knownDevices) {
        libusb_unref_device(entry.second);
    }
    m_knownDevices.clear();
}

bool USBTransport::MatchesDevice(libusb_device *device)
{
    BTUSB_LOG;

    libusb_device_descriptor desc;
    int ret = libusb_get_device_descriptor(device, &desc);
    if (ret < 0) {
        log(BTUSB_LOG_LEVEL_ERROR) << "Failed to get device descriptor: " << libusb_error_name(ret) << endLog;
        return false;
    }

    return MatchesDeviceIdentity(DeviceIdentity{m_vendorId, m_productId}, desc.idVendor, desc.idProduct);
}

void USBTransport::ReportDevice(HotplugEvent event, libusb_device *device)
{
    BTUSB_LOG;

    if (!m_hotplugCallback) {
        log(BTUSB_LOG_LEVEL_ERROR) << "No hotplug callback" << endLog;
        return;
    }

    try {
        m_hotplugCallback(event, std::make_unique<USBDevice>(device, m_ctx, m_config));
    } catch (const std::exception &e) {
        log(BTUSB_LOG_LEVEL_ERROR) << "Error: " << e.what() << endLog;
    }
}

int USBTransport::Init(uint16_t vendorId, uint16_t productId)
{
    BTUSB_LOG;

    m_vendorId = vendorId;
    m_productId = productId;

    int ret = libusb_init(&m_ctx);
    if (ret < 0) {
        log(BTUSB_LOG_LEVEL_ERROR) << "Failed to initialize libusb: " << libusb_error_name(ret) << endLog;
        m_ctx = nullptr;
        return ret;
    }

    if (m_config.usbDebug) {
        libusb_set_option(m_ctx, LIBUSB_OPTION_LOG_LEVEL, LIBUSB_LOG_LEVEL_DEBUG);
    }

    return 0;
}

int USBTransport::StartMonitoring(HotplugCallback hotplugCallback)
{
    BTUSB_LOG;

    std::lock_guard<std::mutex> lock(m_shutdownMutex);

    if (!m_ctx) {
        log(BTUSB_LOG_LEVEL_ERROR) << "libusb is not initialized" << endLog;
        return LIBUSB_ERROR_OTHER;
    }

    if (m_running.load()) {
        return 0;
    }

    m_hotplugCallback = hotplugCallback;
    m_running.store(true);

    if (libusb_has_capability(LIBUSB_CAP_HAS_HOTPLUG) && !m_config.forcePolling) {
        log(BTUSB_LOG_LEVEL_DEBUG) << "Hotplug is supported" << endLog;

        // LIBUSB_HOTPLUG_ENUMERATE reports devices that are already attached
        int ret = libusb_hotplug_register_callback(m_ctx,
                                                static_cast<libusb_hotplug_event>(LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED | LIBUSB_HOTPLUG_EVENT_DEVICE_LEFT),
                                                LIBUSB_HOTPLUG_ENUMERATE,
                                                m_vendorId,
                                                m_productId,
                                                LIBUSB_HOTPLUG_MATCH_ANY,
                                                HotplugEventCallback,
                                                this,
                                                &m_callbackHandle);
        if (ret != LIBUSB_SUCCESS) {
            log(BTUSB_LOG_LEVEL_ERROR) << "Failed to register hotplug callback: " << libusb_error_name(ret) << endLog;
            m_callbackHandle = 0;
            m_running.store(false);
            return ret;
        }
    } else {
        log(BTUSB_LOG_LEVEL_DEBUG) << "Hotplug is NOT supported, polling every " << m_config.pollIntervalMs << " ms" << endLog;

        m_devicePollingThread = std::thread(&USBTransport::DevicePollingThread, this);
    }

    m_deviceMonitorThread = std::thread(&USBTransport::DeviceMonitorThread, this);

    return 0;
}

void USBTransport::StopMonitoring()
{
    BTUSB_LOG;

    std::lock_guard<std::mutex> lock(m_shutdownMutex);
    if (m_running.exchange(false)) {
        if (m_callbackHandle) {
            libusb_hotplug_deregister_callback(m_ctx, m_callbackHandle);
            m_callbackHandle = 0;
        }

        {
            std::lock_guard<std::mutex> pollLock(m_pollMutex);
            m_pollCV.notify_all();
        }
        if (m_devicePollingThread.joinable()) {
            m_devicePollingThread.join();
        }

        libusb_interrupt_event_handler(m_ctx);
        if (m_deviceMonitorThread.joinable()) {
            m_deviceMonitorThread.join();
        }

        ForgetKnownDevices();
        m_hotplugCallback = nullptr;
    }
}

void USBTransport::Rescan()
{
    BTUSB_LOG;

    std::lock_guard<std::mutex> lock(m_shutdownMutex);
    if (!m_running.load()) {
        return;
    }

    libusb_device **device_list;
    ssize_t count = libusb_get_device_list(m_ctx, &device_list);
    if (count < 0) {
        log(BTUSB_LOG_LEVEL_ERROR) << "Failed to get device list: " << libusb_error_name(static_cast<int>(count)) << endLog;
        return;
    }

    for (ssize_t i = 0; i < count; ++i) {
        libusb_device *device = device_list[i];
        if (MatchesDevice(device)) {
            log(BTUSB_LOG_LEVEL_INFO) << "Device still attached: " << USBDevice::MakeUSBPath(device) << endLog;
            ReportDevice(HOTPLUG_EVENT_ARRIVED, device);
        }
    }

    libusb_free_device_list(device_list, 1);
}

bool USBTransport::IsDevicePresent()
{
    BTUSB_LOG;

    if (!m_ctx) {
        return false;
    }

    libusb_device **device_list;
    ssize_t count = libusb_get_device_list(m_ctx, &device_list);
    if (count < 0) {
        log(BTUSB_LOG_LEVEL_ERROR) << "Failed to get device list: " << libusb_error_name(static_cast<int>(count)) << endLog;
        return false;
    }

    bool present = false;
    for (ssize_t i = 0; i < count && !present; ++i) {
        present = MatchesDevice(device_list[i]);
    }

    libusb_free_device_list(device_list, 1);

    return present;
}

void USBTransport::Shutdown()
{
    BTUSB_LOG;

    StopMonitoring();

    std::lock_guard<std::mutex> lock(m_shutdownMutex);
    if (m_ctx) {
        libusb_exit(m_ctx);
        m_ctx = nullptr;
    }
}

int LIBUSB_CALL USBTransport::HotplugEventCallback(libusb_context *ctx, libusb_device *device,
                                                libusb_hotplug_event event, void *user_data)
{
    BTUSB_LOG;

    USBTransport *transport = static_cast<USBTransport*>(user_data);

    if (!transport->MatchesDevice(device)) {
        return 0;
    }

    if (event == LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED) {
        libusb_device_descriptor desc;
        if (libusb_get_device_descriptor(device, &desc) == 0) {
            log(BTUSB_LOG_LEVEL_INFO) << "Device arrived: vid: 0x" << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << desc.idVendor
                << ", pid: 0x" << std::setw(4) << desc.idProduct << std::dec << ", bcdDevice: " << desc.bcdDevice << endLog;
        }
        transport->ReportDevice(HOTPLUG_EVENT_ARRIVED, device);
    } else if (event == LIBUSB_HOTPLUG_EVENT_DEVICE_LEFT) {
        log(BTUSB_LOG_LEVEL_INFO) << "Device left: " << USBDevice::MakeUSBPath(device) << endLog;
        transport->ReportDevice(HOTPLUG_EVENT_LEFT, device);
    }

    return 0;
}
