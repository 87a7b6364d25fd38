#include <algorithm>

#include "busytag_session.hpp"
#include "busytag_usb_driver.h"
#include "btusb_log.hpp"

BusyTagSession::BusyTagSession(std::unique_ptr<Device> device, uint64_t id, const DriverConfig &config)
    : m_device{std::move(device)}, m_id{id}, m_maxTransferSize{std::max<size_t>(config.maxTransferSize, 1)}
{
    m_usbPath = m_device->GetUSBPath();
}

BusyTagSession::~BusyTagSession()
{
    BTUSB_LOG;

    Close();
}

int BusyTagSession::Open(Device::EventCallback eventCallback)
{
    BTUSB_LOG;

    int ret = m_device->Open([this, eventCallback](Device::DeviceEvent event, const uint8_t *buf, size_t size) {
        if (event != Device::DEVICE_EVENT_DATA) {
            MarkFailed();
        }
        eventCallback(event, buf, size);
    });
    if (ret < 0) {
        log(BTUSB_LOG_LEVEL_ERROR) << "Failed to open device " << m_usbPath << ": " << ret << endLog;
        return ret;
    }

    m_open.store(true);
    log(BTUSB_LOG_LEVEL_INFO) << "Session " << m_id << " opened on " << m_usbPath << endLog;

    return 0;
}

void BusyTagSession::Close()
{
    BTUSB_LOG;

    if (m_open.exchange(false)) {
        log(BTUSB_LOG_LEVEL_INFO) << "Closing session " << m_id << " on " << m_usbPath << endLog;
    }

    // A write in progress keeps using the device handle until it returns
    std::lock_guard<std::mutex> lock(m_writeMutex);
    m_device->Close();
}

int BusyTagSession::Send(const uint8_t *data, size_t size)
{
    BTUSB_LOG;

    if (data == nullptr || size == 0) {
        return BTUSB_ERROR_INVALID_ARGUMENT;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);

    if (!IsHealthy()) {
        return BTUSB_ERROR_NO_SESSION;
    }

    m_sendInProgress.store(true);

    size_t totalTransferred = 0;
    int ret = 0;
    while (totalTransferred < size) {
        if (!m_open.load()) {
            log(BTUSB_LOG_LEVEL_ERROR) << "Session closed after " << totalTransferred << " of " << size << " bytes" << endLog;
            ret = -1;
            break;
        }

        size_t chunkSize = std::min(size - totalTransferred, m_maxTransferSize);
        int transferred = 0;

        ret = m_device->Write(data + totalTransferred, chunkSize, &transferred);
        if (ret < 0) {
            log(BTUSB_LOG_LEVEL_ERROR) << "Bulk write failed after " << totalTransferred << " of " << size << " bytes: " << ret << endLog;
            break;
        }

        if (transferred <= 0) {
            log(BTUSB_LOG_LEVEL_ERROR) << "Bulk write made no progress after " << totalTransferred << " of " << size << " bytes" << endLog;
            ret = -1;
            break;
        }

        if (static_cast<size_t>(transferred) < chunkSize) {
            log(BTUSB_LOG_LEVEL_DEBUG) << "Short write: " << transferred << " of " << chunkSize << " bytes" << endLog;
        }

        totalTransferred += static_cast<size_t>(std::min(static_cast<size_t>(transferred), chunkSize));
    }

    m_sendInProgress.store(false);

    if (ret < 0) {
        return BTUSB_ERROR_TRANSFER;
    }

    return static_cast<int>(totalTransferred);
}
