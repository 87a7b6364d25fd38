#pragma once
#include <cstdint>
#include <cstddef>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>
#include <libusb-1.0/libusb.h>

#include "device.hpp"
#include "driver_config.hpp"

class USBDevice : public Device {
public:
    USBDevice(libusb_device *device, libusb_context *ctx, const DriverConfig &config);
    ~USBDevice();

    int Open(EventCallback eventCallback) override;
    void Close() override;

    int Write(const uint8_t *data, size_t size, int *transferred) override;

    const std::string &GetUSBPath() const override { return m_usbPath; }

    static std::string MakeUSBPath(libusb_device *device);

private:
    libusb_device *m_device;
    libusb_context *m_ctx;
    libusb_device_handle *m_handle;
    libusb_config_descriptor *m_config;
    struct libusb_transfer *m_readXfer;
    std::atomic<bool> m_running{false};
    std::mutex m_closeMutex;
    std::string m_serialNumber;
    std::string m_usbPath;
    int m_interfaceNumber;
    bool m_interfaceClaimed;
    bool m_kernelDriverDetached;

    uint8_t m_bulkInEndpoint;
    uint8_t m_bulkOutEndpoint;
    size_t m_bulkInSize;
    size_t m_bulkOutSize;

    std::vector<uint8_t> m_readBuffer;
    unsigned int m_bulkTransferTimeout;

    std::mutex m_readMutex;
    std::condition_variable m_readCV;
    bool m_readInFlight;

    EventCallback m_eventCallback;

    int FindBulkInterface();
    void ReleaseResources();
    void ReadFinished();
    void ResubmitRead(struct libusb_transfer *transfer);

    static void LIBUSB_CALL HandleReadTransfer(struct libusb_transfer *transfer);
};
