#include <chrono>
#include <cstddef>
#include <iomanip>
#include <sstream>

#include "usb_device.hpp"
#include "btusb_log.hpp"
#include "utils.hpp"

static const char *EndpointTypeToString(uint8_t attributes)
{
    switch (attributes & LIBUSB_TRANSFER_TYPE_MASK) {
        case LIBUSB_TRANSFER_TYPE_CONTROL:
            return "Control";
        case LIBUSB_TRANSFER_TYPE_ISOCHRONOUS:
            return "Isochronous";
        case LIBUSB_TRANSFER_TYPE_BULK:
            return "Bulk";
        case LIBUSB_TRANSFER_TYPE_INTERRUPT:
            return "Interrupt";
        default:
            return "Unknown";
    }
}

USBDevice::USBDevice(libusb_device *device, libusb_context *ctx, const DriverConfig &config)
{
    BTUSB_LOG;

    m_device = libusb_ref_device(device);
    m_ctx = ctx;
    m_handle = nullptr;
    m_config = nullptr;
    m_readXfer = nullptr;
    m_interfaceNumber = -1;
    m_interfaceClaimed = false;
    m_kernelDriverDetached = false;
    m_bulkInEndpoint = 0;
    m_bulkOutEndpoint = 0;
    m_bulkInSize = 0;
    m_bulkOutSize = 0;
    m_readBuffer.resize(config.readBufferSize);
    m_bulkTransferTimeout = config.writeTimeoutMs;
    m_readInFlight = false;

    m_usbPath = MakeUSBPath(m_device);
    log(BTUSB_LOG_LEVEL_DEBUG) << "USB Path: " << m_usbPath << endLog;
}

std::string USBDevice::MakeUSBPath(libusb_device *device)
{
    uint8_t portNumbers[8];
    uint8_t bus = libusb_get_bus_number(device);
    int numElementsInPath = libusb_get_port_numbers(device, portNumbers, sizeof(portNumbers));
    std::stringstream usbPathStream;
    usbPathStream << static_cast<int>(bus) << "-";
    if (numElementsInPath > 0) {
        usbPathStream << static_cast<int>(portNumbers[0]);
        for (int i = 1; i < numElementsInPath; ++i) {
            usbPathStream << "." << static_cast<int>(portNumbers[i]);
        }
    } else {
        // Root hub devices have no port chain
        usbPathStream << "a" << static_cast<int>(libusb_get_device_address(device));
    }

    return usbPathStream.str();
}

USBDevice::~USBDevice()
{
    BTUSB_LOG;

    Close();
    libusb_unref_device(m_device);
}

int USBDevice::FindBulkInterface()
{
    BTUSB_LOG;

    int fallbackInterface = -1;
    uint8_t fallbackIn = 0;
    uint8_t fallbackOut = 0;
    size_t fallbackInSize = 0;
    size_t fallbackOutSize = 0;

    for (int i = 0; i < m_config->bNumInterfaces; ++i) {
        const libusb_interface &interface = m_config->interface[i];
        for (int j = 0; j < interface.num_altsetting; ++j) {
            const libusb_interface_descriptor &altsetting = interface.altsetting[j];
            log(BTUSB_LOG_LEVEL_INFO) << "Interface " << static_cast<int>(altsetting.bInterfaceNumber)
                << " alt " << static_cast<int>(altsetting.bAlternateSetting)
                << ": class " << static_cast<int>(altsetting.bInterfaceClass)
                << ", " << static_cast<int>(altsetting.bNumEndpoints) << " endpoints" << endLog;

            uint8_t bulkIn = 0;
            uint8_t bulkOut = 0;
            size_t bulkInSize = 0;
            size_t bulkOutSize = 0;

            for (int k = 0; k < altsetting.bNumEndpoints; ++k) {
                const libusb_endpoint_descriptor &endpoint = altsetting.endpoint[k];
                bool in = (endpoint.bEndpointAddress & LIBUSB_ENDPOINT_DIR_MASK) == LIBUSB_ENDPOINT_IN;
                log(BTUSB_LOG_LEVEL_INFO) << "  Pipe 0x" << std::hex << std::setw(2) << std::setfill('0')
                    << static_cast<int>(endpoint.bEndpointAddress) << std::dec << ": "
                    << (in ? "IN " : "OUT ") << EndpointTypeToString(endpoint.bmAttributes)
                    << " maxPacket=" << endpoint.wMaxPacketSize << endLog;

                if ((endpoint.bmAttributes & LIBUSB_TRANSFER_TYPE_MASK) != LIBUSB_TRANSFER_TYPE_BULK) {
                    continue;
                }

                if (in && bulkIn == 0) {
                    bulkIn = endpoint.bEndpointAddress;
                    bulkInSize = endpoint.wMaxPacketSize;
                } else if (!in && bulkOut == 0) {
                    bulkOut = endpoint.bEndpointAddress;
                    bulkOutSize = endpoint.wMaxPacketSize;
                }
            }

            if (bulkIn == 0 || bulkOut == 0) {
                continue;
            }

            if (altsetting.bInterfaceClass == LIBUSB_CLASS_DATA) {
                m_interfaceNumber = altsetting.bInterfaceNumber;
                m_bulkInEndpoint = bulkIn;
                m_bulkOutEndpoint = bulkOut;
                m_bulkInSize = bulkInSize;
                m_bulkOutSize = bulkOutSize;
                log(BTUSB_LOG_LEVEL_INFO) << "Found CDC Data interface " << m_interfaceNumber << endLog;
                return 0;
            }

            if (fallbackInterface < 0) {
                fallbackInterface = altsetting.bInterfaceNumber;
                fallbackIn = bulkIn;
                fallbackOut = bulkOut;
                fallbackInSize = bulkInSize;
                fallbackOutSize = bulkOutSize;
            }
        }
    }

    if (fallbackInterface < 0) {
        log(BTUSB_LOG_LEVEL_ERROR) << "Could not find bulk IN/OUT endpoints" << endLog;
        return LIBUSB_ERROR_NOT_FOUND;
    }

    log(BTUSB_LOG_LEVEL_WARNING) << "No CDC Data interface, using interface " << fallbackInterface << endLog;
    m_interfaceNumber = fallbackInterface;
    m_bulkInEndpoint = fallbackIn;
    m_bulkOutEndpoint = fallbackOut;
    m_bulkInSize = fallbackInSize;
    m_bulkOutSize = fallbackOutSize;

    return 0;
}

int USBDevice::Open(EventCallback eventCallback)
{
    BTUSB_LOG;

    if (m_handle) {
        return 0;
    }

    if (!eventCallback) {
        return LIBUSB_ERROR_INVALID_PARAM;
    }

    m_eventCallback = eventCallback;

    int ret = libusb_open(m_device, &m_handle);
    if (ret < 0) {
        log(BTUSB_LOG_LEVEL_ERROR) << "Failed to open USB device: " << libusb_error_name(ret) << endLog;
        m_handle = nullptr;
        return ret;
    }

    ret = libusb_get_config_descriptor(m_device, 0, &m_config);
    if (ret < 0) {
        log(BTUSB_LOG_LEVEL_ERROR) << "Failed to get config descriptor: " << libusb_error_name(ret) << endLog;
        ReleaseResources();
        return ret;
    }

    libusb_device_descriptor desc;
    ret = libusb_get_device_descriptor(m_device, &desc);
    if (ret < 0) {
        log(BTUSB_LOG_LEVEL_ERROR) << "Failed to get device descriptor: " << libusb_error_name(ret) << endLog;
        ReleaseResources();
        return ret;
    }

    if (desc.iSerialNumber != 0) {
        unsigned char serialNumber[256];
        ret = libusb_get_string_descriptor_ascii(m_handle, desc.iSerialNumber, serialNumber, sizeof(serialNumber));
        if (ret < 0) {
            log(BTUSB_LOG_LEVEL_WARNING) << "Failed to get serial number: " << libusb_error_name(ret) << endLog;
        } else {
            m_serialNumber = std::string(serialNumber, serialNumber + ret);
            log(BTUSB_LOG_LEVEL_INFO) << "Serial number: " << m_serialNumber << endLog;
        }
    }

    ret = FindBulkInterface();
    if (ret < 0) {
        ReleaseResources();
        return ret;
    }

    ret = libusb_kernel_driver_active(m_handle, m_interfaceNumber);
    if (ret == 1) {
        ret = libusb_detach_kernel_driver(m_handle, m_interfaceNumber);
        if (ret < 0) {
            if (ret == LIBUSB_ERROR_NOT_FOUND || ret == LIBUSB_ERROR_NOT_SUPPORTED) {
                // Some platforms can't detach kernel drivers, the claim below may still succeed
                log(BTUSB_LOG_LEVEL_INFO) << "Failed to detach kernel driver: " << libusb_error_name(ret) << endLog;
            } else {
                log(BTUSB_LOG_LEVEL_ERROR) << "Failed to detach kernel driver: " << libusb_error_name(ret) << endLog;
                ReleaseResources();
                return ret;
            }
        } else {
            m_kernelDriverDetached = true;
        }
    }

    ret = libusb_claim_interface(m_handle, m_interfaceNumber);
    if (ret < 0) {
        log(BTUSB_LOG_LEVEL_ERROR) << "Failed to claim interface " << m_interfaceNumber << ": " << libusb_error_name(ret) << endLog;
        ReleaseResources();
        return ret;
    }
    m_interfaceClaimed = true;

    log(BTUSB_LOG_LEVEL_INFO) << "Bulk IN endpoint=0x" << std::hex << static_cast<int>(m_bulkInEndpoint)
        << ", Bulk OUT endpoint=0x" << static_cast<int>(m_bulkOutEndpoint) << std::dec << endLog;

    m_readXfer = libusb_alloc_transfer(0);
    if (!m_readXfer) {
        log(BTUSB_LOG_LEVEL_ERROR) << "Failed to allocate bulk read transfer" << endLog;
        ReleaseResources();
        return LIBUSB_ERROR_NO_MEM;
    }

    libusb_fill_bulk_transfer(m_readXfer, m_handle, m_bulkInEndpoint, m_readBuffer.data(),
        static_cast<int>(m_readBuffer.size()), HandleReadTransfer, this, 0);

    m_running.store(true);

    {
        std::lock_guard<std::mutex> lock(m_readMutex);
        ret = libusb_submit_transfer(m_readXfer);
        if (ret == 0) {
            m_readInFlight = true;
        }
    }
    if (ret < 0) {
        log(BTUSB_LOG_LEVEL_ERROR) << "Failed to submit bulk read transfer: " << libusb_error_name(ret) << endLog;
        m_running.store(false);
        ReleaseResources();
        return ret;
    }

    return 0;
}

void USBDevice::ReleaseResources()
{
    BTUSB_LOG;

    // Close() waits for the read to come back, so libusb no longer owns it
    if (m_readXfer) {
        libusb_free_transfer(m_readXfer);
        m_readXfer = nullptr;
    }

    if (m_handle) {
        if (m_interfaceClaimed) {
            int ret = libusb_release_interface(m_handle, m_interfaceNumber);
            if (ret < 0 && ret != LIBUSB_ERROR_NO_DEVICE) {
                log(BTUSB_LOG_LEVEL_WARNING) << "Failed to release interface: " << libusb_error_name(ret) << endLog;
            }
            m_interfaceClaimed = false;
        }

        if (m_kernelDriverDetached) {
            int ret = libusb_attach_kernel_driver(m_handle, m_interfaceNumber);
            if (ret < 0 && ret != LIBUSB_ERROR_NO_DEVICE) {
                log(BTUSB_LOG_LEVEL_INFO) << "Failed to reattach kernel driver: " << libusb_error_name(ret) << endLog;
            }
            m_kernelDriverDetached = false;
        }

        libusb_close(m_handle);
        m_handle = nullptr;
    }

    if (m_config) {
        libusb_free_config_descriptor(m_config);
        m_config = nullptr;
    }
}

void USBDevice::Close()
{
    BTUSB_LOG;

    std::lock_guard<std::mutex> lock(m_closeMutex);
    if (m_running.exchange(false)) {
        std::unique_lock<std::mutex> readLock(m_readMutex);
        if (m_readInFlight) {
            int ret = libusb_cancel_transfer(m_readXfer);
            if (ret < 0 && ret != LIBUSB_ERROR_NOT_FOUND) {
                log(BTUSB_LOG_LEVEL_WARNING) << "Failed to cancel bulk read transfer: " << libusb_error_name(ret) << endLog;
            }

            if (!m_readCV.wait_for(readLock, std::chrono::seconds(2), [this] { return !m_readInFlight; })) {
                // The transfer points back at this device, so neither may go
                // away before libusb returns it. Drive the events here in case
                // the event thread is gone.
                log(BTUSB_LOG_LEVEL_WARNING) << "Bulk read cancellation is slow, handling USB events until it completes" << endLog;
                while (m_readInFlight) {
                    readLock.unlock();
                    struct timeval tv = {0, 100000};
                    ret = libusb_handle_events_timeout_completed(m_ctx, &tv, nullptr);
                    if (ret < 0 && ret != LIBUSB_ERROR_INTERRUPTED) {
                        log(BTUSB_LOG_LEVEL_ERROR) << "Failed to handle events: " << libusb_error_name(ret) << endLog;
                    }
                    readLock.lock();
                }
            }
        }
    }

    ReleaseResources();
}

int USBDevice::Write(const uint8_t *data, size_t size, int *transferred)
{
    BTUSB_LOG;

    *transferred = 0;

    if (!m_running.load()) {
        return LIBUSB_ERROR_NO_DEVICE;
    }

    log(BTUSB_LOG_LEVEL_DEBUG) << "Writing to USB device" << endLog;
    log(BTUSB_LOG_LEVEL_DEBUG) << "  Bulk Out Endpoint: 0x" << std::hex << static_cast<int>(m_bulkOutEndpoint) << std::dec << endLog;
    log(BTUSB_LOG_LEVEL_DEBUG) << "  Length: " << size << endLog;
    log(BTUSB_LOG_LEVEL_DEBUG) << "  Data: " << HexString(data, size) << endLog;

    int ret = libusb_bulk_transfer(m_handle, m_bulkOutEndpoint, const_cast<uint8_t*>(data), static_cast<int>(size),
        transferred, m_bulkTransferTimeout);
    if (ret < 0) {
        log(BTUSB_LOG_LEVEL_ERROR) << "Failed to write to USB device: " << libusb_error_name(ret) << endLog;
        return ret;
    }

    return 0;
}

void USBDevice::ReadFinished()
{
    std::lock_guard<std::mutex> lock(m_readMutex);
    m_readInFlight = false;
    m_readCV.notify_all();
}

void USBDevice::ResubmitRead(struct libusb_transfer *transfer)
{
    BTUSB_LOG;

    int ret;
    {
        // Close() flips m_running before taking m_readMutex, so a submit made
        // under the lock is always seen and cancelled by it
        std::lock_guard<std::mutex> lock(m_readMutex);
        if (!m_running.load()) {
            m_readInFlight = false;
            m_readCV.notify_all();
            return;
        }

        ret = libusb_submit_transfer(transfer);
        if (ret == 0) {
            return;
        }
    }

    log(BTUSB_LOG_LEVEL_ERROR) << "Failed to resubmit bulk read transfer: " << libusb_error_name(ret) << endLog;
    if (m_running.load()) {
        m_eventCallback(ret == LIBUSB_ERROR_NO_DEVICE ? DEVICE_EVENT_NO_DEVICE : DEVICE_EVENT_TRANSFER_ERROR, nullptr, 0);
    }
    ReadFinished();
}

void USBDevice::HandleReadTransfer(struct libusb_transfer *transfer)
{
    BTUSB_LOG;

    USBDevice *device = static_cast<USBDevice*>(transfer->user_data);

    switch (transfer->status) {
        case LIBUSB_TRANSFER_COMPLETED:
            if (transfer->actual_length > 0 && device->m_running.load()) {
                device->m_eventCallback(DEVICE_EVENT_DATA, transfer->buffer, static_cast<size_t>(transfer->actual_length));
            }
            device->ResubmitRead(transfer);
            break;
        case LIBUSB_TRANSFER_TIMED_OUT:
            device->ResubmitRead(transfer);
            break;
        case LIBUSB_TRANSFER_CANCELLED:
            log(BTUSB_LOG_LEVEL_DEBUG) << "Bulk read transfer cancelled" << endLog;
            device->ReadFinished();
            break;
        case LIBUSB_TRANSFER_NO_DEVICE:
            log(BTUSB_LOG_LEVEL_INFO) << "Device is no longer there during transfer" << endLog;
            if (device->m_running.load()) {
                device->m_eventCallback(DEVICE_EVENT_NO_DEVICE, nullptr, 0);
            }
            device->ReadFinished();
            break;
        default:
            log(BTUSB_LOG_LEVEL_ERROR) << "Bulk read transfer failed with status " << transfer->status << endLog;
            if (device->m_running.load()) {
                device->m_eventCallback(DEVICE_EVENT_TRANSFER_ERROR, nullptr, 0);
            }
            device->ReadFinished();
            break;
    }
}
