#pragma once

#include <cstddef>
#include <string>

#include "btusb_log.hpp"

struct DriverConfig {
    BTUSBLogLevel logLevel = BTUSB_LOG_LEVEL_WARNING;
    std::string logPath;
    bool usbDebug = false;

    // Use the polling thread even when libusb supports hotplug
    bool forcePolling = false;
    unsigned int pollIntervalMs = 1000;

    unsigned int writeTimeoutMs = 1000;
    size_t readBufferSize = 4096;
    size_t maxTransferSize = 16384;
    size_t maxSendLength = 1024 * 1024;

    static DriverConfig FromEnvironment();
};
