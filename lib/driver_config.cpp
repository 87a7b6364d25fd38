#include <cstdlib>
#include <cerrno>
#include <string>

#include "driver_config.hpp"
#include "btusb_log.hpp"
#include "utils.hpp"

static bool ParseFlag(const std::string &name, const std::string &value, bool &flag)
{
    BTUSB_LOG;

    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        flag = true;
    } else if (value == "0" || value == "false" || value == "no" || value == "off") {
        flag = false;
    } else {
        log(BTUSB_LOG_LEVEL_WARNING) << "Ignoring invalid value for " << name << ": '" << value << "'" << endLog;
        return false;
    }

    return true;
}

static bool ParseMilliseconds(const std::string &name, const std::string &value, unsigned int &milliseconds)
{
    BTUSB_LOG;

    char *end = nullptr;
    errno = 0;
    unsigned long parsed = std::strtoul(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || *end != '\0' || parsed == 0 || parsed > 600000) {
        log(BTUSB_LOG_LEVEL_WARNING) << "Ignoring invalid value for " << name << ": '" << value << "'" << endLog;
        return false;
    }

    milliseconds = static_cast<unsigned int>(parsed);
    return true;
}

DriverConfig DriverConfig::FromEnvironment()
{
    BTUSB_LOG;

    DriverConfig config;
    std::string value;

    value = GetEnvironmentValue("BTUSB_LOG_LEVEL");
    if (!value.empty() && !BTUSBLogLevelFromString(value, config.logLevel)) {
        log(BTUSB_LOG_LEVEL_WARNING) << "Ignoring invalid value for BTUSB_LOG_LEVEL: '" << value << "'" << endLog;
    }

    config.logPath = GetEnvironmentValue("BTUSB_LOG_FILE");

    value = GetEnvironmentValue("BTUSB_USB_DEBUG");
    if (!value.empty()) {
        ParseFlag("BTUSB_USB_DEBUG", value, config.usbDebug);
    }

    value = GetEnvironmentValue("BTUSB_FORCE_POLLING");
    if (!value.empty()) {
        ParseFlag("BTUSB_FORCE_POLLING", value, config.forcePolling);
    }

    value = GetEnvironmentValue("BTUSB_POLL_INTERVAL_MS");
    if (!value.empty()) {
        ParseMilliseconds("BTUSB_POLL_INTERVAL_MS", value, config.pollIntervalMs);
    }

    value = GetEnvironmentValue("BTUSB_WRITE_TIMEOUT_MS");
    if (!value.empty()) {
        ParseMilliseconds("BTUSB_WRITE_TIMEOUT_MS", value, config.writeTimeoutMs);
    }

    return config;
}
