#include <exception>
#include <memory>
#include <mutex>
#include <new>
#include <string>

#include "busytag_usb_driver.h"
#include "busytag_monitor.hpp"
#include "driver_config.hpp"
#include "handle_registry.hpp"
#include "btusb_log.hpp"

static std::once_flag g_configOnce;
static DriverConfig g_config;

static const DriverConfig &GetDriverConfig()
{
    std::call_once(g_configOnce, [] {
        g_config = DriverConfig::FromEnvironment();
        BTUSBLogStore::getInstance().Open(g_config.logPath, g_config.logLevel);
    });

    return g_config;
}

static uintptr_t HandleToken(btusb_handle_t handle)
{
    return reinterpret_cast<uintptr_t>(handle);
}

static std::shared_ptr<BusyTagMonitor> LookupMonitor(btusb_handle_t handle)
{
    if (handle == nullptr) {
        return nullptr;
    }

    return HandleRegistry::getInstance().Lookup(HandleToken(handle));
}

// Used from catch blocks, so nothing may escape from here
static void ReportFailure(const std::shared_ptr<BusyTagMonitor> &monitor, const char *function, const char *what)
{
    BTUSBLog log(function);

    log(BTUSB_LOG_LEVEL_ERROR) << "Unexpected failure: " << what << endLog;

    if (!monitor) {
        return;
    }

    try {
        monitor->ReportError(std::string("ERROR: ") + function + " failed: " + what);
    } catch (const std::exception &e) {
        log(BTUSB_LOG_LEVEL_ERROR) << "Could not forward failure: " << e.what() << endLog;
    }
}

btusb_handle_t btusb_create(void)
{
    BTUSB_LOG;

    try {
        const DriverConfig &config = GetDriverConfig();

        auto monitor = std::make_shared<BusyTagMonitor>(HandleRegistry::getInstance().CreateTransport(config), config);
        int ret = monitor->Init();
        if (ret < 0) {
            log(BTUSB_LOG_LEVEL_ERROR) << "Failed to initialize monitor: " << btusb_error_name(ret) << endLog;
            return nullptr;
        }

        uintptr_t token = HandleRegistry::getInstance().Insert(monitor);
        log(BTUSB_LOG_LEVEL_DEBUG) << "Created handle " << token << endLog;

        return reinterpret_cast<btusb_handle_t>(token);
    } catch (const std::exception &e) {
        ReportFailure(nullptr, __func__, e.what());
    } catch (...) {
        ReportFailure(nullptr, __func__, "unknown exception");
    }

    return nullptr;
}

void btusb_destroy(btusb_handle_t handle)
{
    BTUSB_LOG;

    std::shared_ptr<BusyTagMonitor> monitor;
    try {
        if (handle == nullptr) {
            return;
        }

        monitor = HandleRegistry::getInstance().Remove(HandleToken(handle));
        if (!monitor) {
            log(BTUSB_LOG_LEVEL_DEBUG) << "Handle " << HandleToken(handle) << " already destroyed" << endLog;
            return;
        }

        monitor->Shutdown();
        log(BTUSB_LOG_LEVEL_DEBUG) << "Destroyed handle " << HandleToken(handle) << endLog;
    } catch (const std::exception &e) {
        ReportFailure(nullptr, __func__, e.what());
    } catch (...) {
        ReportFailure(nullptr, __func__, "unknown exception");
    }
}

void btusb_start_monitoring(btusb_handle_t handle)
{
    std::shared_ptr<BusyTagMonitor> monitor;
    try {
        monitor = LookupMonitor(handle);
        if (monitor) {
            monitor->StartMonitoring();
        }
    } catch (const std::exception &e) {
        ReportFailure(monitor, __func__, e.what());
    } catch (...) {
        ReportFailure(monitor, __func__, "unknown exception");
    }
}

void btusb_stop_monitoring(btusb_handle_t handle)
{
    std::shared_ptr<BusyTagMonitor> monitor;
    try {
        monitor = LookupMonitor(handle);
        if (monitor) {
            monitor->StopMonitoring();
        }
    } catch (const std::exception &e) {
        ReportFailure(monitor, __func__, e.what());
    } catch (...) {
        ReportFailure(monitor, __func__, "unknown exception");
    }
}

int32_t btusb_is_connected(btusb_handle_t handle)
{
    std::shared_ptr<BusyTagMonitor> monitor;
    try {
        monitor = LookupMonitor(handle);
        if (monitor) {
            return monitor->IsConnected() ? 1 : 0;
        }
    } catch (const std::exception &e) {
        ReportFailure(monitor, __func__, e.what());
    } catch (...) {
        ReportFailure(monitor, __func__, "unknown exception");
    }

    return 0;
}

int32_t btusb_is_device_present(btusb_handle_t handle)
{
    std::shared_ptr<BusyTagMonitor> monitor;
    try {
        monitor = LookupMonitor(handle);
        if (monitor) {
            return monitor->IsDevicePresent() ? 1 : 0;
        }
    } catch (const std::exception &e) {
        ReportFailure(monitor, __func__, e.what());
    } catch (...) {
        ReportFailure(monitor, __func__, "unknown exception");
    }

    return 0;
}

int32_t btusb_send(btusb_handle_t handle, const uint8_t *data, int32_t length)
{
    std::shared_ptr<BusyTagMonitor> monitor;
    try {
        monitor = LookupMonitor(handle);
        if (!monitor) {
            return BTUSB_ERROR_INVALID_HANDLE;
        }

        if (data == nullptr || length <= 0) {
            return BTUSB_ERROR_INVALID_ARGUMENT;
        }

        return monitor->Send(data, static_cast<size_t>(length));
    } catch (const std::bad_alloc &e) {
        ReportFailure(monitor, __func__, e.what());
        return BTUSB_ERROR_ALLOCATION;
    } catch (const std::exception &e) {
        ReportFailure(monitor, __func__, e.what());
    } catch (...) {
        ReportFailure(monitor, __func__, "unknown exception");
    }

    return BTUSB_ERROR_INTERNAL;
}

int32_t btusb_send_string(btusb_handle_t handle, const char *str)
{
    std::shared_ptr<BusyTagMonitor> monitor;
    try {
        monitor = LookupMonitor(handle);
        if (!monitor) {
            return BTUSB_ERROR_INVALID_HANDLE;
        }

        if (str == nullptr || str[0] == '\0') {
            return BTUSB_ERROR_INVALID_ARGUMENT;
        }

        return monitor->SendString(str);
    } catch (const std::bad_alloc &e) {
        ReportFailure(monitor, __func__, e.what());
        return BTUSB_ERROR_ALLOCATION;
    } catch (const std::exception &e) {
        ReportFailure(monitor, __func__, e.what());
    } catch (...) {
        ReportFailure(monitor, __func__, "unknown exception");
    }

    return BTUSB_ERROR_INTERNAL;
}

int32_t btusb_send_command(btusb_handle_t handle, const char *str)
{
    std::shared_ptr<BusyTagMonitor> monitor;
    try {
        monitor = LookupMonitor(handle);
        if (!monitor) {
            return BTUSB_ERROR_INVALID_HANDLE;
        }

        if (str == nullptr || str[0] == '\0') {
            return BTUSB_ERROR_INVALID_ARGUMENT;
        }

        return monitor->SendCommand(str);
    } catch (const std::bad_alloc &e) {
        ReportFailure(monitor, __func__, e.what());
        return BTUSB_ERROR_ALLOCATION;
    } catch (const std::exception &e) {
        ReportFailure(monitor, __func__, e.what());
    } catch (...) {
        ReportFailure(monitor, __func__, "unknown exception");
    }

    return BTUSB_ERROR_INTERNAL;
}

void btusb_set_data_callback(btusb_handle_t handle, btusb_data_callback_t callback, void *context)
{
    std::shared_ptr<BusyTagMonitor> monitor;
    try {
        monitor = LookupMonitor(handle);
        if (!monitor) {
            return;
        }

        if (callback == nullptr) {
            monitor->SetDataCallback(nullptr);
            return;
        }

        monitor->SetDataCallback([callback, context](const uint8_t *data, size_t size) {
            callback(data, static_cast<int32_t>(size), context);
        });
    } catch (const std::exception &e) {
        ReportFailure(monitor, __func__, e.what());
    } catch (...) {
        ReportFailure(monitor, __func__, "unknown exception");
    }
}

void btusb_set_connection_callback(btusb_handle_t handle, btusb_connection_callback_t callback, void *context)
{
    std::shared_ptr<BusyTagMonitor> monitor;
    try {
        monitor = LookupMonitor(handle);
        if (!monitor) {
            return;
        }

        if (callback == nullptr) {
            monitor->SetConnectionCallback(nullptr);
            return;
        }

        monitor->SetConnectionCallback([callback, context](int connected) {
            callback(static_cast<int32_t>(connected), context);
        });
    } catch (const std::exception &e) {
        ReportFailure(monitor, __func__, e.what());
    } catch (...) {
        ReportFailure(monitor, __func__, "unknown exception");
    }
}

void btusb_set_log_callback(btusb_handle_t handle, btusb_log_callback_t callback, void *context)
{
    std::shared_ptr<BusyTagMonitor> monitor;
    try {
        monitor = LookupMonitor(handle);
        if (!monitor) {
            return;
        }

        if (callback == nullptr) {
            monitor->SetLogCallback(nullptr);
            return;
        }

        monitor->SetLogCallback([callback, context](const std::string &message) {
            callback(message.c_str(), context);
        });
    } catch (const std::exception &e) {
        ReportFailure(monitor, __func__, e.what());
    } catch (...) {
        ReportFailure(monitor, __func__, "unknown exception");
    }
}

const char *btusb_error_name(int32_t error)
{
    switch (error) {
        case BTUSB_SUCCESS:
            return "BTUSB_SUCCESS";
        case BTUSB_ERROR_INVALID_HANDLE:
            return "BTUSB_ERROR_INVALID_HANDLE";
        case BTUSB_ERROR_INVALID_ARGUMENT:
            return "BTUSB_ERROR_INVALID_ARGUMENT";
        case BTUSB_ERROR_NO_SESSION:
            return "BTUSB_ERROR_NO_SESSION";
        case BTUSB_ERROR_TRANSFER:
            return "BTUSB_ERROR_TRANSFER";
        case BTUSB_ERROR_ALLOCATION:
            return "BTUSB_ERROR_ALLOCATION";
        case BTUSB_ERROR_INTERNAL:
            return "BTUSB_ERROR_INTERNAL";
        default:
            return "BTUSB_ERROR_UNKNOWN";
    }
}
