#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "driver_config.hpp"

enum BusyTagMonitorState {
    BUSYTAG_MONITOR_STATE_IDLE,
    BUSYTAG_MONITOR_STATE_MONITORING,
};

class Transport;

class BusyTagMonitor {
public:
    explicit BusyTagMonitor(const DriverConfig &config = DriverConfig());
    BusyTagMonitor(std::unique_ptr<Transport> transport, const DriverConfig &config = DriverConfig());
    ~BusyTagMonitor();

    BusyTagMonitor(const BusyTagMonitor &) = delete;
    BusyTagMonitor &operator=(const BusyTagMonitor &) = delete;

    int Init();
    void Shutdown();

    void StartMonitoring();
    void StopMonitoring();
    BusyTagMonitorState GetState() const;

    bool IsConnected() const;
    bool IsDevicePresent() const;

    // Each returns the number of bytes sent or a negative btusb_error
    int Send(const uint8_t *data, size_t size);
    int SendString(const std::string &str);
    int SendCommand(const std::string &command);

    void SetDataCallback(std::function<void(const uint8_t *data, size_t size)> dataCallback);
    void SetConnectionCallback(std::function<void(int connected)> connectionCallback);
    void SetLogCallback(std::function<void(const std::string &message)> logCallback);

    // Reports a failure that happened outside the driver's own threads
    void ReportError(const std::string &message);

private:
    class BusyTagMonitorImpl;
    std::shared_ptr<BusyTagMonitorImpl> pImpl;
};
