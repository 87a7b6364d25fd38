#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "busytag_monitor.hpp"
#include "driver_config.hpp"
#include "transport.hpp"

// Maps the opaque handles given out by the C interface to monitors. Tokens
// start at 1 and are never reused, so a stale handle can not reach a newer
// monitor.
class HandleRegistry {
public:
    using TransportFactory = std::function<std::unique_ptr<Transport>(const DriverConfig &config)>;

    static HandleRegistry &getInstance();

    uintptr_t Insert(std::shared_ptr<BusyTagMonitor> monitor);
    std::shared_ptr<BusyTagMonitor> Lookup(uintptr_t token);
    std::shared_ptr<BusyTagMonitor> Remove(uintptr_t token);
    size_t Size();

    // An empty factory restores the libusb transport
    void SetTransportFactory(TransportFactory transportFactory);
    std::unique_ptr<Transport> CreateTransport(const DriverConfig &config);

private:
    HandleRegistry() = default;

    std::mutex m_mutex;
    std::unordered_map<uintptr_t, std::shared_ptr<BusyTagMonitor>> m_monitors;
    uintptr_t m_nextToken = 1;
    TransportFactory m_transportFactory;
};
