#include <utility>

#include "handle_registry.hpp"

HandleRegistry &HandleRegistry::getInstance()
{
    static HandleRegistry instance;
    return instance;
}

uintptr_t HandleRegistry::Insert(std::shared_ptr<BusyTagMonitor> monitor)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    uintptr_t token = m_nextToken++;
    m_monitors.emplace(token, std::move(monitor));

    return token;
}

std::shared_ptr<BusyTagMonitor> HandleRegistry::Lookup(uintptr_t token)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_monitors.find(token);
    if (it == m_monitors.end()) {
        return nullptr;
    }

    return it->second;
}

std::shared_ptr<BusyTagMonitor> HandleRegistry::Remove(uintptr_t token)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_monitors.find(token);
    if (it == m_monitors.end()) {
        return nullptr;
    }

    std::shared_ptr<BusyTagMonitor> monitor = std::move(it->second);
    m_monitors.erase(it);

    return monitor;
}

size_t HandleRegistry::Size()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_monitors.size();
}

void HandleRegistry::SetTransportFactory(TransportFactory transportFactory)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_transportFactory = std::move(transportFactory);
}

std::unique_ptr<Transport> HandleRegistry::CreateTransport(const DriverConfig &config)
{
    TransportFactory transportFactory;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        transportFactory = m_transportFactory;
    }

    if (!transportFactory) {
        return CreateUSBTransport(config);
    }

    return transportFactory(config);
}
