#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

#include "busytag_monitor.hpp"
#include "busytag_session.hpp"
#include "busytag_usb_driver.h"
#include "callback_dispatcher.hpp"
#include "device_matcher.hpp"
#include "transport.hpp"
#include "btusb_log.hpp"

class BusyTagMonitor::BusyTagMonitorImpl : public std::enable_shared_from_this<BusyTagMonitorImpl> {
public:
    BusyTagMonitorImpl(std::unique_ptr<Transport> transport, const DriverConfig &config)
        : m_config{config}, m_transport{std::move(transport)}
    {}

    ~BusyTagMonitorImpl()
    {
        BTUSB_LOG;

        log(BTUSB_LOG_LEVEL_DEBUG) << "Monitor released" << endLog;
    }

    int Init()
    {
        BTUSB_LOG;

        if (!m_transport) {
            log(BTUSB_LOG_LEVEL_ERROR) << "No USB transport" << endLog;
            return BTUSB_ERROR_ALLOCATION;
        }

        int ret = m_transport->Init(kBusyTagIdentity.vendorId, kBusyTagIdentity.productId);
        if (ret < 0) {
            log(BTUSB_LOG_LEVEL_ERROR) << "Failed to initialize USB transport: " << ret << endLog;
            return BTUSB_ERROR_ALLOCATION;
        }

        std::lock_guard<std::mutex> lock(m_eventMutex);
        m_workerRunning = true;
        // The worker keeps the monitor alive until it exits, which lets a
        // callback shut its own monitor down
        m_worker = std::thread([self = shared_from_this()] {
            self->WorkerThread();
        });

        return 0;
    }

    void Shutdown()
    {
        BTUSB_LOG;

        if (m_shutdown.exchange(true)) {
            return;
        }

        RunOnWorker([this] { StopMonitoringOnWorker(); });

        m_dispatcher.Close();

        std::deque<MonitorEvent> pending;
        {
            std::lock_guard<std::mutex> lock(m_eventMutex);
            m_workerRunning = false;
            pending.swap(m_events);
            m_eventCV.notify_all();
        }
        // Devices still queued must be released before libusb goes away
        pending.clear();

        if (m_worker.joinable()) {
            if (IsOnWorker()) {
                m_worker.detach();
            } else {
                m_worker.join();
            }
        }

        std::lock_guard<std::mutex> lock(m_transportMutex);
        if (m_transport) {
            m_transport->Shutdown();
        }
        m_transportShutdown = true;
    }

    void StartMonitoring()
    {
        if (m_shutdown.load()) {
            return;
        }

        RunOnWorker([this] { StartMonitoringOnWorker(); });
    }

    void StopMonitoring()
    {
        if (m_shutdown.load()) {
            return;
        }

        RunOnWorker([this] { StopMonitoringOnWorker(); });
    }

    BusyTagMonitorState GetState() const
    {
        return m_state.load();
    }

    bool IsConnected() const
    {
        std::lock_guard<std::mutex> lock(m_sessionMutex);
        return m_session && m_session->IsHealthy();
    }

    bool IsDevicePresent()
    {
        std::lock_guard<std::mutex> lock(m_transportMutex);
        if (m_transportShutdown || !m_transport) {
            return false;
        }

        return m_transport->IsDevicePresent();
    }

    int Send(const uint8_t *data, size_t size)
    {
        BTUSB_LOG;

        if (data == nullptr || size == 0) {
            return BTUSB_ERROR_INVALID_ARGUMENT;
        }

        if (size > m_config.maxSendLength) {
            std::ostringstream os;
            os << "ERROR: Send of " << size << " bytes exceeds the " << m_config.maxSendLength << " byte limit";
            Log(BTUSB_LOG_LEVEL_ERROR, os.str());
            return BTUSB_ERROR_INVALID_ARGUMENT;
        }

        std::shared_ptr<BusyTagSession> session;
        {
            std::lock_guard<std::mutex> lock(m_sessionMutex);
            session = m_session;
        }

        if (!session || !session->IsHealthy()) {
            Log(BTUSB_LOG_LEVEL_WARNING, "ERROR: Not connected - cannot send data");
            return BTUSB_ERROR_NO_SESSION;
        }

        int ret = session->Send(data, size);
        if (ret < 0) {
            std::ostringstream os;
            os << "ERROR: Bulk write of " << size << " bytes failed: " << btusb_error_name(ret);
            Log(BTUSB_LOG_LEVEL_ERROR, os.str());
            return ret;
        }

        log(BTUSB_LOG_LEVEL_DEBUG) << "Sent " << ret << " bytes" << endLog;

        return ret;
    }

    void SetDataCallback(CallbackDispatcher::DataCallback dataCallback)
    {
        m_dispatcher.SetDataCallback(std::move(dataCallback));
    }

    void SetConnectionCallback(CallbackDispatcher::ConnectionCallback connectionCallback)
    {
        m_dispatcher.SetConnectionCallback(std::move(connectionCallback));
    }

    void SetLogCallback(CallbackDispatcher::LogCallback logCallback)
    {
        m_dispatcher.SetLogCallback(std::move(logCallback));
    }

    void Log(BTUSBLogLevel level, const std::string &message)
    {
        BTUSB_LOG;

        log(level) << message << endLog;

        if (IsOnWorker()) {
            m_dispatcher.DispatchLog(message);
        } else {
            MonitorEvent event{MonitorEvent::EVENT_LOG};
            event.message = message;
            Post(std::move(event));
        }
    }

private:
    struct MonitorEvent {
        enum Type {
            EVENT_DEVICE_ARRIVED,
            EVENT_DEVICE_LEFT,
            EVENT_SESSION_DATA,
            EVENT_SESSION_NO_DEVICE,
            EVENT_SESSION_ERROR,
            EVENT_LOG,
            EVENT_COMMAND,
        };

        Type type;
        std::unique_ptr<Device> device;
        uint64_t sessionId = 0;
        std::vector<uint8_t> data;
        std::string message;
        std::function<void()> command;
    };

    DriverConfig m_config;
    std::unique_ptr<Transport> m_transport;
    std::mutex m_transportMutex;
    bool m_transportShutdown = false;
    CallbackDispatcher m_dispatcher;

    std::atomic<BusyTagMonitorState> m_state{BUSYTAG_MONITOR_STATE_IDLE};
    std::atomic<bool> m_shutdown{false};

    mutable std::mutex m_sessionMutex;
    std::shared_ptr<BusyTagSession> m_session;
    uint64_t m_nextSessionId = 0;

    std::thread m_worker;
    std::atomic<std::thread::id> m_workerId{};
    std::deque<MonitorEvent> m_events;
    std::mutex m_eventMutex;
    std::condition_variable m_eventCV;
    bool m_workerRunning = false;

    bool IsOnWorker() const
    {
        return m_workerId.load() == std::this_thread::get_id();
    }

    bool Post(MonitorEvent event)
    {
        std::lock_guard<std::mutex> lock(m_eventMutex);
        if (!m_workerRunning) {
            return false;
        }

        m_events.push_back(std::move(event));
        m_eventCV.notify_one();

        return true;
    }

    // Runs a state change on the worker and waits for it. Called from the
    // worker itself (inside a callback) the command runs inline.
    void RunOnWorker(std::function<void()> command)
    {
        BTUSB_LOG;

        if (IsOnWorker()) {
            command();
            return;
        }

        auto task = std::make_shared<std::packaged_task<void()>>(std::move(command));
        std::future<void> result = task->get_future();

        MonitorEvent event{MonitorEvent::EVENT_COMMAND};
        event.command = [task] { (*task)(); };
        if (!Post(std::move(event))) {
            return;
        }

        try {
            result.get();
        } catch (const std::future_error &e) {
            // The worker stopped before reaching the command
            log(BTUSB_LOG_LEVEL_DEBUG) << "Command dropped: " << e.what() << endLog;
        }
    }

    void WorkerThread()
    {
        BTUSB_LOG;

        m_workerId.store(std::this_thread::get_id());

        while (true) {
            MonitorEvent event{MonitorEvent::EVENT_LOG};
            {
                std::unique_lock<std::mutex> lock(m_eventMutex);
                m_eventCV.wait(lock, [this] { return !m_workerRunning || !m_events.empty(); });
                if (!m_workerRunning) {
                    break;
                }

                event = std::move(m_events.front());
                m_events.pop_front();
            }

            try {
                HandleEvent(event);
            } catch (const std::exception &e) {
                log(BTUSB_LOG_LEVEL_ERROR) << "Failed to handle monitor event " << event.type << ": " << e.what() << endLog;
            }
        }

        log(BTUSB_LOG_LEVEL_DEBUG) << "Worker thread exiting" << endLog;
    }

    void HandleEvent(MonitorEvent &event)
    {
        switch (event.type) {
            case MonitorEvent::EVENT_DEVICE_ARRIVED:
                HandleDeviceArrived(std::move(event.device));
                break;
            case MonitorEvent::EVENT_DEVICE_LEFT:
                HandleDeviceLeft(event.device->GetUSBPath());
                break;
            case MonitorEvent::EVENT_SESSION_DATA:
                HandleSessionData(event.sessionId, event.data);
                break;
            case MonitorEvent::EVENT_SESSION_NO_DEVICE:
                HandleSessionFailure(event.sessionId, "USB read terminated - device disconnected");
                break;
            case MonitorEvent::EVENT_SESSION_ERROR:
                HandleSessionFailure(event.sessionId, "USB read error - closing connection");
                break;
            case MonitorEvent::EVENT_LOG:
                m_dispatcher.DispatchLog(event.message);
                break;
            case MonitorEvent::EVENT_COMMAND:
                event.command();
                break;
        }
    }

    void StartMonitoringOnWorker()
    {
        BTUSB_LOG;

        // A start that raced with Shutdown may still reach the worker after its stop
        if (m_shutdown.load() || m_state.load() == BUSYTAG_MONITOR_STATE_MONITORING) {
            return;
        }

        int ret = m_transport->StartMonitoring([this](Transport::HotplugEvent hotplugEvent, std::unique_ptr<Device> device) {
            OnHotplugEvent(hotplugEvent, std::move(device));
        });
        if (ret < 0) {
            std::ostringstream os;
            os << "ERROR: Could not start USB device monitoring (" << ret << ")";
            Log(BTUSB_LOG_LEVEL_ERROR, os.str());
            return;
        }

        m_state.store(BUSYTAG_MONITOR_STATE_MONITORING);

        std::ostringstream os;
        os << "Monitoring for USB device VID:0x" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
            << kBusyTagIdentity.vendorId << " PID:0x" << std::setw(4) << kBusyTagIdentity.productId;
        Log(BTUSB_LOG_LEVEL_INFO, os.str());
    }

    void StopMonitoringOnWorker()
    {
        BTUSB_LOG;

        if (m_state.load() == BUSYTAG_MONITOR_STATE_IDLE) {
            return;
        }

        // The transport's event thread must still run while the read transfer is cancelled
        TeardownSession("Monitoring stopped - connection closed");
        m_transport->StopMonitoring();

        m_state.store(BUSYTAG_MONITOR_STATE_IDLE);
        Log(BTUSB_LOG_LEVEL_INFO, "Stopped monitoring for USB devices");
    }

    void OnHotplugEvent(Transport::HotplugEvent hotplugEvent, std::unique_ptr<Device> device)
    {
        BTUSB_LOG;

        if (!device) {
            return;
        }

        MonitorEvent event{hotplugEvent == Transport::HOTPLUG_EVENT_ARRIVED ?
            MonitorEvent::EVENT_DEVICE_ARRIVED : MonitorEvent::EVENT_DEVICE_LEFT};
        event.device = std::move(device);
        if (!Post(std::move(event))) {
            log(BTUSB_LOG_LEVEL_DEBUG) << "Hotplug event after shutdown dropped" << endLog;
        }
    }

    void OnSessionEvent(uint64_t sessionId, Device::DeviceEvent deviceEvent, const uint8_t *buf, size_t size)
    {
        MonitorEvent event{MonitorEvent::EVENT_SESSION_DATA};
        event.sessionId = sessionId;

        if (deviceEvent == Device::DEVICE_EVENT_DATA) {
            event.data.assign(buf, buf + size);
        } else if (deviceEvent == Device::DEVICE_EVENT_NO_DEVICE) {
            event.type = MonitorEvent::EVENT_SESSION_NO_DEVICE;
        } else {
            event.type = MonitorEvent::EVENT_SESSION_ERROR;
        }

        Post(std::move(event));
    }

    void HandleDeviceArrived(std::unique_ptr<Device> device)
    {
        BTUSB_LOG;

        const std::string usbPath = device->GetUSBPath();

        if (m_state.load() != BUSYTAG_MONITOR_STATE_MONITORING) {
            log(BTUSB_LOG_LEVEL_DEBUG) << "Not monitoring, ignoring device at " << usbPath << endLog;
            return;
        }

        std::string connectedPath;
        {
            std::lock_guard<std::mutex> lock(m_sessionMutex);
            if (m_session) {
                connectedPath = m_session->GetUSBPath();
            }
        }

        if (!connectedPath.empty()) {
            Log(BTUSB_LOG_LEVEL_INFO, "Ignoring BusyTag device at " + usbPath + ": already connected to " + connectedPath);
            return;
        }

        Log(BTUSB_LOG_LEVEL_INFO, "USB device appeared at " + usbPath + " - opening bulk interface...");

        uint64_t sessionId = ++m_nextSessionId;
        auto session = std::make_shared<BusyTagSession>(std::move(device), sessionId, m_config);
        int ret = session->Open([this, sessionId](Device::DeviceEvent event, const uint8_t *buf, size_t size) {
            OnSessionEvent(sessionId, event, buf, size);
        });
        if (ret < 0) {
            std::ostringstream os;
            os << "ERROR: Could not open BusyTag device at " << usbPath << " (" << ret << ")";
            Log(BTUSB_LOG_LEVEL_ERROR, os.str());
            return;
        }

        {
            std::lock_guard<std::mutex> lock(m_sessionMutex);
            m_session = session;
        }

        Log(BTUSB_LOG_LEVEL_INFO, "Connected to BusyTag device at " + usbPath);
        m_dispatcher.DispatchConnection(1);
    }

    void HandleDeviceLeft(const std::string &usbPath)
    {
        BTUSB_LOG;

        bool matches;
        {
            std::lock_guard<std::mutex> lock(m_sessionMutex);
            matches = m_session && m_session->GetUSBPath() == usbPath;
        }

        if (!matches) {
            log(BTUSB_LOG_LEVEL_DEBUG) << "Device at " << usbPath << " left, no session on it" << endLog;
            return;
        }

        TeardownSession("USB device removed");
        RescanDevices();
    }

    void HandleSessionData(uint64_t sessionId, const std::vector<uint8_t> &data)
    {
        {
            std::lock_guard<std::mutex> lock(m_sessionMutex);
            if (!m_session || m_session->GetId() != sessionId) {
                return;
            }
        }

        m_dispatcher.DispatchData(data.data(), data.size());
    }

    void HandleSessionFailure(uint64_t sessionId, const std::string &reason)
    {
        {
            std::lock_guard<std::mutex> lock(m_sessionMutex);
            if (!m_session || m_session->GetId() != sessionId) {
                return;
            }
        }

        TeardownSession(reason);
        RescanDevices();
    }

    // Hotplug only reports changes, so a device that was ignored while the
    // session was up has to be asked for again
    void RescanDevices()
    {
        BTUSB_LOG;

        if (m_shutdown.load() || m_state.load() != BUSYTAG_MONITOR_STATE_MONITORING) {
            return;
        }

        log(BTUSB_LOG_LEVEL_DEBUG) << "Rescanning for BusyTag devices" << endLog;
        m_transport->Rescan();
    }

    void TeardownSession(const std::string &reason)
    {
        std::shared_ptr<BusyTagSession> session;
        {
            std::lock_guard<std::mutex> lock(m_sessionMutex);
            session.swap(m_session);
        }

        if (!session) {
            return;
        }

        session->Close();

        Log(BTUSB_LOG_LEVEL_INFO, reason);
        m_dispatcher.DispatchConnection(0);
    }
};

BusyTagMonitor::BusyTagMonitor(const DriverConfig &config)
    : pImpl{std::make_shared<BusyTagMonitorImpl>(CreateUSBTransport(config), config)}
{}

BusyTagMonitor::BusyTagMonitor(std::unique_ptr<Transport> transport, const DriverConfig &config)
    : pImpl{std::make_shared<BusyTagMonitorImpl>(std::move(transport), config)}
{}

BusyTagMonitor::~BusyTagMonitor()
{
    pImpl->Shutdown();
}

int BusyTagMonitor::Init()
{
    return pImpl->Init();
}

void BusyTagMonitor::Shutdown()
{
    pImpl->Shutdown();
}

void BusyTagMonitor::StartMonitoring()
{
    pImpl->StartMonitoring();
}

void BusyTagMonitor::StopMonitoring()
{
    pImpl->StopMonitoring();
}

BusyTagMonitorState BusyTagMonitor::GetState() const
{
    return pImpl->GetState();
}

bool BusyTagMonitor::IsConnected() const
{
    return pImpl->IsConnected();
}

bool BusyTagMonitor::IsDevicePresent() const
{
    return pImpl->IsDevicePresent();
}

int BusyTagMonitor::Send(const uint8_t *data, size_t size)
{
    return pImpl->Send(data, size);
}

int BusyTagMonitor::SendString(const std::string &str)
{
    return pImpl->Send(reinterpret_cast<const uint8_t *>(str.data()), str.size());
}

int BusyTagMonitor::SendCommand(const std::string &command)
{
    if (command.empty()) {
        return BTUSB_ERROR_INVALID_ARGUMENT;
    }

    return SendString(command + "\r\n");
}

void BusyTagMonitor::SetDataCallback(std::function<void(const uint8_t *data, size_t size)> dataCallback)
{
    pImpl->SetDataCallback(std::move(dataCallback));
}

void BusyTagMonitor::SetConnectionCallback(std::function<void(int connected)> connectionCallback)
{
    pImpl->SetConnectionCallback(std::move(connectionCallback));
}

void BusyTagMonitor::SetLogCallback(std::function<void(const std::string &message)> logCallback)
{
    pImpl->SetLogCallback(std::move(logCallback));
}

void BusyTagMonitor::ReportError(const std::string &message)
{
    pImpl->Log(BTUSB_LOG_LEVEL_ERROR, message);
}
