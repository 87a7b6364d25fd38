#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

// Holds the data, connection and log callbacks of one monitor. A slot is
// replaced as a whole under m_mutex; invocation copies the slot and calls it
// with no lock held so a callback may re-enter the driver.
class CallbackDispatcher {
public:
    using DataCallback = std::function<void(const uint8_t *data, size_t size)>;
    using ConnectionCallback = std::function<void(int connected)>;
    using LogCallback = std::function<void(const std::string &message)>;

    CallbackDispatcher() = default;
    ~CallbackDispatcher();

    void SetDataCallback(DataCallback dataCallback);
    void SetConnectionCallback(ConnectionCallback connectionCallback);
    void SetLogCallback(LogCallback logCallback);

    void DispatchData(const uint8_t *data, size_t size);
    void DispatchConnection(int connected);
    void DispatchLog(const std::string &message);

    // Drops all registrations and blocks until invocations running on other
    // threads have returned. Later dispatches are discarded.
    void Close();
    bool IsClosed();

private:
    std::mutex m_mutex;
    std::condition_variable m_idleCV;
    int m_inFlight = 0;
    bool m_closed = false;

    DataCallback m_dataCallback;
    ConnectionCallback m_connectionCallback;
    LogCallback m_logCallback;

    class InvocationScope {
    public:
        explicit InvocationScope(CallbackDispatcher *dispatcher);
        ~InvocationScope();

    private:
        CallbackDispatcher *m_dispatcher;
    };

    template <typename Callback, typename... Args>
    void Dispatch(const Callback &slot, Args &&...args);
};
