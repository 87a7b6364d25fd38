#include <algorithm>
#include <exception>
#include <utility>
#include <vector>

#include "callback_dispatcher.hpp"
#include "btusb_log.hpp"

// Dispatchers currently invoking a callback on this thread
static thread_local std::vector<const CallbackDispatcher *> t_dispatching;

CallbackDispatcher::~CallbackDispatcher()
{
    Close();
}

void CallbackDispatcher::SetDataCallback(DataCallback dataCallback)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_closed) {
        m_dataCallback = std::move(dataCallback);
    }
}

void CallbackDispatcher::SetConnectionCallback(ConnectionCallback connectionCallback)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_closed) {
        m_connectionCallback = std::move(connectionCallback);
    }
}

void CallbackDispatcher::SetLogCallback(LogCallback logCallback)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_closed) {
        m_logCallback = std::move(logCallback);
    }
}

CallbackDispatcher::InvocationScope::InvocationScope(CallbackDispatcher *dispatcher) : m_dispatcher{dispatcher}
{
    t_dispatching.push_back(m_dispatcher);
}

CallbackDispatcher::InvocationScope::~InvocationScope()
{
    t_dispatching.pop_back();

    std::lock_guard<std::mutex> lock(m_dispatcher->m_mutex);
    --m_dispatcher->m_inFlight;
    m_dispatcher->m_idleCV.notify_all();
}

template <typename Callback, typename... Args>
void CallbackDispatcher::Dispatch(const Callback &slot, Args &&...args)
{
    BTUSB_LOG;

    Callback callback;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed || !slot) {
            return;
        }
        callback = slot;
        ++m_inFlight;
    }

    InvocationScope scope(this);
    try {
        callback(std::forward<Args>(args)...);
    } catch (const std::exception &e) {
        log(BTUSB_LOG_LEVEL_ERROR) << "Callback threw: " << e.what() << endLog;
    }
}

void CallbackDispatcher::DispatchData(const uint8_t *data, size_t size)
{
    Dispatch(m_dataCallback, data, size);
}

void CallbackDispatcher::DispatchConnection(int connected)
{
    Dispatch(m_connectionCallback, connected);
}

void CallbackDispatcher::DispatchLog(const std::string &message)
{
    Dispatch(m_logCallback, message);
}

void CallbackDispatcher::Close()
{
    BTUSB_LOG;

    // A callback that closes its own dispatcher must not wait for itself
    int ownInvocations = static_cast<int>(std::count(t_dispatching.begin(), t_dispatching.end(), this));

    std::unique_lock<std::mutex> lock(m_mutex);
    m_closed = true;
    m_dataCallback = nullptr;
    m_connectionCallback = nullptr;
    m_logCallback = nullptr;

    m_idleCV.wait(lock, [this, ownInvocations] { return m_inFlight <= ownInvocations; });
}

bool CallbackDispatcher::IsClosed()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}
