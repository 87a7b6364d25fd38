#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

// Collects callback invocations made on the monitor's worker thread
class EventRecorder {
public:
    void OnConnection(int connected)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_connections.push_back(connected);
        m_cv.notify_all();
    }

    void OnData(const uint8_t *data, size_t size)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_data.insert(m_data.end(), data, data + size);
        m_chunks.push_back(size);
        m_cv.notify_all();
    }

    void OnLog(const std::string &message)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_logs.push_back(message);
        m_cv.notify_all();
    }

    bool WaitForConnections(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(2))
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [this, count] { return m_connections.size() >= count; });
    }

    bool WaitForData(size_t bytes, std::chrono::milliseconds timeout = std::chrono::seconds(2))
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [this, bytes] { return m_data.size() >= bytes; });
    }

    bool WaitForLog(const std::string &fragment, std::chrono::milliseconds timeout = std::chrono::seconds(2))
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [this, &fragment] { return ContainsLog(fragment); });
    }

    bool HasLog(const std::string &fragment)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return ContainsLog(fragment);
    }

    std::vector<int> Connections()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_connections;
    }

    std::string DataText()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::string(m_data.begin(), m_data.end());
    }

    std::vector<size_t> DataChunks()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_chunks;
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<int> m_connections;
    std::vector<uint8_t> m_data;
    std::vector<size_t> m_chunks;
    std::vector<std::string> m_logs;

    bool ContainsLog(const std::string &fragment) const
    {
        for (const auto &message : m_logs) {
            if (message.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }
};
