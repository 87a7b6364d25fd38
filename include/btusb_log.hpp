#pragma once

#include <atomic>
#include <fstream>
#include <ios>
#include <mutex>
#include <sstream>
#include <string>

enum BTUSBLogLevel {
    BTUSB_LOG_LEVEL_DEBUG,
    BTUSB_LOG_LEVEL_INFO,
    BTUSB_LOG_LEVEL_WARNING,
    BTUSB_LOG_LEVEL_ERROR,
    BTUSB_LOG_LEVEL_NONE,
};

const char *BTUSBLogLevelToString(BTUSBLogLevel level);
bool BTUSBLogLevelFromString(const std::string &name, BTUSBLogLevel &level);

class BTUSBLogStore {
public:
    static BTUSBLogStore &getInstance();

    // Empty logPath keeps output on std::clog
    void Open(const std::string &logPath, BTUSBLogLevel minLogLevel);
    void Close();

    bool IsEnabled(BTUSBLogLevel level) const;
    void Write(BTUSBLogLevel level, const char *function, const std::string &message);

private:
    BTUSBLogStore() = default;

    std::mutex m_mutex;
    std::ofstream m_logFile;
    std::atomic<int> m_minLogLevel{BTUSB_LOG_LEVEL_WARNING};
};

struct BTUSBEndLog {};
extern const BTUSBEndLog endLog;

class BTUSBLog {
public:
    explicit BTUSBLog(const char *function) : m_function{function}
    {}
    ~BTUSBLog();

    BTUSBLog &operator()(BTUSBLogLevel level)
    {
        m_level = level;
        return *this;
    }

    template <typename T>
    BTUSBLog &operator<<(const T &value)
    {
        if (BTUSBLogStore::getInstance().IsEnabled(m_level)) {
            m_stream << value;
        }
        return *this;
    }

    BTUSBLog &operator<<(std::ios_base &(*manipulator)(std::ios_base &))
    {
        manipulator(m_stream);
        return *this;
    }

    BTUSBLog &operator<<(const BTUSBEndLog &);

private:
    const char *m_function;
    BTUSBLogLevel m_level = BTUSB_LOG_LEVEL_DEBUG;
    std::ostringstream m_stream;
};

#define BTUSB_LOG BTUSBLog log(__func__)
