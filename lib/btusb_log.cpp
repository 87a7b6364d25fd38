#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

#include "btusb_log.hpp"

const BTUSBEndLog endLog{};

const char *BTUSBLogLevelToString(BTUSBLogLevel level)
{
    switch (level) {
        case BTUSB_LOG_LEVEL_DEBUG:
            return "DEBUG";
        case BTUSB_LOG_LEVEL_INFO:
            return "INFO";
        case BTUSB_LOG_LEVEL_WARNING:
            return "WARNING";
        case BTUSB_LOG_LEVEL_ERROR:
            return "ERROR";
        case BTUSB_LOG_LEVEL_NONE:
            return "NONE";
    }
    return "UNKNOWN";
}

bool BTUSBLogLevelFromString(const std::string &name, BTUSBLogLevel &level)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "debug") {
        level = BTUSB_LOG_LEVEL_DEBUG;
    } else if (lower == "info") {
        level = BTUSB_LOG_LEVEL_INFO;
    } else if (lower == "warning" || lower == "warn") {
        level = BTUSB_LOG_LEVEL_WARNING;
    } else if (lower == "error") {
        level = BTUSB_LOG_LEVEL_ERROR;
    } else if (lower == "none" || lower == "off") {
        level = BTUSB_LOG_LEVEL_NONE;
    } else {
        return false;
    }

    return true;
}

BTUSBLogStore &BTUSBLogStore::getInstance()
{
    static BTUSBLogStore instance;
    return instance;
}

void BTUSBLogStore::Open(const std::string &logPath, BTUSBLogLevel minLogLevel)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_logFile.is_open()) {
        m_logFile.close();
    }

    m_minLogLevel.store(minLogLevel);

    if (!logPath.empty()) {
        m_logFile.open(logPath, std::ios::out | std::ios::app);
        if (!m_logFile) {
            std::clog << "[ERROR] BTUSBLogStore: Failed to open log file " << logPath << std::endl;
        }
    }
}

void BTUSBLogStore::Close()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_logFile.is_open()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

bool BTUSBLogStore::IsEnabled(BTUSBLogLevel level) const
{
    return level != BTUSB_LOG_LEVEL_NONE && static_cast<int>(level) >= m_minLogLevel.load();
}

void BTUSBLogStore::Write(BTUSBLogLevel level, const char *function, const std::string &message)
{
    if (!IsEnabled(level)) {
        return;
    }

    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm localTime{};
#if PLATFORM_WINDOWS
    localtime_s(&localTime, &now);
#else
    localtime_r(&now, &localTime);
#endif

    std::lock_guard<std::mutex> lock(m_mutex);
    std::ostream &out = m_logFile.is_open() ? static_cast<std::ostream &>(m_logFile) : std::clog;
    out << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S") << " [" << BTUSBLogLevelToString(level) << "] "
        << function << ": " << message << '\n';
    out.flush();
}

BTUSBLog::~BTUSBLog()
{
    // Flush a line that was started but never terminated with endLog
    if (m_stream.tellp() > 0) {
        BTUSBLogStore::getInstance().Write(m_level, m_function, m_stream.str());
    }
}

BTUSBLog &BTUSBLog::operator<<(const BTUSBEndLog &)
{
    if (m_stream.tellp() > 0) {
        BTUSBLogStore::getInstance().Write(m_level, m_function, m_stream.str());
    }
    m_stream.str("");
    m_stream.clear();
    return *this;
}
