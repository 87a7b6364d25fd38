#include <chrono>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <mutex>
#include <queue>
#include <string>
#include <vector>
#include <cxxopts.hpp>

#include "busytag_monitor.hpp"
#include "busytag_usb_driver.h"
#include "driver_config.hpp"
#include "btusb_log.hpp"
#include "utils.hpp"

struct MonitorOutput {
    enum Type {
        MONITOR_OUTPUT_CONNECTION,
        MONITOR_OUTPUT_DATA,
        MONITOR_OUTPUT_LOG,
    };

    Type type;
    int connected;
    std::vector<uint8_t> data;
    std::string message;
};

std::queue<MonitorOutput> monitorOutputs;
std::condition_variable monitorOutputsCV;
std::mutex monitorOutputsMutex;

static volatile std::sig_atomic_t interrupted = 0;

static void SignalHandler(int)
{
    interrupted = 1;
}

static void PushMonitorOutput(MonitorOutput output)
{
    std::lock_guard<std::mutex> lock(monitorOutputsMutex);
    monitorOutputs.push(std::move(output));
    monitorOutputsCV.notify_one();
}

static void PrintData(const std::vector<uint8_t> &data, bool hex)
{
    if (hex) {
        std::cout << "RX [" << data.size() << "]: " << HexString(data.data(), data.size(), data.size()) << std::endl;
    } else {
        std::cout << "RX: " << std::string(data.begin(), data.end()) << std::flush;
        if (!data.empty() && data.back() != '\n') {
            std::cout << std::endl;
        }
    }
}

static int RunMonitor(cxxopts::Options &options, const cxxopts::ParseResult &result)
{
    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    DriverConfig config = DriverConfig::FromEnvironment();
    std::string logFilePath = result["log"].as<std::string>();
    if (!logFilePath.empty()) {
        config.logPath = logFilePath;
    }
    if (result["debug"].as<bool>()) {
        config.logLevel = BTUSB_LOG_LEVEL_DEBUG;
    }
    if (result["usb-debug"].as<bool>()) {
        config.usbDebug = true;
    }
    if (result["poll"].as<bool>()) {
        config.forcePolling = true;
    }

    bool hex = result["hex"].as<bool>();
    bool raw = result["raw"].as<bool>();
    unsigned int timeout = result["timeout"].as<unsigned int>();
    std::string command;
    if (result.count("send")) {
        command = result["send"].as<std::string>();
    }

    BTUSBLogStore::getInstance().Open(config.logPath, config.logLevel);

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    BusyTagMonitor monitor(config);

    monitor.SetConnectionCallback([](int connected) {
        PushMonitorOutput({MonitorOutput::MONITOR_OUTPUT_CONNECTION, connected, {}, {}});
    });
    monitor.SetDataCallback([](const uint8_t *data, size_t size) {
        PushMonitorOutput({MonitorOutput::MONITOR_OUTPUT_DATA, 0, std::vector<uint8_t>(data, data + size), {}});
    });
    monitor.SetLogCallback([](const std::string &message) {
        PushMonitorOutput({MonitorOutput::MONITOR_OUTPUT_LOG, 0, {}, message});
    });

    int ret = monitor.Init();
    if (ret < 0) {
        std::cerr << "Error starting BusyTag monitor: " << btusb_error_name(ret) << std::endl;
        return 1;
    }

    if (!monitor.IsDevicePresent()) {
        std::cout << "Waiting for BusyTag device..." << std::endl;
    }

    monitor.StartMonitoring();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout);
    bool commandSent = false;
    int exitCode = 0;

    while (!interrupted) {
        if (timeout > 0 && std::chrono::steady_clock::now() >= deadline) {
            break;
        }

        std::unique_lock<std::mutex> lock(monitorOutputsMutex);
        // Signals can not wake the condition variable, so wake up periodically
        if (!monitorOutputsCV.wait_for(lock, std::chrono::milliseconds(200), []{ return !monitorOutputs.empty(); })) {
            continue;
        }

        MonitorOutput output = std::move(monitorOutputs.front());
        monitorOutputs.pop();
        lock.unlock();

        if (output.type == MonitorOutput::MONITOR_OUTPUT_CONNECTION) {
            std::cout << (output.connected ? "Connected" : "Disconnected") << std::endl;

            if (output.connected && !command.empty() && !commandSent) {
                ret = raw ? monitor.SendString(command) : monitor.SendCommand(command);
                if (ret < 0) {
                    std::cerr << "Failed to send '" << command << "': " << btusb_error_name(ret) << std::endl;
                    exitCode = 1;
                } else {
                    std::cout << "Sent " << ret << " bytes" << std::endl;
                    commandSent = true;
                }
            }
        } else if (output.type == MonitorOutput::MONITOR_OUTPUT_DATA) {
            PrintData(output.data, hex);
        } else if (output.type == MonitorOutput::MONITOR_OUTPUT_LOG) {
            std::cout << "[busytag] " << output.message << std::endl;
        }
    }

    monitor.Shutdown();

    return exitCode;
}

int main(int argc, char* argv[])
{
    cxxopts::Options options("busytag-monitor", "BusyTag USB Monitor");

    options.add_options()
        ("l,log", "Log file path", cxxopts::value<std::string>()->default_value(""))
        ("D,debug", "Enable debug logging", cxxopts::value<bool>()->default_value("false"))
        ("u,usb-debug", "Enable USB debug logging", cxxopts::value<bool>()->default_value("false"))
        ("p,poll", "Poll for devices instead of using hotplug", cxxopts::value<bool>()->default_value("false"))
        ("s,send", "Command to send once connected", cxxopts::value<std::string>())
        ("r,raw", "Send without appending CRLF", cxxopts::value<bool>()->default_value("false"))
        ("x,hex", "Print received data as hex", cxxopts::value<bool>()->default_value("false"))
        ("t,timeout", "Exit after this many seconds (0 runs until interrupted)", cxxopts::value<unsigned int>()->default_value("0"))
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);
        return RunMonitor(options, result);
    } catch (const std::exception &e) {
        std::cerr << e.what() << std::endl;
        std::cerr << options.help() << std::endl;
    }

    return 1;
}
