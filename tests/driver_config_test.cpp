#include <cstdlib>
#include <string>

#include <gtest/gtest.h>

#include "driver_config.hpp"
#include "utils.hpp"

static const char *kConfigVariables[] = {
    "BTUSB_LOG_LEVEL",
    "BTUSB_LOG_FILE",
    "BTUSB_USB_DEBUG",
    "BTUSB_FORCE_POLLING",
    "BTUSB_POLL_INTERVAL_MS",
    "BTUSB_WRITE_TIMEOUT_MS",
};

class DriverConfigTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ClearEnvironment();
    }

    void TearDown() override
    {
        ClearEnvironment();
    }

    static void ClearEnvironment()
    {
        for (const char *name : kConfigVariables) {
            unsetenv(name);
        }
    }
};

TEST_F(DriverConfigTest, Defaults)
{
    DriverConfig config = DriverConfig::FromEnvironment();

    EXPECT_EQ(config.logLevel, BTUSB_LOG_LEVEL_WARNING);
    EXPECT_TRUE(config.logPath.empty());
    EXPECT_FALSE(config.usbDebug);
    EXPECT_FALSE(config.forcePolling);
    EXPECT_EQ(config.pollIntervalMs, 1000u);
    EXPECT_EQ(config.writeTimeoutMs, 1000u);
    EXPECT_EQ(config.readBufferSize, 4096u);
    EXPECT_EQ(config.maxTransferSize, 16384u);
    EXPECT_EQ(config.maxSendLength, 1048576u);
}

TEST_F(DriverConfigTest, ReadsEnvironment)
{
    setenv("BTUSB_LOG_LEVEL", "Debug", 1);
    setenv("BTUSB_LOG_FILE", "/tmp/busytag.log", 1);
    setenv("BTUSB_USB_DEBUG", "1", 1);
    setenv("BTUSB_FORCE_POLLING", "yes", 1);
    setenv("BTUSB_POLL_INTERVAL_MS", "250", 1);
    setenv("BTUSB_WRITE_TIMEOUT_MS", "5000", 1);

    DriverConfig config = DriverConfig::FromEnvironment();

    EXPECT_EQ(config.logLevel, BTUSB_LOG_LEVEL_DEBUG);
    EXPECT_EQ(config.logPath, "/tmp/busytag.log");
    EXPECT_TRUE(config.usbDebug);
    EXPECT_TRUE(config.forcePolling);
    EXPECT_EQ(config.pollIntervalMs, 250u);
    EXPECT_EQ(config.writeTimeoutMs, 5000u);
}

TEST_F(DriverConfigTest, InvalidValuesKeepDefaults)
{
    setenv("BTUSB_LOG_LEVEL", "verbose", 1);
    setenv("BTUSB_USB_DEBUG", "maybe", 1);
    setenv("BTUSB_POLL_INTERVAL_MS", "0", 1);
    setenv("BTUSB_WRITE_TIMEOUT_MS", "12ms", 1);

    DriverConfig config = DriverConfig::FromEnvironment();

    EXPECT_EQ(config.logLevel, BTUSB_LOG_LEVEL_WARNING);
    EXPECT_FALSE(config.usbDebug);
    EXPECT_EQ(config.pollIntervalMs, 1000u);
    EXPECT_EQ(config.writeTimeoutMs, 1000u);

    setenv("BTUSB_POLL_INTERVAL_MS", "600001", 1);
    setenv("BTUSB_WRITE_TIMEOUT_MS", "-5", 1);
    config = DriverConfig::FromEnvironment();

    EXPECT_EQ(config.pollIntervalMs, 1000u);
    EXPECT_EQ(config.writeTimeoutMs, 1000u);
}

TEST_F(DriverConfigTest, FlagsCanBeTurnedOff)
{
    setenv("BTUSB_FORCE_POLLING", "off", 1);

    EXPECT_FALSE(DriverConfig::FromEnvironment().forcePolling);
}

TEST_F(DriverConfigTest, EnvironmentLookup)
{
    setenv("BTUSB_LOG_FILE", "busytag.log", 1);

    EXPECT_EQ(GetEnvironmentValue("BTUSB_LOG_FILE"), "busytag.log");
    EXPECT_EQ(GetEnvironmentValue("BTUSB_POLL_INTERVAL_MS"), "");
}

TEST(LogLevelTest, ParsesNames)
{
    BTUSBLogLevel level = BTUSB_LOG_LEVEL_NONE;

    EXPECT_TRUE(BTUSBLogLevelFromString("info", level));
    EXPECT_EQ(level, BTUSB_LOG_LEVEL_INFO);
    EXPECT_TRUE(BTUSBLogLevelFromString("ERROR", level));
    EXPECT_EQ(level, BTUSB_LOG_LEVEL_ERROR);
    EXPECT_FALSE(BTUSBLogLevelFromString("loud", level));
    EXPECT_EQ(level, BTUSB_LOG_LEVEL_ERROR);

    EXPECT_STREQ(BTUSBLogLevelToString(BTUSB_LOG_LEVEL_WARNING), "WARNING");
}

TEST(HexStringTest, FormatsAndTruncates)
{
    const uint8_t data[] = {0x00, 0x1f, 0xa5, 0xff};

    EXPECT_EQ(HexString(data, sizeof(data)), "00 1f a5 ff");
    EXPECT_EQ(HexString(data, sizeof(data), 2), "00 1f ...");
    EXPECT_EQ(HexString(data, 0), "");
}
