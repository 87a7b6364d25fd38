#include <gtest/gtest.h>

#include "busytag_usb_driver.h"
#include "device_matcher.hpp"

TEST(DeviceMatcherTest, MatchesBusyTagIdentity)
{
    EXPECT_TRUE(IsBusyTagDevice(0x303A, 0x81DF));
    EXPECT_TRUE(IsBusyTagDevice(BTUSB_VENDOR_ID, BTUSB_PRODUCT_ID));
}

TEST(DeviceMatcherTest, RejectsOtherDevices)
{
    EXPECT_FALSE(IsBusyTagDevice(0x303A, 0x1001));
    EXPECT_FALSE(IsBusyTagDevice(0x1234, 0x81DF));
    EXPECT_FALSE(IsBusyTagDevice(0x81DF, 0x303A));
    EXPECT_FALSE(IsBusyTagDevice(0, 0));
}

TEST(DeviceMatcherTest, MatchesArbitraryTarget)
{
    DeviceIdentity target{0x06CB, 0x00B0};

    EXPECT_TRUE(MatchesDeviceIdentity(target, 0x06CB, 0x00B0));
    EXPECT_FALSE(MatchesDeviceIdentity(target, 0x303A, 0x81DF));
}
