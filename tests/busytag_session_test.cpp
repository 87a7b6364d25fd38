#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "busytag_session.hpp"
#include "busytag_usb_driver.h"
#include "fake_transport.hpp"

class BusyTagSessionTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        state = std::make_shared<FakeDeviceState>("1-4");
    }

    std::unique_ptr<BusyTagSession> MakeSession()
    {
        return std::unique_ptr<BusyTagSession>(
            new BusyTagSession(std::unique_ptr<Device>(new FakeDevice(state)), 7, config));
    }

    int OpenSession(BusyTagSession &session)
    {
        return session.Open([this](Device::DeviceEvent event, const uint8_t *, size_t size) {
            events.push_back(event);
            sizes.push_back(size);
        });
    }

    DriverConfig config;
    std::shared_ptr<FakeDeviceState> state;
    std::vector<Device::DeviceEvent> events;
    std::vector<size_t> sizes;
};

TEST_F(BusyTagSessionTest, OpenAndClose)
{
    auto session = MakeSession();

    EXPECT_EQ(session->GetId(), 7u);
    EXPECT_EQ(session->GetUSBPath(), "1-4");
    EXPECT_FALSE(session->IsHealthy());

    ASSERT_EQ(OpenSession(*session), 0);
    EXPECT_TRUE(session->IsHealthy());
    EXPECT_TRUE(state->IsOpen());

    session->Close();
    EXPECT_FALSE(session->IsHealthy());
    EXPECT_FALSE(state->IsOpen());
    EXPECT_EQ(state->closeCount, 1);
}

TEST_F(BusyTagSessionTest, OpenFailureIsReturned)
{
    state->openResult = -3;
    auto session = MakeSession();

    EXPECT_EQ(OpenSession(*session), -3);
    EXPECT_FALSE(session->IsHealthy());
}

TEST_F(BusyTagSessionTest, SendWithoutOpenFails)
{
    auto session = MakeSession();
    const uint8_t data[] = {'A', 'T'};

    EXPECT_EQ(session->Send(data, sizeof(data)), BTUSB_ERROR_NO_SESSION);
    EXPECT_EQ(state->writeCalls, 0);
}

TEST_F(BusyTagSessionTest, SendRejectsEmptyBuffers)
{
    auto session = MakeSession();
    ASSERT_EQ(OpenSession(*session), 0);
    const uint8_t data[] = {'A'};

    EXPECT_EQ(session->Send(nullptr, 1), BTUSB_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(session->Send(data, 0), BTUSB_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(state->writeCalls, 0);
}

TEST_F(BusyTagSessionTest, LargeSendIsFragmented)
{
    auto session = MakeSession();
    ASSERT_EQ(OpenSession(*session), 0);

    std::vector<uint8_t> payload(40000);
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<uint8_t>(i * 31);
    }

    EXPECT_EQ(session->Send(payload.data(), payload.size()), 40000);
    EXPECT_EQ(state->writeSizes, std::vector<size_t>({16384, 16384, 7232}));
    EXPECT_EQ(state->written, payload);
    EXPECT_FALSE(session->IsSendInProgress());
}

TEST_F(BusyTagSessionTest, ShortWritesAreContinued)
{
    state->maxWriteChunk = 100;
    auto session = MakeSession();
    ASSERT_EQ(OpenSession(*session), 0);

    std::string text(250, 'x');
    text[0] = 'A';
    text[249] = 'Z';

    EXPECT_EQ(session->Send(reinterpret_cast<const uint8_t *>(text.data()), text.size()), 250);
    EXPECT_EQ(state->writeCalls, 3);
    EXPECT_EQ(state->WrittenText(), text);
}

TEST_F(BusyTagSessionTest, FailedFragmentFailsSend)
{
    state->failWriteCall = 1;
    auto session = MakeSession();
    ASSERT_EQ(OpenSession(*session), 0);

    std::vector<uint8_t> payload(20000, 0x55);

    EXPECT_EQ(session->Send(payload.data(), payload.size()), BTUSB_ERROR_TRANSFER);
    EXPECT_EQ(state->written.size(), 16384u);
    // A write failure does not take the session down
    EXPECT_TRUE(session->IsHealthy());
    EXPECT_FALSE(session->IsSendInProgress());
}

TEST_F(BusyTagSessionTest, WriteWithoutProgressFailsSend)
{
    state->maxWriteChunk = 0;
    auto session = MakeSession();
    ASSERT_EQ(OpenSession(*session), 0);
    const uint8_t data[] = {1, 2, 3, 4};

    EXPECT_EQ(session->Send(data, sizeof(data)), BTUSB_ERROR_TRANSFER);
    EXPECT_EQ(state->writeCalls, 1);
}

TEST_F(BusyTagSessionTest, ReadFailureMarksSessionUnhealthy)
{
    auto session = MakeSession();
    ASSERT_EQ(OpenSession(*session), 0);

    EXPECT_TRUE(state->Emit("OK"));
    EXPECT_TRUE(session->IsHealthy());

    EXPECT_TRUE(state->Emit(Device::DEVICE_EVENT_TRANSFER_ERROR));
    EXPECT_FALSE(session->IsHealthy());

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], Device::DEVICE_EVENT_DATA);
    EXPECT_EQ(sizes[0], 2u);
    EXPECT_EQ(events[1], Device::DEVICE_EVENT_TRANSFER_ERROR);

    const uint8_t data[] = {'A'};
    EXPECT_EQ(session->Send(data, sizeof(data)), BTUSB_ERROR_NO_SESSION);
}

TEST_F(BusyTagSessionTest, DestroyClosesDevice)
{
    {
        auto session = MakeSession();
        ASSERT_EQ(OpenSession(*session), 0);
    }

    EXPECT_FALSE(state->IsOpen());
    EXPECT_EQ(state->closeCount, 1);
}
