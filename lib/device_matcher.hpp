#pragma once

#include <cstdint>

struct DeviceIdentity {
    uint16_t vendorId;
    uint16_t productId;
};

constexpr DeviceIdentity kBusyTagIdentity{0x303A, 0x81DF};

bool MatchesDeviceIdentity(const DeviceIdentity &target, uint16_t vendorId, uint16_t productId);

inline bool IsBusyTagDevice(uint16_t vendorId, uint16_t productId)
{
    return MatchesDeviceIdentity(kBusyTagIdentity, vendorId, productId);
}
