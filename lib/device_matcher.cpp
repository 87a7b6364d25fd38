#include "device_matcher.hpp"

bool MatchesDeviceIdentity(const DeviceIdentity &target, uint16_t vendorId, uint16_t productId)
{
    return target.vendorId == vendorId && target.productId == productId;
}
