#pragma once

#include <core/model/device_info.h>
#include <optional>
#include <string>
#include <string_view>

namespace sendplus::core {

// The payload a device shows (as a QR code in the mobile app) so that a peer
// can add it without discovery: {"ip": ..., "port": ..., "alias": ...},
// plus "deviceId" when the device has one.
std::string DeviceCard(const DeviceInfo& device);

// "ip" and "alias" are required strings; "port" is optional and falls back to
// the default transfer port. A string "deviceId" is kept.
std::optional<DeviceInfo> ParseDeviceCard(std::string_view text);

} // namespace sendplus::core
