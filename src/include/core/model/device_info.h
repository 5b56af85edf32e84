#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace sendplus::core {

struct DeviceInfo {
    std::string ip; // dotted-quad or host name
    std::uint16_t port{0};
    std::string alias;
    std::optional<std::string> device_id;

    bool operator==(const DeviceInfo&) const = default;
};

// Registry key, "ip:port"
inline std::string DeviceKey(std::string_view ip, std::uint16_t port) {
    std::string key(ip);
    key += ':';
    key += std::to_string(port);
    return key;
}

inline std::string DeviceKey(const DeviceInfo& device) {
    return DeviceKey(device.ip, device.port);
}

inline void to_json(nlohmann::json& j, const DeviceInfo& device) {
    j = nlohmann::json{{"ip", device.ip}, {"port", device.port}, {"alias", device.alias}};
    if (device.device_id) {
        j["deviceId"] = *device.device_id;
    }
}

} // namespace sendplus::core
