#include <core/constant/network.h>
#include <core/util/device_card.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace sendplus::core {

std::string DeviceCard(const DeviceInfo& device) {
    json card = device;
    return card.dump();
}

std::optional<DeviceInfo> ParseDeviceCard(std::string_view text) {
    json data = json::parse(text, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        spdlog::error("Invalid device card: not a JSON object");
        return std::nullopt;
    }

    auto ip = data.find("ip");
    auto alias = data.find("alias");
    if (ip == data.end() || !ip->is_string() || ip->get_ref<const std::string&>().empty()) {
        spdlog::error("Invalid device card: missing ip");
        return std::nullopt;
    }
    if (alias == data.end() || !alias->is_string()) {
        spdlog::error("Invalid device card: missing alias");
        return std::nullopt;
    }

    std::uint16_t port = network::kDefaultPort;
    if (auto it = data.find("port"); it != data.end() && !it->is_null()) {
        if (!it->is_number_integer() || it->get<std::int64_t>() <= 0
            || it->get<std::int64_t>() > 65535) {
            spdlog::error("Invalid device card: bad port");
            return std::nullopt;
        }
        port = static_cast<std::uint16_t>(it->get<std::int64_t>());
    }

    std::optional<std::string> device_id;
    if (auto it = data.find("deviceId"); it != data.end() && it->is_string()) {
        device_id = it->get<std::string>();
    }

    return DeviceInfo{
        .ip = ip->get<std::string>(),
        .port = port,
        .alias = alias->get<std::string>(),
        .device_id = std::move(device_id),
    };
}

} // namespace sendplus::core
