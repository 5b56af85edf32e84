#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace sendplus::core {

enum class PacketType {
    kDiscoveryRequest,
    kDiscoveryResponse,
};

inline std::string_view PacketTypeToString(PacketType type) {
    switch (type) {
    case PacketType::kDiscoveryRequest:
        return "discovery_request";
    case PacketType::kDiscoveryResponse:
        return "discovery_response";
    }
    return "discovery_request";
}

inline std::optional<PacketType> PacketTypeFromString(std::string_view value) {
    if (value == "discovery_request") {
        return PacketType::kDiscoveryRequest;
    }
    if (value == "discovery_response") {
        return PacketType::kDiscoveryResponse;
    }
    return std::nullopt;
}

// One UDP announcement: {"alias": ..., "port": ..., "type": ...}
struct DiscoveryPacket {
    std::string alias;
    std::uint16_t port{0};
    PacketType type{PacketType::kDiscoveryRequest};

    std::string Dump() const {
        nlohmann::json j{{"alias", alias}, {"port", port}, {"type", std::string(PacketTypeToString(type))}};
        return j.dump();
    }
};

// Strict parse: every field must be present with the right JSON type and
// "type" must name a known packet type.
inline std::optional<DiscoveryPacket> ParseDiscoveryPacket(std::string_view data) {
    nlohmann::json j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::debug("Discovery packet is not a JSON object");
        return std::nullopt;
    }

    auto alias = j.find("alias");
    auto port = j.find("port");
    auto type = j.find("type");
    if (alias == j.end() || !alias->is_string()) {
        spdlog::debug("Discovery packet has no string \"alias\"");
        return std::nullopt;
    }
    if (port == j.end() || !port->is_number_integer()) {
        spdlog::debug("Discovery packet has no integer \"port\"");
        return std::nullopt;
    }
    if (type == j.end() || !type->is_string()) {
        spdlog::debug("Discovery packet has no string \"type\"");
        return std::nullopt;
    }

    auto port_value = port->get<std::int64_t>();
    if (port_value <= 0 || port_value > 65535) {
        spdlog::debug("Discovery packet port out of range: {}", port_value);
        return std::nullopt;
    }

    auto packet_type = PacketTypeFromString(type->get_ref<const std::string&>());
    if (!packet_type) {
        spdlog::debug("Unknown discovery packet type: {}", type->get_ref<const std::string&>());
        return std::nullopt;
    }

    return DiscoveryPacket{
        .alias = alias->get<std::string>(),
        .port = static_cast<std::uint16_t>(port_value),
        .type = *packet_type,
    };
}

} // namespace sendplus::core
