#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace sendplus::core {

struct ServerState {
    bool running{false};
    std::optional<std::uint16_t> port;
    std::optional<std::string> error;

    static ServerState Running(std::uint16_t port) {
        return ServerState{.running = true, .port = port, .error = std::nullopt};
    }

    static ServerState Stopped() { return ServerState{}; }

    static ServerState Error(std::string message) {
        return ServerState{.running = false, .port = std::nullopt, .error = std::move(message)};
    }

    bool operator==(const ServerState&) const = default;
};

} // namespace sendplus::core
