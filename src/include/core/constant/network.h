#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

namespace sendplus::core {

namespace network {

// Discovery and transfer share one fixed port.
constexpr std::uint16_t kDefaultPort = 2706;
constexpr std::string_view kMulticastAddress = "224.0.0.1";

constexpr std::chrono::milliseconds kAnnounceInterval{5000};
constexpr std::chrono::milliseconds kDeviceTimeout{15000};

constexpr std::size_t kMaxDatagramSize = 4096;

} // namespace network

} // namespace sendplus::core
