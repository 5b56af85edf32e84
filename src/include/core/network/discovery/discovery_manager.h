#pragma once

#include <boost/asio.hpp>
#include <chrono>
#include <core/constant/network.h>
#include <core/model/device_info.h>
#include <core/network/discovery/device_registry.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace sendplus::core {

enum class DiscoveryState {
    kIdle,
    kStarting,
    kRunning,
    kStopping,
};

struct DiscoveryOptions {
    std::uint16_t port = network::kDefaultPort;
    std::string multicast_address{network::kMulticastAddress};
    std::chrono::milliseconds announce_interval = network::kAnnounceInterval;
    std::chrono::milliseconds device_timeout = network::kDeviceTimeout;
    // Transfer port put in announcements and matched for self-filtering;
    // defaults to `port`
    std::optional<std::uint16_t> advertised_port;
    // Addresses treated as "this machine"; read from the interfaces on Start() when unset
    std::optional<std::vector<std::string>> local_addresses;
};

// UDP multicast presence: announces this device periodically and keeps the
// registry filled with peers that keep announcing themselves. A peer that
// stays silent for device_timeout is dropped.
//
// Not thread-safe: call from the io_context's thread, or while it is not
// running.
class DiscoveryManager {
public:
    DiscoveryManager(boost::asio::io_context& ioc,
                     DeviceRegistry& registry,
                     DiscoveryOptions options = {});
    ~DiscoveryManager();

    DiscoveryManager(const DiscoveryManager&) = delete;
    DiscoveryManager& operator=(const DiscoveryManager&) = delete;

    // No-op unless idle. A socket that cannot be bound puts the manager back
    // to idle; the failure is logged and not reported to the caller.
    void Start();

    // Idempotent, also safe when never started. Leaves the registry empty.
    void Stop();

    // Processes one received datagram. Returns true if the packet was
    // accepted as a peer sighting.
    bool HandlePacket(std::string_view data, const std::string& sender_ip);

    void SetAdvertisedPort(std::uint16_t port) { options_.advertised_port = port; }

    DiscoveryState state() const { return state_; }
    std::uint16_t port() const { return options_.port; }
    std::uint16_t advertised_port() const { return options_.advertised_port.value_or(options_.port); }
    const std::unordered_set<std::string>& local_addresses() const { return local_addresses_; }
    std::size_t pending_expiry_timers() const { return expiry_timers_.size(); }

private:
    struct ExpiryTimer {
        std::unique_ptr<boost::asio::steady_timer> timer;
        std::uint64_t generation;
    };

    boost::asio::awaitable<void> announcer(std::uint64_t run_id);
    boost::asio::awaitable<void> listener(std::uint64_t run_id);

    void sendAnnouncement();
    void refreshLocalAddresses();
    bool isOwnPacket(const std::string& sender_ip, std::uint16_t port) const;
    void armExpiryTimer(const DeviceInfo& device);
    void cancelExpiryTimers();
    void closeSocket();

    bool isCurrentRun(std::uint64_t run_id) const {
        return run_id == run_id_ && state_ == DiscoveryState::kRunning;
    }

    boost::asio::io_context& io_context_;
    DeviceRegistry& registry_;
    DiscoveryOptions options_;

    DiscoveryState state_{DiscoveryState::kIdle};
    std::uint64_t run_id_{0};
    std::uint64_t next_generation_{0};

    std::unordered_set<std::string> local_addresses_;
    std::unordered_map<std::string, ExpiryTimer> expiry_timers_;

    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint multicast_endpoint_;
    boost::asio::steady_timer announce_timer_;
};

} // namespace sendplus::core
