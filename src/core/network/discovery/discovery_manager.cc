#include <array>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/model/discovery_packet.h>
#include <core/network/discovery/discovery_manager.h>
#include <core/util/config.h>
#include <core/util/system.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;
using udp = net::ip::udp;

namespace sendplus::core {

DiscoveryManager::DiscoveryManager(net::io_context& ioc,
                                   DeviceRegistry& registry,
                                   DiscoveryOptions options)
    : io_context_(ioc)
    , registry_(registry)
    , options_(std::move(options))
    , socket_(ioc)
    , announce_timer_(ioc) {
    if (options_.local_addresses) {
        local_addresses_.insert(options_.local_addresses->begin(), options_.local_addresses->end());
    }
    spdlog::debug("DiscoveryManager created.");
}

DiscoveryManager::~DiscoveryManager() {
    Stop();
}

void DiscoveryManager::Start() {
    if (state_ != DiscoveryState::kIdle) {
        spdlog::debug("Discovery is already running.");
        return;
    }
    state_ = DiscoveryState::kStarting;

    refreshLocalAddresses();
    if (local_addresses_.empty()) {
        spdlog::warn("Could not determine local IP addresses. Self-discovery filtering might "
                     "not work.");
    }

    try {
        auto group = net::ip::make_address_v4(options_.multicast_address);
        multicast_endpoint_ = udp::endpoint(group, options_.port);

        udp::endpoint listen_endpoint(udp::v4(), options_.port);
        socket_.open(listen_endpoint.protocol());
        socket_.set_option(net::socket_base::reuse_address(true));
        socket_.bind(listen_endpoint);

        socket_.set_option(net::ip::multicast::join_group(group));
        socket_.set_option(net::ip::multicast::enable_loopback(true));
    } catch (const std::exception& e) {
        spdlog::error("Failed to start discovery on port {}: {}", options_.port, e.what());
        closeSocket();
        state_ = DiscoveryState::kIdle;
        return;
    }

    state_ = DiscoveryState::kRunning;
    ++run_id_;
    spdlog::info("Discovery started on port {}, joined multicast group {}",
                 options_.port,
                 options_.multicast_address);

    sendAnnouncement();

    net::co_spawn(io_context_, announcer(run_id_), net::detached);
    net::co_spawn(io_context_, listener(run_id_), net::detached);
}

void DiscoveryManager::Stop() {
    if (state_ == DiscoveryState::kIdle && !socket_.is_open() && expiry_timers_.empty()) {
        registry_.ClearDevices();
        return;
    }

    spdlog::info("Stopping discovery...");
    state_ = DiscoveryState::kStopping;
    ++run_id_;

    announce_timer_.cancel();
    closeSocket();
    cancelExpiryTimers();
    registry_.ClearDevices();

    state_ = DiscoveryState::kIdle;
    spdlog::info("Discovery stopped.");
}

bool DiscoveryManager::HandlePacket(std::string_view data, const std::string& sender_ip) {
    auto packet = ParseDiscoveryPacket(data);
    if (!packet) {
        spdlog::warn("Discarding malformed discovery packet from {}", sender_ip);
        return false;
    }

    if (isOwnPacket(sender_ip, packet->port)) {
        spdlog::trace("Received own announcement, skipping...");
        return false;
    }

    DeviceInfo device{
        .ip = sender_ip,
        .port = packet->port,
        .alias = packet->alias,
        .device_id = std::nullopt,
    };

    // Re-arming replaces the old timer entry, so a stale expiry for this key
    // can no longer match and remove the device.
    armExpiryTimer(device);
    registry_.AddDevice(device);
    spdlog::debug("Sighting of {} ({}) via {}",
                  device.alias,
                  DeviceKey(device),
                  PacketTypeToString(packet->type));
    return true;
}

net::awaitable<void> DiscoveryManager::announcer(std::uint64_t run_id) {
    while (isCurrentRun(run_id)) {
        announce_timer_.expires_after(options_.announce_interval);
        boost::system::error_code ec;
        co_await announce_timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
        if (ec || !isCurrentRun(run_id)) {
            break;
        }
        sendAnnouncement();
    }
    spdlog::debug("Discovery announcer finished.");
}

net::awaitable<void> DiscoveryManager::listener(std::uint64_t run_id) {
    std::array<char, network::kMaxDatagramSize> recv_buffer;
    udp::endpoint sender_endpoint;

    while (isCurrentRun(run_id)) {
        boost::system::error_code ec;
        std::size_t bytes_received = co_await socket_.async_receive_from(
            net::buffer(recv_buffer),
            sender_endpoint,
            net::redirect_error(net::use_awaitable, ec));

        // Stop() may have run while the receive was pending.
        if (!isCurrentRun(run_id)) {
            break;
        }
        if (ec) {
            if (ec == net::error::operation_aborted || !socket_.is_open()) {
                break;
            }
            spdlog::warn("Discovery receive error: {}", ec.message());
            continue;
        }

        try {
            HandlePacket(std::string_view(recv_buffer.data(), bytes_received),
                         sender_endpoint.address().to_string());
        } catch (const std::exception& e) {
            spdlog::error("Error processing packet from {}: {}",
                          sender_endpoint.address().to_string(),
                          e.what());
        }
    }
    spdlog::debug("Discovery listener finished.");
}

void DiscoveryManager::sendAnnouncement() {
    if (!socket_.is_open() || state_ != DiscoveryState::kRunning) {
        return;
    }

    DiscoveryPacket packet{
        .alias = settings.alias,
        .port = advertised_port(),
        .type = PacketType::kDiscoveryRequest,
    };
    std::string data = packet.Dump();

    boost::system::error_code ec;
    socket_.send_to(net::buffer(data), multicast_endpoint_, 0, ec);
    if (ec) {
        spdlog::warn("Error sending discovery packet: {}", ec.message());
    } else {
        spdlog::trace("Sent discovery packet: {}", data);
    }
}

void DiscoveryManager::refreshLocalAddresses() {
    if (options_.local_addresses) {
        return;
    }
    local_addresses_.clear();
    try {
        for (auto& address : system::LocalIpv4Addresses()) {
            local_addresses_.insert(std::move(address));
        }
        spdlog::debug("Local IPs updated: {} address(es)", local_addresses_.size());
    } catch (const std::exception& e) {
        spdlog::error("Error fetching local IPs: {}", e.what());
        local_addresses_.clear();
    }
}

bool DiscoveryManager::isOwnPacket(const std::string& sender_ip, std::uint16_t port) const {
    return port == advertised_port() && local_addresses_.contains(sender_ip);
}

void DiscoveryManager::armExpiryTimer(const DeviceInfo& device) {
    const std::string key = DeviceKey(device);
    const std::uint64_t generation = ++next_generation_;

    if (auto it = expiry_timers_.find(key); it != expiry_timers_.end()) {
        it->second.timer->cancel();
        expiry_timers_.erase(it);
    }

    auto timer = std::make_unique<net::steady_timer>(io_context_, options_.device_timeout);
    timer->async_wait([this, key, generation, device](const boost::system::error_code& ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        auto it = expiry_timers_.find(key);
        if (it == expiry_timers_.end() || it->second.generation != generation) {
            return;
        }
        spdlog::info("Device {} ({}) timed out.", device.alias, key);
        expiry_timers_.erase(it);
        registry_.RemoveDevice(device);
    });
    expiry_timers_.emplace(key, ExpiryTimer{std::move(timer), generation});
}

void DiscoveryManager::cancelExpiryTimers() {
    for (auto& [key, entry] : expiry_timers_) {
        entry.timer->cancel();
    }
    expiry_timers_.clear();
}

void DiscoveryManager::closeSocket() {
    if (socket_.is_open()) {
        boost::system::error_code ec;
        socket_.close(ec);
        if (ec) {
            spdlog::debug("Discovery socket close notice: {}", ec.message());
        }
    }
}

} // namespace sendplus::core
