#include <boost/asio/executor_work_guard.hpp>
#include <core/model/discovery_packet.h>
#include <core/sendplus_service.h>
#include <core/util/config.h>
#include <gtest/gtest.h>
#include <test_helpers.h>
#include <thread>

namespace sendplus::core {
namespace {

using namespace std::chrono_literals;
namespace net = boost::asio;

DiscoveryOptions QuietDiscovery(std::uint16_t port) {
    DiscoveryOptions options;
    options.port = port;
    options.announce_interval = 10s;
    return options;
}

class SendPlusServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.alias = "Node";
        settings.save_dir = save_dir_.path();
    }

    net::io_context ioc_;
    test::TempDir save_dir_;
};

TEST_F(SendPlusServiceTest, StartAndStop) {
    if (!test::CanJoinMulticastGroup()) {
        GTEST_SKIP() << "this host cannot join the discovery multicast group";
    }
    SendPlusService service(ioc_, QuietDiscovery(47216), 0);

    EXPECT_TRUE(service.Start());
    EXPECT_TRUE(service.running());
    EXPECT_TRUE(service.http_server().running());
    EXPECT_EQ(service.discovery_manager().state(), DiscoveryState::kRunning);
    EXPECT_TRUE(service.server_state().Get()->running);

    service.registry().AddDevice(DeviceInfo{.ip = "192.0.2.50", .port = 2706, .alias = "Manual"});
    service.Stop();

    EXPECT_FALSE(service.running());
    EXPECT_FALSE(service.http_server().running());
    EXPECT_EQ(service.discovery_manager().state(), DiscoveryState::kIdle);
    EXPECT_EQ(service.server_state().Get(), ServerState::Stopped());
    EXPECT_EQ(service.registry().size(), 0u);

    service.Stop();
    test::RunFor(ioc_, 20ms);
}

TEST_F(SendPlusServiceTest, DiscoveredPeerReceivesText) {
    if (!test::CanJoinMulticastGroup()) {
        GTEST_SKIP() << "this host cannot join the discovery multicast group";
    }
    SendPlusService alice(ioc_, QuietDiscovery(47217), 0);
    SendPlusService bob(ioc_, QuietDiscovery(47218), 0);
    ASSERT_TRUE(alice.Start());
    ASSERT_TRUE(bob.Start());

    std::string bob_announcement =
        DiscoveryPacket{.alias = "Bob", .port = bob.http_server().port(), .type = PacketType::kDiscoveryRequest}
            .Dump();
    ASSERT_TRUE(alice.discovery_manager().HandlePacket(bob_announcement, "127.0.0.1"));

    auto peers = alice.registry().GetDevices();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].alias, "Bob");

    test::RunUntilComplete(ioc_, alice.send_service().SendText(peers[0], "hi Bob"));
    EXPECT_EQ(bob.inbox().text.Get(), "hi Bob");
    EXPECT_FALSE(alice.inbox().text.HasValue());

    bob.AcknowledgeReceivedText();
    EXPECT_FALSE(bob.inbox().text.HasValue());

    alice.Stop();
    bob.Stop();
    test::RunFor(ioc_, 20ms);
}

std::optional<DeviceInfo> FindByPort(DeviceRegistry& registry, std::uint16_t port) {
    for (const auto& device : registry.GetDevices()) {
        if (device.port == port) {
            return device;
        }
    }
    return std::nullopt;
}

TEST_F(SendPlusServiceTest, PeersFindEachOtherOverMulticast) {
    DiscoveryOptions shared;
    shared.port = 47230;
    shared.announce_interval = 200ms;
    SendPlusService alice(ioc_, shared, 0);
    SendPlusService bob(ioc_, shared, 0);
    ASSERT_TRUE(alice.Start());
    ASSERT_TRUE(bob.Start());
    EXPECT_EQ(alice.discovery_manager().advertised_port(), alice.http_server().port());

    std::optional<DeviceInfo> bob_seen;
    std::optional<DeviceInfo> alice_seen;
    for (int i = 0; i < 100 && !(bob_seen && alice_seen); ++i) {
        test::RunFor(ioc_, 50ms);
        bob_seen = FindByPort(alice.registry(), bob.http_server().port());
        alice_seen = FindByPort(bob.registry(), alice.http_server().port());
    }
    if (!bob_seen || !alice_seen) {
        alice.Stop();
        bob.Stop();
        test::RunFor(ioc_, 20ms);
        GTEST_SKIP() << "multicast datagrams are not delivered on this host";
    }

    // Neither side lists itself.
    EXPECT_FALSE(FindByPort(alice.registry(), alice.http_server().port()).has_value());

    test::RunUntilComplete(ioc_, alice.send_service().SendText(*bob_seen, "hello"));
    EXPECT_EQ(bob.inbox().text.Get(), "hello");

    std::vector<std::uint8_t> payload{'x', '\0', 'y', '\n'};
    test::RunUntilComplete(ioc_, alice.send_service().SendFile(*bob_seen, "x.txt", std::nullopt, payload));
    auto received = bob.inbox().file.Get();
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(test::ReadFile(received->path), std::string(payload.begin(), payload.end()));

    alice.Stop();
    bob.Stop();
    test::RunFor(ioc_, 20ms);
}

TEST_F(SendPlusServiceTest, KeepAndDiscardReceivedFiles) {
    SendPlusService service(ioc_, QuietDiscovery(47219), 0);
    ASSERT_TRUE(service.Start());
    DeviceInfo self{.ip = "127.0.0.1", .port = service.http_server().port(), .alias = "Self"};

    std::vector<std::uint8_t> bytes{'k', 'e', 'e', 'p'};
    test::RunUntilComplete(ioc_, service.send_service().SendFile(self, "keep.txt", std::nullopt, bytes));
    ASSERT_TRUE(service.inbox().file.HasValue());
    service.KeepReceivedFile();
    EXPECT_FALSE(service.inbox().file.HasValue());
    EXPECT_TRUE(std::filesystem::exists(save_dir_.path() / "keep.txt"));

    bytes = {'g', 'o'};
    test::RunUntilComplete(ioc_, service.send_service().SendFile(self, "drop.txt", std::nullopt, bytes));
    ASSERT_TRUE(service.inbox().file.HasValue());
    service.DiscardReceivedFile();
    EXPECT_FALSE(service.inbox().file.HasValue());
    EXPECT_FALSE(std::filesystem::exists(save_dir_.path() / "drop.txt"));

    // Nothing pending: both are no-ops.
    service.KeepReceivedFile();
    service.DiscardReceivedFile();

    service.Stop();
    test::RunFor(ioc_, 20ms);
}

TEST_F(SendPlusServiceTest, RunExecutesOnIoThread) {
    if (!test::CanJoinMulticastGroup()) {
        GTEST_SKIP() << "this host cannot join the discovery multicast group";
    }
    SendPlusService service(ioc_, QuietDiscovery(47220), 0);
    auto work = net::make_work_guard(ioc_);
    std::thread io_thread([this] { ioc_.run(); });

    EXPECT_TRUE(service.Run([&] { return service.Start(); }));
    bool on_io_thread = service.Run([this] { return ioc_.get_executor().running_in_this_thread(); });
    EXPECT_TRUE(on_io_thread);
    EXPECT_EQ(service.Run([&] { return service.discovery_manager().state(); }),
              DiscoveryState::kRunning);
    service.Run([&] { service.Stop(); });

    work.reset();
    ioc_.stop();
    io_thread.join();
    EXPECT_FALSE(service.running());
}

} // namespace
} // namespace sendplus::core
