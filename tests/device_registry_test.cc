#include <core/network/discovery/device_registry.h>
#include <gtest/gtest.h>

namespace sendplus::core {
namespace {

DeviceInfo Device(std::string ip, std::uint16_t port, std::string alias) {
    return DeviceInfo{.ip = std::move(ip), .port = port, .alias = std::move(alias)};
}

TEST(DeviceRegistryTest, KeepsInsertionOrder) {
    DeviceRegistry registry;
    EXPECT_TRUE(registry.AddDevice(Device("192.168.1.20", 2706, "B")));
    EXPECT_TRUE(registry.AddDevice(Device("192.168.1.10", 2706, "A")));

    auto devices = registry.GetDevices();
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].alias, "B");
    EXPECT_EQ(devices[1].alias, "A");
}

TEST(DeviceRegistryTest, FirstSightingWins) {
    DeviceRegistry registry;
    EXPECT_TRUE(registry.AddDevice(Device("192.168.1.10", 2706, "Laptop")));
    EXPECT_FALSE(registry.AddDevice(Device("192.168.1.10", 2706, "Renamed")));

    ASSERT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.GetDevices()[0].alias, "Laptop");
}

TEST(DeviceRegistryTest, SameAddressDifferentPortIsAnotherDevice) {
    DeviceRegistry registry;
    registry.AddDevice(Device("192.168.1.10", 2706, "A"));
    registry.AddDevice(Device("192.168.1.10", 2707, "A"));
    EXPECT_EQ(registry.size(), 2u);
}

TEST(DeviceRegistryTest, LookupByKey) {
    DeviceRegistry registry;
    registry.AddDevice(Device("10.0.0.5", 2706, "Phone"));

    auto found = registry.GetDevice("10.0.0.5:2706");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->alias, "Phone");
    EXPECT_FALSE(registry.GetDevice("10.0.0.5:2707").has_value());
}

TEST(DeviceRegistryTest, RemoveMatchesOnAddressAndPortOnly) {
    DeviceRegistry registry;
    registry.AddDevice(Device("10.0.0.5", 2706, "Phone"));

    EXPECT_TRUE(registry.RemoveDevice(Device("10.0.0.5", 2706, "whatever")));
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(registry.RemoveDevice(Device("10.0.0.5", 2706, "Phone")));
}

TEST(DeviceRegistryTest, NotifiesOnlyOnChange) {
    DeviceRegistry registry;
    std::vector<std::vector<DeviceInfo>> snapshots;
    registry.SetDevicesChangedCallback(
        [&](const std::vector<DeviceInfo>& devices) { snapshots.push_back(devices); });

    registry.AddDevice(Device("10.0.0.1", 2706, "A"));
    registry.AddDevice(Device("10.0.0.1", 2706, "A again"));
    registry.AddDevice(Device("10.0.0.2", 2706, "B"));
    registry.RemoveDevice(Device("10.0.0.9", 2706, "missing"));
    registry.RemoveDevice(Device("10.0.0.1", 2706, "A"));
    registry.ClearDevices();
    registry.ClearDevices();

    ASSERT_EQ(snapshots.size(), 4u);
    EXPECT_EQ(snapshots[0].size(), 1u);
    EXPECT_EQ(snapshots[1].size(), 2u);
    ASSERT_EQ(snapshots[2].size(), 1u);
    EXPECT_EQ(snapshots[2][0].alias, "B");
    EXPECT_TRUE(snapshots[3].empty());
}

} // namespace
} // namespace sendplus::core
