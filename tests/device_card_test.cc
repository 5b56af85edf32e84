#include <core/util/device_card.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace sendplus::core {
namespace {

TEST(DeviceCardTest, CardCarriesAddressAndAlias) {
    auto card = nlohmann::json::parse(
        DeviceCard(DeviceInfo{.ip = "192.168.0.7", .port = 2706, .alias = "Living room"}));
    EXPECT_EQ(card["ip"], "192.168.0.7");
    EXPECT_EQ(card["port"], 2706);
    EXPECT_EQ(card["alias"], "Living room");
}

TEST(DeviceCardTest, DeviceIdSurvivesTheCard) {
    DeviceInfo device{.ip = "192.168.0.7", .port = 2710, .alias = "Desk", .device_id = "a1b2"};
    auto card = DeviceCard(device);
    EXPECT_EQ(nlohmann::json::parse(card)["deviceId"], "a1b2");
    EXPECT_EQ(ParseDeviceCard(card), device);

    auto without_id = nlohmann::json::parse(
        DeviceCard(DeviceInfo{.ip = "192.168.0.7", .port = 2706, .alias = "Desk"}));
    EXPECT_FALSE(without_id.contains("deviceId"));
}

TEST(DeviceCardTest, ParsesScannedCard) {
    auto device = ParseDeviceCard(R"({"ip":"10.1.1.4","port":3000,"alias":"Tablet"})");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->ip, "10.1.1.4");
    EXPECT_EQ(device->port, 3000);
    EXPECT_EQ(device->alias, "Tablet");
}

TEST(DeviceCardTest, PortDefaultsToTransferPort) {
    auto device = ParseDeviceCard(R"({"ip":"10.1.1.4","alias":"Tablet"})");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->port, 2706);
}

TEST(DeviceCardTest, RejectsIncompleteCards) {
    EXPECT_FALSE(ParseDeviceCard("").has_value());
    EXPECT_FALSE(ParseDeviceCard(R"({"alias":"Tablet"})").has_value());
    EXPECT_FALSE(ParseDeviceCard(R"({"ip":"","alias":"Tablet"})").has_value());
    EXPECT_FALSE(ParseDeviceCard(R"({"ip":"10.1.1.4"})").has_value());
    EXPECT_FALSE(ParseDeviceCard(R"({"ip":"10.1.1.4","port":"x","alias":"T"})").has_value());
    EXPECT_FALSE(ParseDeviceCard(R"({"ip":"10.1.1.4","port":0,"alias":"T"})").has_value());
}

} // namespace
} // namespace sendplus::core
