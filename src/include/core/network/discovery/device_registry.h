#pragma once

#include <core/model/device_info.h>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sendplus::core {

// Peers currently visible on the local network, in insertion order and
// unique by (ip, port).
class DeviceRegistry {
public:
    using DevicesChangedCallback = std::function<void(const std::vector<DeviceInfo>&)>;

    DeviceRegistry() = default;
    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // First write wins: a device whose (ip, port) is already present is
    // ignored, its alias is not merged. Returns true if inserted.
    bool AddDevice(const DeviceInfo& device);

    // Removes the entry with the same (ip, port), if any.
    bool RemoveDevice(const DeviceInfo& device);

    void ClearDevices();

    std::optional<DeviceInfo> GetDevice(const std::string& key) const;
    std::vector<DeviceInfo> GetDevices() const;
    std::size_t size() const;

    // Called with the full list after every mutation that changed it.
    void SetDevicesChangedCallback(DevicesChangedCallback callback);

private:
    void notify();

    mutable std::mutex mutex_;
    std::vector<DeviceInfo> devices_;
    DevicesChangedCallback devices_changed_callback_;
};

} // namespace sendplus::core
