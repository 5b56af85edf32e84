#include <algorithm>
#include <core/network/discovery/device_registry.h>
#include <spdlog/spdlog.h>

namespace sendplus::core {

namespace {

bool sameEndpoint(const DeviceInfo& a, const DeviceInfo& b) {
    return a.ip == b.ip && a.port == b.port;
}

} // namespace

bool DeviceRegistry::AddDevice(const DeviceInfo& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(devices_.begin(), devices_.end(), [&](const DeviceInfo& d) {
        return sameEndpoint(d, device);
    });
    if (it != devices_.end()) {
        return false;
    }
    devices_.push_back(device);
    spdlog::info("Device found: {} ({})", device.alias, DeviceKey(device));
    notify();
    return true;
}

bool DeviceRegistry::RemoveDevice(const DeviceInfo& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto removed = std::erase_if(devices_,
                                 [&](const DeviceInfo& d) { return sameEndpoint(d, device); });
    if (removed == 0) {
        return false;
    }
    spdlog::info("Device lost: {} ({})", device.alias, DeviceKey(device));
    notify();
    return true;
}

void DeviceRegistry::ClearDevices() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (devices_.empty()) {
        return;
    }
    devices_.clear();
    notify();
}

std::optional<DeviceInfo> DeviceRegistry::GetDevice(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& device : devices_) {
        if (DeviceKey(device) == key) {
            return device;
        }
    }
    return std::nullopt;
}

std::vector<DeviceInfo> DeviceRegistry::GetDevices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

void DeviceRegistry::SetDevicesChangedCallback(DevicesChangedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_changed_callback_ = std::move(callback);
}

void DeviceRegistry::notify() {
    if (devices_changed_callback_) {
        devices_changed_callback_(devices_);
    }
}

} // namespace sendplus::core
