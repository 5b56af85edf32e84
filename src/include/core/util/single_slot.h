#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <utility>

namespace sendplus::core {

// Holds at most one pending value. Set() overwrites whatever was not yet
// consumed; Take() and Clear() empty the slot. The change callback runs with
// the new content inside the same critical section as the mutation, so it
// must not call back into the slot.
template<typename T>
class SingleSlot {
public:
    using ChangedCallback = std::function<void(const std::optional<T>&)>;

    SingleSlot() = default;
    explicit SingleSlot(T initial)
        : value_(std::move(initial)) {}

    SingleSlot(const SingleSlot&) = delete;
    SingleSlot& operator=(const SingleSlot&) = delete;

    void Set(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ = std::move(value);
        notify();
    }

    std::optional<T> Take() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<T> value = std::exchange(value_, std::nullopt);
        if (value) {
            notify();
        }
        return value;
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (value_) {
            value_.reset();
            notify();
        }
    }

    std::optional<T> Get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    bool HasValue() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_.has_value();
    }

    void SetChangedCallback(ChangedCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
    }

private:
    void notify() {
        if (callback_) {
            callback_(value_);
        }
    }

    mutable std::mutex mutex_;
    std::optional<T> value_;
    ChangedCallback callback_;
};

} // namespace sendplus::core
