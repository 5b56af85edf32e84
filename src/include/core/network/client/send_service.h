#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <core/constant/transfer.h>
#include <core/model/device_info.h>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sendplus::core {

// A push to a peer that did not succeed.
class TransferError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RetryPolicy {
    int max_retries = transfer::kTextMaxRetries;
    std::chrono::milliseconds base_delay = transfer::kTextRetryBaseDelay;
    std::chrono::milliseconds attempt_timeout = transfer::kTextAttemptTimeout;

    // Wait before retry number `retry` (1-based): base_delay * 2^retry
    std::chrono::milliseconds DelayBefore(int retry) const { return base_delay * (1 << retry); }
};

class SendService {
public:
    using RetryCallback =
        std::function<void(int retry, std::chrono::milliseconds delay, std::string_view error)>;

    explicit SendService(boost::asio::io_context& ioc, RetryPolicy text_retry_policy = {});
    ~SendService() = default;

    SendService(const SendService&) = delete;
    SendService& operator=(const SendService&) = delete;

    // Multipart POST to /receive. When both sources are given the bytes are
    // sent and the path is ignored; with neither, throws
    // std::invalid_argument. Any other failure throws TransferError. Never
    // retried.
    boost::asio::awaitable<void> SendFile(DeviceInfo target,
                                          std::string file_name,
                                          std::optional<std::filesystem::path> file_path,
                                          std::optional<std::vector<std::uint8_t>> file_bytes);

    // Plain-text POST to /receive-text, retried with exponential backoff on
    // non-200 answers, timeouts and connection errors. Throws TransferError
    // once the retries are used up.
    boost::asio::awaitable<void> SendText(DeviceInfo target, std::string text);

    // Observes each backoff before it is waited out.
    void SetRetryCallback(RetryCallback callback);

    const RetryPolicy& text_retry_policy() const { return text_retry_policy_; }

private:
    boost::asio::io_context& ioc_;
    RetryPolicy text_retry_policy_;
    RetryCallback retry_callback_;
};

} // namespace sendplus::core
