#include <algorithm>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/constant/route.h>
#include <core/network/client/http_client.h>
#include <core/network/client/send_service.h>
#include <core/util/multipart.h>
#include <fstream>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace sendplus::core {

namespace {

constexpr std::size_t kFileChunkSize = 64 * 1024;

std::string preview(std::string_view text) {
    if (text.size() > 50) {
        return std::string(text.substr(0, 50)) + "...";
    }
    return std::string(text);
}

std::string url(const DeviceInfo& target, std::string_view route) {
    return fmt::format("http://{}:{}{}", target.ip, target.port, route);
}

} // namespace

SendService::SendService(net::io_context& ioc, RetryPolicy text_retry_policy)
    : ioc_(ioc)
    , text_retry_policy_(text_retry_policy) {}

void SendService::SetRetryCallback(RetryCallback callback) {
    retry_callback_ = std::move(callback);
}

net::awaitable<void> SendService::SendFile(DeviceInfo target,
                                           std::string file_name,
                                           std::optional<fs::path> file_path,
                                           std::optional<std::vector<std::uint8_t>> file_bytes) {
    if (!file_path && !file_bytes) {
        throw std::invalid_argument("SendFile requires either a file path or file bytes.");
    }
    if (file_path && file_bytes) {
        spdlog::warn("Both file path and file bytes provided to SendFile. Using file bytes.");
        file_path.reset();
    }

    std::uint64_t file_size = 0;
    std::ifstream file_stream;
    if (file_bytes) {
        file_size = file_bytes->size();
        spdlog::info("Preparing to send {} ({} bytes) from memory...", file_name, file_size);
    } else {
        std::error_code ec;
        file_size = fs::file_size(*file_path, ec);
        if (ec) {
            throw TransferError(
                fmt::format("Error sending file: cannot read {}: {}", file_path->string(), ec.message()));
        }
        file_stream.open(*file_path, std::ios::binary);
        if (!file_stream) {
            throw TransferError(fmt::format("Error sending file: cannot open {}", file_path->string()));
        }
        spdlog::info("Preparing to send {} ({} bytes) from path {}...",
                     file_name,
                     file_size,
                     file_path->string());
    }

    multipart::FormBuilder form;
    form.AddField("fileName", file_name);
    form.AddField("fileSize", std::to_string(file_size));
    form.SetFile("file", file_name);
    const std::string preamble = form.preamble();
    const std::string epilogue = form.epilogue();

    spdlog::info("Sending {} ({} bytes) to {} at {}...",
                 file_name,
                 file_size,
                 target.alias,
                 url(target, ApiRoute::kReceive));

    enum class Stage { kPreamble, kFile, kDone };
    Stage stage = Stage::kPreamble;
    std::uint64_t sent = 0;
    std::vector<char> chunk(kFileChunkSize);
    auto next_chunk = [&]() -> net::const_buffer {
        if (stage == Stage::kPreamble) {
            stage = Stage::kFile;
            return net::buffer(preamble);
        }
        if (stage == Stage::kFile && sent < file_size) {
            if (file_bytes) {
                sent = file_size;
                return net::buffer(file_bytes->data(), file_bytes->size());
            }
            auto want = std::min<std::uint64_t>(chunk.size(), file_size - sent);
            file_stream.read(chunk.data(), static_cast<std::streamsize>(want));
            auto got = static_cast<std::size_t>(file_stream.gcount());
            if (got == 0) {
                throw TransferError("file was truncated while sending");
            }
            sent += got;
            return net::buffer(chunk.data(), got);
        }
        if (stage != Stage::kDone) {
            stage = Stage::kDone;
            return net::buffer(epilogue);
        }
        return {};
    };

    std::optional<std::string> failure;
    try {
        HttpClient client(ioc_);
        co_await client.Connect(target.ip, target.port);

        auto req = client.CreateRequest<http::buffer_body>(http::verb::post,
                                                           std::string(ApiRoute::kReceive));
        req.set(http::field::content_type, form.ContentType());
        req.content_length(form.ContentLength(file_size));

        auto res = co_await client.SendStreamingRequest(req, next_chunk);
        if (res.result() != http::status::ok) {
            spdlog::error("Server error response: {}", res.body());
            failure = fmt::format("Failed to send file: Server responded with status {}",
                                  res.result_int());
        }
    } catch (const std::exception& e) {
        failure = fmt::format("Error sending file: {}", e.what());
    }

    if (failure) {
        spdlog::error("Sending {} to {} failed: {}", file_name, target.alias, *failure);
        throw TransferError(*failure);
    }
    spdlog::info("File {} sent successfully to {}.", file_name, target.alias);
}

net::awaitable<void> SendService::SendText(DeviceInfo target, std::string text) {
    const auto& policy = text_retry_policy_;
    spdlog::info("Sending text \"{}\" to {} at {}...",
                 preview(text),
                 target.alias,
                 url(target, ApiRoute::kReceiveText));

    std::string last_error;
    for (int attempt = 0; attempt <= policy.max_retries; ++attempt) {
        if (attempt > 0) {
            auto delay = policy.DelayBefore(attempt);
            spdlog::info("Retrying in {}ms...", delay.count());
            if (retry_callback_) {
                retry_callback_(attempt, delay, last_error);
            }
            net::steady_timer timer(co_await net::this_coro::executor, delay);
            co_await timer.async_wait(net::use_awaitable);
        }

        try {
            HttpClient client(ioc_);
            client.SetDeadline(std::chrono::steady_clock::now() + policy.attempt_timeout);
            co_await client.Connect(target.ip, target.port);

            auto req = client.CreateRequest<http::string_body>(http::verb::post,
                                                               std::string(ApiRoute::kReceiveText));
            req.set(http::field::content_type, "text/plain; charset=utf-8");
            req.body() = text;
            req.prepare_payload();

            auto res = co_await client.SendRequest(req);
            if (res.result() == http::status::ok) {
                spdlog::info("Text sent successfully to {}.", target.alias);
                co_return;
            }
            last_error = fmt::format("Server responded with status {}: {}",
                                     res.result_int(),
                                     res.body());
        } catch (const boost::system::system_error& e) {
            if (e.code() == beast::error::timeout) {
                last_error = fmt::format("Request timed out after {} ms",
                                         policy.attempt_timeout.count());
            } else {
                last_error = fmt::format("Network error: {}", e.code().message());
            }
        }
        spdlog::warn("Attempt {} failed: {}", attempt + 1, last_error);
    }

    spdlog::error("Error sending text to {}: {}", target.alias, last_error);
    throw TransferError(
        fmt::format("Failed to send text after {} retries: {}", policy.max_retries, last_error));
}

} // namespace sendplus::core
