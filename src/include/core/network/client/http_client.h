#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sendplus::core {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using HttpResponse = http::response<http::string_body>;

// One plain HTTP/1.1 connection. The connection is released when the client
// goes out of scope, whatever path the caller leaves by.
class HttpClient {
public:
    explicit HttpClient(net::io_context& ioc);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // One deadline shared by resolve, connect, write and read. Unset means
    // the connect timeout only.
    void SetDeadline(std::optional<std::chrono::steady_clock::time_point> deadline) {
        deadline_ = deadline;
    }

    // Throws boost::system::system_error on resolve/connect failure, or with
    // beast::error::timeout once the deadline has passed.
    net::awaitable<void> Connect(std::string_view host, unsigned short port);

    void Disconnect();

    bool IsConnected() const;

    std::string current_host() const;

    unsigned short current_port() const;

    template<typename RequestBody>
    net::awaitable<HttpResponse> SendRequest(http::request<RequestBody>& req);

    // Streams a body produced piecewise: `next_chunk` is called until it
    // returns an empty buffer. `req` must carry Content-Length.
    net::awaitable<HttpResponse> SendStreamingRequest(
        http::request<http::buffer_body>& req, const std::function<net::const_buffer()>& next_chunk);

    template<typename Body>
    http::request<Body> CreateRequest(http::verb method,
                                      const std::string& target,
                                      bool keepAlive = false);

private:
    void armTimeout();

    net::io_context& ioc_;
    std::unique_ptr<beast::tcp_stream> connection_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    std::string current_host_;
    unsigned short current_port_ = 0;
};

template<typename RequestBody>
net::awaitable<HttpResponse> HttpClient::SendRequest(http::request<RequestBody>& req) {
    if (!connection_) {
        throw std::runtime_error("No active connection");
    }

    armTimeout();
    co_await http::async_write(*connection_, req, net::use_awaitable);

    beast::flat_buffer buffer;
    HttpResponse res;
    co_await http::async_read(*connection_, buffer, res, net::use_awaitable);

    co_return res;
}

template<typename Body>
http::request<Body> HttpClient::CreateRequest(http::verb method,
                                              const std::string& target,
                                              bool keepAlive) {
    http::request<Body> req{method, target, 11};

    if (!current_host_.empty()) {
        req.set(http::field::host, current_host_ + ":" + std::to_string(current_port_));
    }

    req.set(http::field::user_agent, "SendPlus/" BOOST_BEAST_VERSION_STRING);
    req.keep_alive(keepAlive);

    return req;
}

} // namespace sendplus::core
