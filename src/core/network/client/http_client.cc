#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <core/constant/transfer.h>
#include <core/network/client/http_client.h>
#include <spdlog/spdlog.h>

namespace sendplus::core {

HttpClient::HttpClient(net::io_context& ioc)
    : ioc_(ioc) {}

HttpClient::~HttpClient() {
    Disconnect();
}

net::awaitable<void> HttpClient::Connect(std::string_view host, unsigned short port) {
    if (connection_) {
        Disconnect();
    }

    try {
        connection_ = std::make_unique<beast::tcp_stream>(ioc_);

        // The resolver has no timeout of its own: cancel it when the deadline
        // fires. The handler may outlive this frame, so it owns the resolver.
        auto resolver = std::make_shared<tcp::resolver>(ioc_);
        net::steady_timer resolve_timer(ioc_);
        if (deadline_) {
            resolve_timer.expires_at(*deadline_);
            resolve_timer.async_wait([resolver](const beast::error_code& ec) {
                if (!ec) {
                    resolver->cancel();
                }
            });
        }

        beast::error_code ec;
        auto results = co_await resolver->async_resolve(std::string(host),
                                                        std::to_string(port),
                                                        net::redirect_error(net::use_awaitable, ec));
        resolve_timer.cancel();
        if (ec) {
            if (deadline_ && std::chrono::steady_clock::now() >= *deadline_) {
                throw boost::system::system_error(beast::error::timeout);
            }
            throw boost::system::system_error(ec);
        }

        if (deadline_) {
            connection_->expires_at(*deadline_);
        } else {
            connection_->expires_after(transfer::kConnectTimeout);
        }
        co_await connection_->async_connect(results, net::use_awaitable);
        connection_->expires_never();

        current_host_ = host;
        current_port_ = port;

        spdlog::debug("Connected to {}:{}", host, port);
    } catch (const std::exception& e) {
        spdlog::debug("Connection to {}:{} failed: {}", host, port, e.what());
        connection_.reset();
        current_host_.clear();
        current_port_ = 0;
        throw;
    }
}

void HttpClient::Disconnect() {
    if (!connection_) {
        return;
    }

    beast::error_code ec;
    connection_->socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        spdlog::debug("Shutdown notice: {}", ec.message());
    }
    connection_->close();

    connection_.reset();
    current_host_.clear();
    current_port_ = 0;
    spdlog::trace("Disconnected");
}

net::awaitable<HttpResponse> HttpClient::SendStreamingRequest(
    http::request<http::buffer_body>& req, const std::function<net::const_buffer()>& next_chunk) {
    if (!connection_) {
        throw std::runtime_error("No active connection");
    }

    armTimeout();
    req.body().data = nullptr;
    req.body().more = true;

    http::request_serializer<http::buffer_body> serializer{req};
    co_await http::async_write_header(*connection_, serializer, net::use_awaitable);

    while (true) {
        net::const_buffer chunk = next_chunk();
        if (chunk.size() == 0) {
            break;
        }
        req.body().data = const_cast<void*>(chunk.data());
        req.body().size = chunk.size();
        req.body().more = true;

        // need_buffer only means the chunk was consumed
        beast::error_code ec;
        co_await http::async_write(*connection_,
                                   serializer,
                                   net::redirect_error(net::use_awaitable, ec));
        if (ec && ec != http::error::need_buffer) {
            throw boost::system::system_error(ec);
        }
    }

    req.body().data = nullptr;
    req.body().size = 0;
    req.body().more = false;
    co_await http::async_write(*connection_, serializer, net::use_awaitable);

    beast::flat_buffer buffer;
    HttpResponse res;
    co_await http::async_read(*connection_, buffer, res, net::use_awaitable);

    co_return res;
}

bool HttpClient::IsConnected() const {
    return connection_ != nullptr;
}

std::string HttpClient::current_host() const {
    return current_host_;
}

unsigned short HttpClient::current_port() const {
    return current_port_;
}

void HttpClient::armTimeout() {
    if (deadline_) {
        connection_->expires_at(*deadline_);
    } else {
        connection_->expires_never();
    }
}

} // namespace sendplus::core
