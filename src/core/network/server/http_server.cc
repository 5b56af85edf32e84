#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <core/constant/transfer.h>
#include <core/network/server/controller/common_controller.h>
#include <core/network/server/controller/receive_controller.h>
#include <core/network/server/http_server.h>
#include <limits>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace sendplus::core {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

bool isClosedError(const beast::error_code& ec) {
    return ec == http::error::end_of_stream || ec == net::error::eof
           || ec == net::error::operation_aborted || ec == net::error::connection_reset
           || ec == net::error::bad_descriptor || ec == beast::error::timeout;
}

// Route key of a request target: the path without its query string.
std::string routePath(beast::string_view target) {
    std::string path(target);
    if (auto query = path.find('?'); query != std::string::npos) {
        path.resize(query);
    }
    return path;
}

} // namespace

RequestBodyReader::RequestBodyReader(beast::tcp_stream& stream,
                                     beast::flat_buffer& buffer,
                                     http::request_parser<http::buffer_body>& parser)
    : stream_(stream)
    , buffer_(buffer)
    , parser_(parser)
    , chunk_(transfer::kBodyChunkSize) {}

net::awaitable<std::string_view> RequestBodyReader::ReadSome() {
    while (!parser_.is_done()) {
        auto& body = parser_.get().body();
        body.data = chunk_.data();
        body.size = chunk_.size();

        beast::error_code ec;
        stream_.expires_after(transfer::kServerReadTimeout);
        co_await http::async_read_some(stream_,
                                       buffer_,
                                       parser_,
                                       net::redirect_error(net::use_awaitable, ec));
        // need_buffer only means the chunk is full
        if (ec && ec != http::error::need_buffer) {
            throw boost::system::system_error(ec);
        }

        std::size_t received = chunk_.size() - parser_.get().body().size;
        if (received > 0) {
            bytes_read_ += received;
            co_return std::string_view(chunk_.data(), received);
        }
    }
    co_return std::string_view{};
}

net::awaitable<bool> RequestBodyReader::Discard(std::uint64_t limit) {
    std::uint64_t dropped = 0;
    while (!parser_.is_done() && dropped <= limit) {
        auto piece = co_await ReadSome();
        dropped += piece.size();
    }
    co_return parser_.is_done();
}

HttpServer::HttpServer(net::io_context& io_context,
                       ReceiveInbox& inbox,
                       SingleSlot<ServerState>& state)
    : io_context_(io_context)
    , state_(state)
    , acceptor_(io_context)
    , running_(false)
    , port_(0) {
    common_controller_ = std::make_unique<CommonController>(*this);
    receive_controller_ = std::make_unique<ReceiveController>(*this, inbox);
    spdlog::debug("HttpServer created.");
}

HttpServer::~HttpServer() {
    if (running_) {
        Stop();
    }
}

void HttpServer::AddRoute(const std::string& path, http::verb method, RouteHandler&& handler) {
    routes_[path] = {method, std::move(handler), nullptr};
    spdlog::debug("Added route: {} {}", std::string(http::to_string(method)), path);
}

void HttpServer::AddStreamRoute(const std::string& path,
                                http::verb method,
                                StreamRouteHandler&& handler) {
    routes_[path] = {method, nullptr, std::move(handler)};
    spdlog::debug("Added streaming route: {} {}", std::string(http::to_string(method)), path);
}

void HttpServer::SetSaveDirectory(const std::filesystem::path& save_dir) {
    receive_controller_->SetSaveDirectory(save_dir);
}

bool HttpServer::Start(std::uint16_t port) {
    if (running_) {
        spdlog::info("Server already running on port {}", port_);
        return true;
    }

    try {
        tcp::endpoint endpoint(tcp::v4(), port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
        running_ = true;
        port_ = acceptor_.local_endpoint().port();
        spdlog::info("HTTP server listening on port {}", port_);

        state_.Set(ServerState::Running(port_));
        net::co_spawn(io_context_, acceptConnections(), net::detached);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to start server on port {}: {}", port, e.what());
        running_ = false;
        port_ = 0;
        if (acceptor_.is_open()) {
            beast::error_code ec;
            acceptor_.close(ec);
        }
        state_.Set(ServerState::Error(e.what()));
        return false;
    }
}

void HttpServer::Stop() {
    if (!running_) {
        return;
    }
    spdlog::info("Stopping server...");
    running_ = false;

    beast::error_code ec;
    acceptor_.cancel(ec);
    acceptor_.close(ec);

    for (auto& [id, weak_stream] : connections_) {
        if (auto stream = weak_stream.lock()) {
            stream->close();
        }
    }
    connections_.clear();

    port_ = 0;
    state_.Set(ServerState::Stopped());
    spdlog::info("Server stopped.");
}

HttpResponse HttpServer::textResponse(http::status status,
                                      unsigned int version,
                                      bool keep_alive,
                                      std::string_view body) {
    HttpResponse res{status, version};
    res.keep_alive(keep_alive);
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.body() = body;
    res.prepare_payload();
    return res;
}

HttpResponse HttpServer::Ok(unsigned int version,
                            bool keep_alive,
                            std::string_view body,
                            std::string_view content_type) {
    HttpResponse res{http::status::ok, version};
    res.keep_alive(keep_alive);
    res.set(http::field::content_type, content_type);
    res.body() = body;
    res.prepare_payload();
    return res;
}

HttpResponse HttpServer::NotFound(unsigned int version,
                                  bool keep_alive,
                                  std::string_view error_message) {
    return textResponse(http::status::not_found, version, keep_alive, error_message);
}

HttpResponse HttpServer::BadRequest(unsigned int version,
                                    bool keep_alive,
                                    std::string_view error_message) {
    return textResponse(http::status::bad_request, version, keep_alive, error_message);
}

HttpResponse HttpServer::InternalServerError(unsigned int version,
                                             bool keep_alive,
                                             std::string_view error_message) {
    return textResponse(http::status::internal_server_error, version, keep_alive, error_message);
}

HttpResponse HttpServer::MethodNotAllowed(unsigned int version,
                                          bool keep_alive,
                                          std::string_view error_message) {
    return textResponse(http::status::method_not_allowed, version, keep_alive, error_message);
}

HttpResponse HttpServer::PayloadTooLarge(unsigned int version, std::string_view error_message) {
    return textResponse(http::status::payload_too_large, version, false, error_message);
}

net::awaitable<void> HttpServer::acceptConnections() {
    while (running_) {
        beast::error_code ec;
        tcp::socket socket = co_await acceptor_.async_accept(
            net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (ec == net::error::operation_aborted || !running_) {
                spdlog::debug("Accept operation cancelled.");
                break;
            }
            spdlog::error("Error accepting connection: {}", ec.message());
            continue;
        }
        if (!running_) {
            break;
        }

        auto stream = std::make_shared<beast::tcp_stream>(std::move(socket));
        auto connection_id = ++next_connection_id_;
        connections_.emplace(connection_id, stream);
        net::co_spawn(io_context_, handleConnection(stream, connection_id), net::detached);
    }
    spdlog::debug("Stopped accepting connections.");
}

net::awaitable<void> HttpServer::handleConnection(std::shared_ptr<beast::tcp_stream> stream,
                                                  std::uint64_t connection_id) {
    std::string remote = "unknown";
    {
        beast::error_code ec;
        auto endpoint = stream->socket().remote_endpoint(ec);
        if (!ec) {
            remote = fmt::format("{}:{}", endpoint.address().to_string(), endpoint.port());
        }
    }
    spdlog::debug("New connection from: {}", remote);

    try {
        beast::flat_buffer buffer;
        bool keep_alive = true;

        while (keep_alive && running_) {
            http::request_parser<http::empty_body> header_parser;

            beast::error_code ec;
            stream->expires_after(transfer::kServerReadTimeout);
            co_await http::async_read_header(*stream,
                                             buffer,
                                             header_parser,
                                             net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                if (isClosedError(ec)) {
                    break;
                }
                throw boost::system::system_error(ec);
            }

            const auto method = header_parser.get().method();
            const std::string path = routePath(header_parser.get().target());
            spdlog::info("{} {} from {}",
                         std::string(header_parser.get().method_string()),
                         std::string(header_parser.get().target()),
                         remote);

            HttpResponse res;
            auto route = routes_.find(path);
            if (route != routes_.end() && route->second.stream_handler
                && route->second.method == method) {
                http::request_parser<http::buffer_body> parser{std::move(header_parser)};
                parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
                RequestBodyReader body(*stream, buffer, parser);

                res = co_await handleStreamRequest(path, route->second, body);
                if (!body.done()) {
                    bool drained = co_await body.Discard(transfer::kMaxDrainedBodySize);
                    if (!drained) {
                        spdlog::debug("Closing connection with {} after an unread body", remote);
                        res.keep_alive(false);
                    }
                }
            } else {
                http::request_parser<http::string_body> parser{std::move(header_parser)};
                parser.body_limit(transfer::kMaxInMemoryBodySize);

                stream->expires_after(transfer::kServerReadTimeout);
                co_await http::async_read(*stream,
                                          buffer,
                                          parser,
                                          net::redirect_error(net::use_awaitable, ec));
                if (ec == http::error::body_limit) {
                    spdlog::warn("Request body from {} exceeds {} bytes",
                                 remote,
                                 transfer::kMaxInMemoryBodySize);
                    res = PayloadTooLarge(parser.get().version());
                    co_await http::async_write(*stream, res, net::use_awaitable);
                    break;
                }
                if (ec) {
                    if (isClosedError(ec)) {
                        break;
                    }
                    throw boost::system::system_error(ec);
                }

                res = co_await handleRequest(parser.release());
            }

            keep_alive = res.keep_alive();
            stream->expires_after(transfer::kServerReadTimeout);
            co_await http::async_write(*stream, res, net::use_awaitable);
        }

        beast::error_code ec;
        stream->socket().shutdown(tcp::socket::shutdown_send, ec);
    } catch (const boost::system::system_error& e) {
        if (isClosedError(e.code())) {
            spdlog::debug("Session with {} ended: {}", remote, e.code().message());
        } else {
            spdlog::error("Session error with {}: {}", remote, e.what());
        }
    } catch (const std::exception& e) {
        spdlog::error("Session error with {}: {}", remote, e.what());
    }

    connections_.erase(connection_id);
    spdlog::debug("Connection with {} finished.", remote);
}

net::awaitable<HttpResponse> HttpServer::handleRequest(HttpRequest&& req) {
    const std::string path = routePath(req.target());

    auto it = routes_.find(path);
    if (it == routes_.end()) {
        spdlog::warn("Route not found: {}", path);
        co_return NotFound(req.version(), req.keep_alive());
    }

    const auto& route_info = it->second;
    if (route_info.method != req.method() || !route_info.handler) {
        spdlog::warn("Method not allowed for route {}: requested {}, expected {}",
                     path,
                     std::string(http::to_string(req.method())),
                     std::string(http::to_string(route_info.method)));
        co_return MethodNotAllowed(req.version(), req.keep_alive());
    }

    auto request_version = req.version();
    bool request_keep_alive = req.keep_alive();

    std::string error_message;
    try {
        co_return co_await route_info.handler(std::move(req));
    } catch (const std::exception& e) {
        spdlog::error("Error executing handler for {}: {}", path, e.what());
        error_message = e.what();
    }
    co_return InternalServerError(request_version, request_keep_alive, error_message);
}

net::awaitable<HttpResponse> HttpServer::handleStreamRequest(const std::string& path,
                                                             const RouteInfo& route,
                                                             RequestBodyReader& body) {
    std::string error_message;
    try {
        co_return co_await route.stream_handler(body);
    } catch (const std::exception& e) {
        spdlog::error("Error executing handler for {}: {}", path, e.what());
        error_message = e.what();
    }
    co_return InternalServerError(body.version(), body.keep_alive(), error_message);
}

} // namespace sendplus::core
