#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <core/model/server_state.h>
#include <core/network/server/receive_inbox.h>
#include <core/util/single_slot.h>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sendplus::core {

class CommonController;
class ReceiveController;

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

using HttpRequestHeader = boost::beast::http::request_header<>;

// Body of a request that a handler consumes piece by piece instead of
// having it buffered. The header is complete when the handler is called.
class RequestBodyReader {
public:
    RequestBodyReader(boost::beast::tcp_stream& stream,
                      boost::beast::flat_buffer& buffer,
                      boost::beast::http::request_parser<boost::beast::http::buffer_body>& parser);

    const HttpRequestHeader& header() const { return parser_.get().base(); }
    unsigned int version() const { return parser_.get().version(); }
    bool keep_alive() const { return parser_.get().keep_alive(); }

    // Next piece of the body, valid until the following call. Empty once the
    // body is complete. Throws boost::system::system_error when the
    // connection fails or stays idle past the read timeout.
    boost::asio::awaitable<std::string_view> ReadSome();

    // Reads and drops what is left of the body, up to `limit` bytes.
    // Returns whether the body was consumed completely.
    boost::asio::awaitable<bool> Discard(std::uint64_t limit);

    bool done() const { return parser_.is_done(); }
    std::uint64_t bytes_read() const { return bytes_read_; }

private:
    boost::beast::tcp_stream& stream_;
    boost::beast::flat_buffer& buffer_;
    boost::beast::http::request_parser<boost::beast::http::buffer_body>& parser_;
    std::vector<char> chunk_;
    std::uint64_t bytes_read_{0};
};

using RouteHandler = std::function<boost::asio::awaitable<HttpResponse>(HttpRequest&&)>;
using StreamRouteHandler = std::function<boost::asio::awaitable<HttpResponse>(RequestBodyReader&)>;

// Exactly one of the handlers is set.
struct RouteInfo {
    boost::beast::http::verb method;
    RouteHandler handler;
    StreamRouteHandler stream_handler;
};

// Plain HTTP server for the transfer endpoints. Not thread-safe: call from
// the io_context's thread, or while it is not running.
class HttpServer {
public:
    HttpServer(boost::asio::io_context& io_context,
               ReceiveInbox& inbox,
               SingleSlot<ServerState>& state);

    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // The body is read into memory before `handler` runs.
    void AddRoute(const std::string& path, boost::beast::http::verb method, RouteHandler&& handler);

    // `handler` reads the body itself. Whatever it leaves unread is drained
    // or the connection is closed after the response.
    void AddStreamRoute(const std::string& path,
                        boost::beast::http::verb method,
                        StreamRouteHandler&& handler);

    // Idempotent. Returns false and publishes an error state when the port
    // cannot be bound.
    bool Start(std::uint16_t port);

    // Closes the listener and every open connection without draining them.
    void Stop();

    bool running() const { return running_; }

    // Actual bound port, useful when started on port 0.
    std::uint16_t port() const { return port_; }

    std::size_t connection_count() const { return connections_.size(); }

    void SetSaveDirectory(const std::filesystem::path& save_dir);

    static HttpResponse Ok(unsigned int version,
                           bool keep_alive,
                           std::string_view body = {},
                           std::string_view content_type = "text/plain; charset=utf-8");
    static HttpResponse NotFound(unsigned int version,
                                 bool keep_alive,
                                 std::string_view error_message = "Not Found");
    static HttpResponse BadRequest(unsigned int version,
                                   bool keep_alive,
                                   std::string_view error_message = "Bad Request");
    static HttpResponse InternalServerError(
        unsigned int version,
        bool keep_alive,
        std::string_view error_message = "Internal Server Error");
    static HttpResponse MethodNotAllowed(unsigned int version,
                                         bool keep_alive,
                                         std::string_view error_message = "Method Not Allowed");
    static HttpResponse PayloadTooLarge(unsigned int version,
                                        std::string_view error_message = "Payload Too Large");

private:
    static HttpResponse textResponse(boost::beast::http::status status,
                                     unsigned int version,
                                     bool keep_alive,
                                     std::string_view body);

    boost::asio::awaitable<void> acceptConnections();

    boost::asio::awaitable<void> handleConnection(std::shared_ptr<boost::beast::tcp_stream> stream,
                                                  std::uint64_t connection_id);

    boost::asio::awaitable<HttpResponse> handleRequest(HttpRequest&& request);

    boost::asio::awaitable<HttpResponse> handleStreamRequest(const std::string& path,
                                                             const RouteInfo& route,
                                                             RequestBodyReader& body);

    boost::asio::io_context& io_context_;
    SingleSlot<ServerState>& state_;
    boost::asio::ip::tcp::acceptor acceptor_;
    bool running_;
    std::uint16_t port_;
    std::uint64_t next_connection_id_{0};
    std::unordered_map<std::uint64_t, std::weak_ptr<boost::beast::tcp_stream>> connections_;
    std::map<std::string, RouteInfo> routes_;
    std::unique_ptr<CommonController> common_controller_;
    std::unique_ptr<ReceiveController> receive_controller_;
};

} // namespace sendplus::core
