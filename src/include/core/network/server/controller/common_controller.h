#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <core/network/server/http_server.h>

namespace sendplus::core {

// Serves the greeting and the device information endpoints.
class CommonController {
public:
    explicit CommonController(HttpServer& server);
    ~CommonController() = default;

private:
    boost::asio::awaitable<HttpResponse> onRoot(const HttpRequest& req);

    boost::asio::awaitable<HttpResponse> onInfo(const HttpRequest& req);

    void installRoutes(HttpServer& server);
};

} // namespace sendplus::core
