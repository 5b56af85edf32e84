#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <core/network/server/http_server.h>
#include <core/network/server/receive_inbox.h>
#include <filesystem>

namespace sendplus::core {

// Accepts uploaded files and text messages and publishes them to the inbox.
class ReceiveController {
public:
    // An empty save_dir means settings.save_dir, read on every upload.
    ReceiveController(HttpServer& server,
                      ReceiveInbox& inbox,
                      const std::filesystem::path& save_dir = {});
    ~ReceiveController() = default;

    void SetSaveDirectory(const std::filesystem::path& save_dir);

    std::filesystem::path save_directory() const;

private:
    boost::asio::awaitable<HttpResponse> onReceive(RequestBodyReader& body);

    boost::asio::awaitable<HttpResponse> onReceiveText(const HttpRequest& req);

    void installRoutes();

    HttpServer& server_;
    ReceiveInbox& inbox_;
    std::filesystem::path save_dir_;
};

} // namespace sendplus::core
