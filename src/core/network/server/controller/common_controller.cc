#include <core/constant/route.h>
#include <core/constant/transfer.h>
#include <core/network/server/controller/common_controller.h>
#include <core/network/server/http_server.h>
#include <core/util/config.h>
#include <core/util/system.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace net = boost::asio;
namespace http = boost::beast::http;
using json = nlohmann::json;

namespace sendplus::core {

CommonController::CommonController(HttpServer& server) {
    installRoutes(server);
}

net::awaitable<HttpResponse> CommonController::onRoot(const HttpRequest& req) {
    spdlog::debug("CommonController::onRoot");
    co_return HttpServer::Ok(req.version(), req.keep_alive(), "Hello from SendPlus server!");
}

net::awaitable<HttpResponse> CommonController::onInfo(const HttpRequest& req) {
    spdlog::debug("CommonController::onInfo");
    json info = {
        {"alias", settings.alias},
        {"version", std::string(transfer::kVersion)},
        {"deviceModel", system::OperatingSystem()},
        {"https", false},
    };
    co_return HttpServer::Ok(req.version(), req.keep_alive(), info.dump(), "application/json");
}

void CommonController::installRoutes(HttpServer& server) {
    server.AddRoute(ApiRoute::kRoot.data(),
                    http::verb::get,
                    std::bind(&CommonController::onRoot, this, std::placeholders::_1));
    server.AddRoute(ApiRoute::kInfo.data(),
                    http::verb::get,
                    std::bind(&CommonController::onInfo, this, std::placeholders::_1));
}

} // namespace sendplus::core
