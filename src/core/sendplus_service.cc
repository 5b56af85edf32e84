#include <core/sendplus_service.h>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <system_error>

namespace net = boost::asio;
namespace fs = std::filesystem;

namespace sendplus::core {

SendPlusService::SendPlusService(net::io_context& ioc,
                                 DiscoveryOptions discovery_options,
                                 std::uint16_t server_port)
    : ioc_(ioc)
    , discovery_manager_(ioc, registry_, std::move(discovery_options))
    , http_server_(ioc, inbox_, server_state_)
    , send_service_(ioc)
    , server_port_(server_port) {}

SendPlusService::~SendPlusService() {
    Stop();
}

bool SendPlusService::Start() {
    if (running_) {
        spdlog::debug("SendPlusService already started");
        return http_server_.running();
    }
    bool server_started = http_server_.Start(server_port_);
    if (server_started) {
        discovery_manager_.SetAdvertisedPort(http_server_.port());
    } else {
        spdlog::error("Transfer server is not available, files and text cannot be received");
    }
    discovery_manager_.Start();
    running_ = true;
    spdlog::debug("SendPlusService started");
    return server_started;
}

void SendPlusService::Stop() {
    if (!running_) {
        return;
    }
    discovery_manager_.Stop();
    http_server_.Stop();
    running_ = false;
    spdlog::debug("SendPlusService stopped");
}

void SendPlusService::KeepReceivedFile() {
    if (auto file = inbox_.file.Take(); file) {
        spdlog::info("Kept \"{}\" at {}", file->filename, file->path.string());
    }
}

void SendPlusService::DiscardReceivedFile() {
    auto file = inbox_.file.Take();
    if (!file) {
        return;
    }
    std::error_code ec;
    if (fs::remove(file->path, ec)) {
        spdlog::info("Discarded \"{}\"", file->filename);
    } else if (ec) {
        spdlog::error("Failed to delete {}: {}", file->path.string(), ec.message());
    } else {
        spdlog::warn("{} was already gone", file->path.string());
    }
}

void SendPlusService::AcknowledgeReceivedText() {
    inbox_.text.Clear();
}

} // namespace sendplus::core
