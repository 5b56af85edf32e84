#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <core/constant/network.h>
#include <core/model/server_state.h>
#include <core/network/client/send_service.h>
#include <core/network/discovery/device_registry.h>
#include <core/network/discovery/discovery_manager.h>
#include <core/network/server/http_server.h>
#include <core/network/server/receive_inbox.h>
#include <core/util/single_slot.h>
#include <cstdint>
#include <future>
#include <type_traits>
#include <utility>

namespace sendplus::core {

/**
 * @brief Wires discovery, the transfer server and the transfer client to
 * one io_context and owns the state they share.
 *
 * The registry and the slots may be read from any thread. Everything else
 * must be used on the io_context's thread; other threads go through Run().
 */
class SendPlusService {
public:
    explicit SendPlusService(boost::asio::io_context& ioc,
                             DiscoveryOptions discovery_options = {},
                             std::uint16_t server_port = network::kDefaultPort);
    ~SendPlusService();

    SendPlusService(const SendPlusService&) = delete;
    SendPlusService& operator=(const SendPlusService&) = delete;

    // Server first, then discovery. Returns false if the server could not
    // be started; discovery runs either way.
    bool Start();

    // Discovery first, then the server.
    void Stop();

    bool running() const { return running_; }

    // Runs fn on the io_context's thread and returns its result. The
    // io_context must be running on another thread, or this is that thread.
    template<typename Fn>
    std::invoke_result_t<Fn&> Run(Fn&& fn) {
        using Result = std::invoke_result_t<Fn&>;
        if (ioc_.get_executor().running_in_this_thread()) {
            return fn();
        }
        std::packaged_task<Result()> task(std::forward<Fn>(fn));
        auto future = task.get_future();
        boost::asio::post(ioc_, std::move(task));
        return future.get();
    }

    // The file stays on disk.
    void KeepReceivedFile();

    // Removes the last received file from disk.
    void DiscardReceivedFile();

    void AcknowledgeReceivedText();

    boost::asio::io_context& io_context() { return ioc_; }
    DeviceRegistry& registry() { return registry_; }
    ReceiveInbox& inbox() { return inbox_; }
    SingleSlot<ServerState>& server_state() { return server_state_; }
    DiscoveryManager& discovery_manager() { return discovery_manager_; }
    HttpServer& http_server() { return http_server_; }
    SendService& send_service() { return send_service_; }

private:
    boost::asio::io_context& ioc_;
    DeviceRegistry registry_;
    ReceiveInbox inbox_;
    SingleSlot<ServerState> server_state_{ServerState::Stopped()};
    DiscoveryManager discovery_manager_;
    HttpServer http_server_;
    SendService send_service_;
    std::uint16_t server_port_;
    bool running_{false};
};

} // namespace sendplus::core
