#pragma once

#include <cli/terminal.h>
#include <core/model.h>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <condition_variable>
#include <core/sendplus_service.h>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sendplus::cli {

// The service's io_context must be running on another thread while a
// CliManager is constructed and destroyed.
class CliManager {
public:
    explicit CliManager(core::SendPlusService& service);
    ~CliManager();

    CliManager(const CliManager&) = delete;
    CliManager& operator=(const CliManager&) = delete;

    // Runs a top-level command (none means "serve") and returns the process
    // exit code.
    int Execute(const std::optional<std::string>& command, const std::vector<std::string>& args);

    void process_command(const std::string& line);
    void start_interactive_mode();

    // Blocks until every send started from the prompt has reported back, or
    // `limit` passes. Returns whether none is left.
    bool WaitForSends(std::chrono::milliseconds limit);
    std::size_t pending_sends() const;

    // Parses "HOST" or "HOST:PORT"; the port defaults to the transfer port.
    static std::optional<core::DeviceInfo> parse_address(const std::string& address);

private:
    // Shared with the completion handlers of prompt sends, which may finish
    // after the CliManager is gone. Once detached they no longer report.
    struct PendingSends {
        mutable std::mutex mutex;
        std::condition_variable finished;
        std::size_t count{0};
        bool detached{false};
    };

    core::SendPlusService& service_;
    std::unique_ptr<Terminal> terminal_;
    std::unordered_map<std::string, core::DeviceInfo> known_devices_;
    bool exit_requested_{false};
    std::shared_ptr<PendingSends> pending_sends_;

    // one-shot commands
    int run_send_text(const std::string& address, const std::string& text);
    int run_send_file(const std::string& address, const std::string& file_path);
    int run_print_card();

    // interactive commands
    void handle_list_devices();
    void handle_send_text(const std::string& index, const std::string& text);
    void handle_send_file(const std::string& index, const std::string& file_path);
    void handle_add_device(const std::string& card);
    void handle_keep();
    void handle_discard();
    void handle_ack_text();
    void handle_status();
    void handle_show_help();

    void spawn_send(boost::asio::awaitable<void> send, std::string delivered_message);
    void detach_sends();

    std::optional<core::DeviceInfo> device_at(const std::string& index);
    std::string own_card();

    void install_notifications();
    void remove_notifications();
    void on_devices_changed(const std::vector<core::DeviceInfo>& devices);

    void print_info(const std::string& message);
    void print_error(const std::string& message);
};

} // namespace sendplus::cli
