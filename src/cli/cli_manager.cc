#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>
#include <charconv>
#include <cli/cli_manager.h>
#include <core/constant/network.h>
#include <core/util/config.h>
#include <core/util/device_card.h>
#include <core/util/system.h>
#include <exception>
#include <filesystem>
#include <iostream>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
namespace net = boost::asio;

using namespace sendplus::core;

namespace sendplus::cli {

namespace {

// Splits off at most `count - 1` words; the last element keeps the rest of
// the line with its spaces.
std::vector<std::string> split_words(const std::string& line, std::size_t count) {
    std::vector<std::string> words;
    std::size_t pos = 0;
    while (words.size() + 1 < count) {
        pos = line.find_first_not_of(' ', pos);
        if (pos == std::string::npos) {
            return words;
        }
        auto end = line.find(' ', pos);
        words.push_back(line.substr(pos, end == std::string::npos ? end : end - pos));
        if (end == std::string::npos) {
            return words;
        }
        pos = end;
    }
    pos = line.find_first_not_of(' ', pos);
    if (pos != std::string::npos) {
        words.push_back(line.substr(pos));
    }
    return words;
}

std::string join(const std::vector<std::string>& words, std::size_t first) {
    std::string joined;
    for (std::size_t i = first; i < words.size(); ++i) {
        if (i > first) {
            joined += ' ';
        }
        joined += words[i];
    }
    return joined;
}

const char* discovery_state_name(DiscoveryState state) {
    switch (state) {
    case DiscoveryState::kIdle:
        return "idle";
    case DiscoveryState::kStarting:
        return "starting";
    case DiscoveryState::kRunning:
        return "running";
    case DiscoveryState::kStopping:
        return "stopping";
    }
    return "unknown";
}

// How long leaving the prompt waits for sends that are still running.
constexpr std::chrono::seconds kSendDrainTimeout{15};

} // namespace

CliManager::CliManager(SendPlusService& service)
    : service_(service)
    , pending_sends_(std::make_shared<PendingSends>()) {
    service_.Run([this] {
        service_.send_service().SetRetryCallback(
            [this](int retry, std::chrono::milliseconds delay, std::string_view error) {
                print_info(
                    fmt::format("Send failed ({}), retry {} in {} ms", error, retry, delay.count()));
            });
    });
}

CliManager::~CliManager() {
    detach_sends();
    remove_notifications();
    service_.Run([this] { service_.send_service().SetRetryCallback(nullptr); });
}

bool CliManager::WaitForSends(std::chrono::milliseconds limit) {
    std::unique_lock lock(pending_sends_->mutex);
    return pending_sends_->finished.wait_for(lock, limit, [this] { return pending_sends_->count == 0; });
}

std::size_t CliManager::pending_sends() const {
    std::lock_guard lock(pending_sends_->mutex);
    return pending_sends_->count;
}

void CliManager::spawn_send(net::awaitable<void> send, std::string delivered_message) {
    {
        std::lock_guard lock(pending_sends_->mutex);
        ++pending_sends_->count;
    }
    net::co_spawn(service_.io_context(),
                  std::move(send),
                  [this, pending = pending_sends_, delivered_message = std::move(delivered_message)](
                      std::exception_ptr e) {
                      std::lock_guard lock(pending->mutex);
                      if (!pending->detached) {
                          if (!e) {
                              print_info(delivered_message);
                          } else {
                              try {
                                  std::rethrow_exception(e);
                              } catch (const std::exception& ex) {
                                  print_error(ex.what());
                              }
                          }
                      }
                      --pending->count;
                      pending->finished.notify_all();
                  });
}

void CliManager::detach_sends() {
    std::lock_guard lock(pending_sends_->mutex);
    if (pending_sends_->count > 0 && !pending_sends_->detached) {
        spdlog::warn("{} send(s) still running, their results will not be shown",
                     pending_sends_->count);
    }
    pending_sends_->detached = true;
}

std::optional<DeviceInfo> CliManager::parse_address(const std::string& address) {
    DeviceInfo device;
    device.port = network::kDefaultPort;

    auto colon = address.rfind(':');
    if (colon == std::string::npos) {
        device.ip = address;
    } else {
        device.ip = address.substr(0, colon);
        std::string_view port_text = std::string_view(address).substr(colon + 1);
        unsigned int port = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(),
                                         port_text.data() + port_text.size(),
                                         port);
        if (ec != std::errc() || ptr != port_text.data() + port_text.size() || port == 0
            || port > 65535) {
            return std::nullopt;
        }
        device.port = static_cast<std::uint16_t>(port);
    }
    if (device.ip.empty()) {
        return std::nullopt;
    }
    device.alias = device.ip;
    return device;
}

int CliManager::Execute(const std::optional<std::string>& command,
                        const std::vector<std::string>& args) {
    if (!command || *command == "serve") {
        start_interactive_mode();
        return 0;
    }
    if (*command == "send-text") {
        if (args.size() < 2) {
            print_error("Usage: sendplus send-text HOST[:PORT] TEXT");
            return 1;
        }
        return run_send_text(args[0], join(args, 1));
    }
    if (*command == "send-file") {
        if (args.size() != 2) {
            print_error("Usage: sendplus send-file HOST[:PORT] PATH");
            return 1;
        }
        return run_send_file(args[0], args[1]);
    }
    if (*command == "card") {
        return run_print_card();
    }
    print_error("Unknown command: " + *command);
    return 1;
}

int CliManager::run_send_text(const std::string& address, const std::string& text) {
    auto target = parse_address(address);
    if (!target) {
        print_error("Invalid address: " + address);
        return 1;
    }
    try {
        net::co_spawn(service_.io_context(),
                      service_.send_service().SendText(*target, text),
                      net::use_future)
            .get();
    } catch (const std::exception& e) {
        print_error(e.what());
        return 1;
    }
    print_info("Text sent to " + DeviceKey(*target));
    return 0;
}

int CliManager::run_send_file(const std::string& address, const std::string& file_path) {
    auto target = parse_address(address);
    if (!target) {
        print_error("Invalid address: " + address);
        return 1;
    }
    fs::path path(file_path);
    if (!fs::is_regular_file(path)) {
        print_error("Not a file: " + file_path);
        return 1;
    }
    try {
        net::co_spawn(service_.io_context(),
                      service_.send_service().SendFile(*target,
                                                       path.filename().string(),
                                                       path,
                                                       std::nullopt),
                      net::use_future)
            .get();
    } catch (const std::exception& e) {
        print_error(e.what());
        return 1;
    }
    print_info(fmt::format("\"{}\" sent to {}", path.filename().string(), DeviceKey(*target)));
    return 0;
}

int CliManager::run_print_card() {
    std::cout << own_card() << std::endl;
    return 0;
}

void CliManager::start_interactive_mode() {
    terminal_ = std::make_unique<Terminal>();
    install_notifications();

    bool server_started = service_.Run([this] { return service_.Start(); });
    if (!server_started) {
        print_error("Receiving is unavailable, the transfer server could not start.");
    }
    print_info(fmt::format("Sharing as \"{}\", saving into {}",
                           settings.alias,
                           settings.save_dir.string()));
    print_info("Type 'help' for the list of commands.");

    exit_requested_ = false;
    while (!exit_requested_) {
        terminal_->PrintPrompt();
        auto line = terminal_->ReadLine();
        if (!line) {
            break;
        }
        process_command(*line);
    }

    if (auto pending = pending_sends(); pending > 0) {
        print_info(fmt::format("Waiting for {} send(s) to finish...", pending));
        if (!WaitForSends(kSendDrainTimeout)) {
            print_error("Gave up waiting, unfinished sends are abandoned.");
        }
    }
    detach_sends();
    service_.Run([this] { service_.Stop(); });
    remove_notifications();
}

void CliManager::process_command(const std::string& line) {
    auto words = split_words(line, 3);
    if (words.empty()) {
        return;
    }
    const std::string& cmd = words[0];
    if (cmd == "list") {
        handle_list_devices();
    } else if (cmd == "send-text") {
        if (words.size() < 3) {
            print_error("Usage: send-text N TEXT");
            return;
        }
        handle_send_text(words[1], words[2]);
    } else if (cmd == "send-file") {
        if (words.size() < 3) {
            print_error("Usage: send-file N PATH");
            return;
        }
        handle_send_file(words[1], words[2]);
    } else if (cmd == "card") {
        print_info(own_card());
    } else if (cmd == "add-device") {
        auto rest = split_words(line, 2);
        if (rest.size() < 2) {
            print_error("Usage: add-device CARD_JSON");
            return;
        }
        handle_add_device(rest[1]);
    } else if (cmd == "keep") {
        handle_keep();
    } else if (cmd == "discard") {
        handle_discard();
    } else if (cmd == "ack-text") {
        handle_ack_text();
    } else if (cmd == "status") {
        handle_status();
    } else if (cmd == "help") {
        handle_show_help();
    } else if (cmd == "clear") {
        terminal_->ClearScreen();
    } else if (cmd == "exit" || cmd == "quit") {
        exit_requested_ = true;
    } else {
        print_error("Unknown command: " + cmd);
    }
}

void CliManager::handle_list_devices() {
    auto devices = service_.registry().GetDevices();
    if (devices.empty()) {
        print_info("No devices found yet.");
        return;
    }
    for (std::size_t i = 0; i < devices.size(); ++i) {
        print_info(fmt::format("  {}. {} ({})", i + 1, devices[i].alias, DeviceKey(devices[i])));
    }
}

std::optional<DeviceInfo> CliManager::device_at(const std::string& index) {
    std::size_t n = 0;
    auto [ptr, ec] = std::from_chars(index.data(), index.data() + index.size(), n);
    auto devices = service_.registry().GetDevices();
    if (ec != std::errc() || ptr != index.data() + index.size() || n == 0 || n > devices.size()) {
        print_error("No device #" + index + ", see 'list'.");
        return std::nullopt;
    }
    return devices[n - 1];
}

void CliManager::handle_send_text(const std::string& index, const std::string& text) {
    auto target = device_at(index);
    if (!target) {
        return;
    }
    print_info("Sending text to " + target->alias + "...");
    spawn_send(service_.send_service().SendText(*target, text), "Text delivered to " + target->alias);
}

void CliManager::handle_send_file(const std::string& index, const std::string& file_path) {
    auto target = device_at(index);
    if (!target) {
        return;
    }
    fs::path path(file_path);
    if (!fs::is_regular_file(path)) {
        print_error("Not a file: " + file_path);
        return;
    }
    std::string file_name = path.filename().string();
    print_info(fmt::format("Sending \"{}\" to {}...", file_name, target->alias));
    spawn_send(service_.send_service().SendFile(*target, file_name, path, std::nullopt),
               fmt::format("\"{}\" delivered to {}", file_name, target->alias));
}

void CliManager::handle_add_device(const std::string& card) {
    auto device = ParseDeviceCard(card);
    if (!device) {
        print_error("Not a device card: " + card);
        return;
    }
    if (!service_.registry().AddDevice(*device)) {
        print_info(DeviceKey(*device) + " is already in the list.");
    }
}

void CliManager::handle_keep() {
    auto file = service_.inbox().file.Get();
    if (!file) {
        print_info("No received file is waiting.");
        return;
    }
    service_.KeepReceivedFile();
    print_info("Kept " + file->path.string());
}

void CliManager::handle_discard() {
    auto file = service_.inbox().file.Get();
    if (!file) {
        print_info("No received file is waiting.");
        return;
    }
    service_.DiscardReceivedFile();
    print_info("Discarded \"" + file->filename + "\"");
}

void CliManager::handle_ack_text() {
    if (!service_.inbox().text.HasValue()) {
        print_info("No received text is waiting.");
        return;
    }
    service_.AcknowledgeReceivedText();
}

void CliManager::handle_status() {
    auto server_state = service_.server_state().Get().value_or(ServerState::Stopped());
    if (server_state.running && server_state.port) {
        print_info(fmt::format("Server: listening on port {}", *server_state.port));
    } else if (server_state.error) {
        print_info("Server: failed, " + *server_state.error);
    } else {
        print_info("Server: stopped");
    }

    auto discovery_state = service_.Run([this] { return service_.discovery_manager().state(); });
    print_info(fmt::format("Discovery: {}, {} device(s) visible",
                           discovery_state_name(discovery_state),
                           service_.registry().size()));

    if (auto file = service_.inbox().file.Get(); file) {
        print_info("Pending file: " + file->path.string());
    }
    if (auto text = service_.inbox().text.Get(); text) {
        print_info("Pending text: " + *text);
    }
}

void CliManager::handle_show_help() {
    print_info("Available commands:");
    print_info("  list                 List devices on the network");
    print_info("  send-text N TEXT     Send text to device N of the list");
    print_info("  send-file N PATH     Send a file to device N of the list");
    print_info("  card                 Show this device's card");
    print_info("  add-device CARD      Add a device from its card JSON");
    print_info("  keep | discard       Keep or delete the last received file");
    print_info("  ack-text             Dismiss the last received text");
    print_info("  status               Show server and discovery state");
    print_info("  clear                Clear the screen");
    print_info("  exit                 Stop sharing and quit");
}

std::string CliManager::own_card() {
    std::uint16_t port = network::kDefaultPort;
    if (auto state = service_.server_state().Get(); state && state->port) {
        port = *state->port;
    }
    DeviceInfo self{system::PrimaryIpv4Address(), port, settings.alias, std::nullopt};
    return DeviceCard(self);
}

void CliManager::install_notifications() {
    service_.registry().SetDevicesChangedCallback(
        [this](const std::vector<DeviceInfo>& devices) { on_devices_changed(devices); });

    service_.inbox().file.SetChangedCallback([this](const std::optional<ReceivedFileInfo>& file) {
        if (file) {
            terminal_->PrintNotice(fmt::format("Received \"{}\" into {} ('keep' or 'discard')",
                                               file->filename,
                                               file->path.parent_path().string()));
        }
    });
    service_.inbox().text.SetChangedCallback([this](const std::optional<std::string>& text) {
        if (text) {
            terminal_->PrintNotice("Received text ('ack-text' to dismiss):\n" + *text);
        }
    });
    service_.server_state().SetChangedCallback([this](const std::optional<ServerState>& state) {
        if (state && state->error) {
            terminal_->PrintError("Server error: " + *state->error);
        }
    });
}

void CliManager::remove_notifications() {
    service_.registry().SetDevicesChangedCallback(nullptr);
    service_.inbox().file.SetChangedCallback(nullptr);
    service_.inbox().text.SetChangedCallback(nullptr);
    service_.server_state().SetChangedCallback(nullptr);
}

void CliManager::on_devices_changed(const std::vector<DeviceInfo>& devices) {
    std::unordered_map<std::string, DeviceInfo> current;
    for (const auto& device : devices) {
        auto key = DeviceKey(device);
        if (!known_devices_.contains(key)) {
            terminal_->PrintNotice(fmt::format("+ {} ({})", device.alias, key));
        }
        current.emplace(std::move(key), device);
    }
    for (const auto& [key, device] : known_devices_) {
        if (!current.contains(key)) {
            terminal_->PrintNotice(fmt::format("- {} ({})", device.alias, key));
        }
    }
    known_devices_ = std::move(current);
}

void CliManager::print_info(const std::string& message) {
    if (terminal_) {
        terminal_->PrintInfo(message);
    } else {
        std::cout << message << std::endl;
    }
}

void CliManager::print_error(const std::string& message) {
    if (terminal_) {
        terminal_->PrintError(message);
    } else {
        std::cerr << "Error: " << message << std::endl;
    }
}

} // namespace sendplus::cli
