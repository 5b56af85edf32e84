#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <memory>
#include <optional>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace sendplus::core {

// Installs an async logger writing to a daily log file and the console as
// spdlog's default logger for the lifetime of the object.
class Logger {
    using LoggerType = spdlog::async_logger;

public:
    using Level = spdlog::level::level_enum;

    Logger(Level level,
           const std::filesystem::path& log_dir,
           std::size_t q_max_items = 8192,
           std::size_t thread_count = 1) {
        spdlog::file_event_handlers handlers;
        handlers.after_open = [](const spdlog::filename_t& filename, std::FILE* fstream) {
            if (fstream) {
                auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
                std::fprintf(fstream, "[Log Start: %s | %s]\n", filename.c_str(), std::ctime(&now));
            }
        };
        handlers.before_close = [](const spdlog::filename_t& filename, std::FILE* fstream) {
            if (fstream) {
                auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
                std::fprintf(fstream, "[Log End: %s | %s]\n\n", filename.c_str(), std::ctime(&now));
            }
        };

        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);

        auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
            (log_dir / "sendplus.log").string(), 0, 0, false, 7, handlers);
        auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

        thread_pool_ = std::make_shared<spdlog::details::thread_pool>(q_max_items, thread_count);
        logger_ = std::make_shared<LoggerType>("sendplus",
                                               spdlog::sinks_init_list{file_sink, stdout_sink},
                                               thread_pool_);

#ifdef SENDPLUS_RELEASE
        stdout_sink->set_level(Level::off);
#endif
        logger_->set_level(level);
        logger_->set_error_handler(
            [](const std::string& msg) { std::fprintf(stderr, "*** LOGGER ERROR ***: %s\n", msg.c_str()); });

        stdout_sink->set_pattern("\033[36m[%Y-%m-%d %H:%M:%S.%e] \033[92m[%n] \033[0m%^[%l]%$ %v");
        spdlog::set_default_logger(logger_);
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    ~Logger() { spdlog::shutdown(); }

    auto& logger() { return logger_; }
    [[nodiscard]] Level logLevel() const { return logger_->level(); }
    void set_log_level(Level level) { logger_->set_level(level); }

    // "debug" | "info" | "warning" | "error", case-sensitive
    static std::optional<Level> ParseLevel(std::string_view name) {
        if (name == "debug") {
            return Level::debug;
        }
        if (name == "info") {
            return Level::info;
        }
        if (name == "warning" || name == "warn") {
            return Level::warn;
        }
        if (name == "error") {
            return Level::err;
        }
        return std::nullopt;
    }

private:
    std::shared_ptr<LoggerType> logger_;
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
};

} // namespace sendplus::core
