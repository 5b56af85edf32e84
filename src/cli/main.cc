#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <cli/argument_parser.h>
#include <cli/cli_manager.h>
#include <core/constant/path.h>
#include <core/sendplus_service.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <iostream>
#include <optional>
#include <thread>

using namespace sendplus;
using namespace sendplus::core;
namespace net = boost::asio;

int main(int argc, char* argv[]) {
    cli::ArgumentParser parser;
    cli::CliOptions options;
    try {
        options = parser.Parse(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        parser.ShowHelp();
        return 1;
    }
    if (options.show_help) {
        parser.ShowHelp();
        return 0;
    }

    Logger logger(options.log_level ? *Logger::ParseLevel(*options.log_level) :
#ifdef SENDPLUS_DEBUG
                                    Logger::Level::debug,
#else
                                    Logger::Level::info,
#endif
                  path::kLogDir);

    InitConfig(options.config_path ? std::optional<std::filesystem::path>(*options.config_path)
                                   : std::nullopt);
    // Command-line overrides apply to this run only and are not saved.
    if (options.alias) {
        settings.alias = *options.alias;
    }
    if (options.output_dir) {
        settings.save_dir = *options.output_dir;
    }

    net::io_context ioc;
    auto work = net::make_work_guard(ioc);
    std::thread io_thread([&ioc] {
        try {
            ioc.run();
        } catch (const std::exception& e) {
            spdlog::error("IO thread terminated: {}", e.what());
        }
    });

    int exit_code = 0;
    {
        SendPlusService service(ioc);
        {
            cli::CliManager cli_manager(service);
            exit_code = cli_manager.Execute(options.command, options.command_args);
        }

        work.reset();
        ioc.stop();
        io_thread.join();
    }

    spdlog::debug("sendplus exiting with code {}", exit_code);
    return exit_code;
}
