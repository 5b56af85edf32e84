#include <boost/program_options.hpp>
#include <cli/argument_parser.h>
#include <core/util/logger.h>
#include <iostream>
#include <stdexcept>

namespace po = boost::program_options;

namespace sendplus::cli {

ArgumentParser::ArgumentParser()
    : options_("Options")
    , hidden_("Hidden") {
    options_.add_options()("config,c", po::value<std::string>(), "Config file path")(
        "log-level,l",
        po::value<std::string>(),
        "Log level (debug|info|warning|error)")("alias,a",
                                                 po::value<std::string>(),
                                                 "Alias announced to peers for this run")(
        "output,o",
        po::value<std::string>(),
        "Directory for received files for this run")("help,h", "Show this help message");
    hidden_.add_options()("command", po::value<std::string>())(
        "args", po::value<std::vector<std::string>>()->multitoken());
}

CliOptions ArgumentParser::Parse(int argc, char* argv[]) {
    po::options_description all;
    all.add(options_).add(hidden_);

    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(e.what());
    }

    CliOptions options;
    options.show_help = vm.count("help") > 0;
    if (vm.count("config")) {
        options.config_path = vm["config"].as<std::string>();
    }
    if (vm.count("log-level")) {
        options.log_level = vm["log-level"].as<std::string>();
    }
    if (vm.count("alias")) {
        options.alias = vm["alias"].as<std::string>();
    }
    if (vm.count("output")) {
        options.output_dir = vm["output"].as<std::string>();
    }
    if (vm.count("command")) {
        options.command = vm["command"].as<std::string>();
    }
    if (vm.count("args")) {
        options.command_args = vm["args"].as<std::vector<std::string>>();
    }

    validateOptions(options);
    return options;
}

void ArgumentParser::validateOptions(const CliOptions& options) const {
    if (options.log_level && !core::Logger::ParseLevel(*options.log_level)) {
        throw std::runtime_error("Invalid log level: " + *options.log_level);
    }
    if (options.alias && options.alias->empty()) {
        throw std::runtime_error("Alias must not be empty");
    }
}

void ArgumentParser::ShowHelp() const {
    std::cout << "Usage: sendplus [options] [command] [args...]\n\n"
              << options_ << "\n"
              << "Commands:\n"
              << "  serve                   Share on the local network (default)\n"
              << "  send-text HOST[:PORT] TEXT\n"
              << "                          Send a text message to a known address\n"
              << "  send-file HOST[:PORT] PATH\n"
              << "                          Send a file to a known address\n"
              << "  card                    Print this device's card\n";
}

} // namespace sendplus::cli
