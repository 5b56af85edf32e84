#pragma once

#include <boost/program_options/options_description.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sendplus::cli {

struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> log_level;
    std::optional<std::string> alias;
    std::optional<std::string> output_dir;
    std::optional<std::string> command;
    std::vector<std::string> command_args;
    bool show_help = false;
};

class ArgumentParser {
public:
    ArgumentParser();

    // Throws std::runtime_error on unknown options, missing values or an
    // invalid log level.
    CliOptions Parse(int argc, char* argv[]);

    void ShowHelp() const;

private:
    boost::program_options::options_description options_;
    boost::program_options::options_description hidden_;

    void validateOptions(const CliOptions& options) const;
};

} // namespace sendplus::cli
