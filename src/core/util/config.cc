#include <core/constant/path.h>
#include <core/util/config.h>
#include <core/util/system.h>
#include <fstream>
#include <spdlog/spdlog.h>

namespace sendplus::core {

namespace {

std::filesystem::path config_file_path = path::kConfigDir / "config.toml";

void loadSetting() {
    if (!config.contains("setting")) {
        config.insert("setting", toml::table{});
    }
    auto& setting = *config["setting"].as_table();

    std::string alias = setting["alias"].value_or(std::string{});
    settings.alias = alias.empty() ? system::DefaultAlias() : alias;

    std::string save_dir = setting["save-dir"].value_or(std::string{});
    settings.save_dir = save_dir.empty() ? path::kSystemDownloadDir
                                         : std::filesystem::path(save_dir);
}

} // namespace

std::filesystem::path ConfigFilePath() {
    return config_file_path;
}

void InitConfig(const std::optional<std::filesystem::path>& config_file) {
    if (config_file) {
        config_file_path = *config_file;
    }

    std::error_code ec;
    auto dir = config_file_path.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir, ec)) {
        spdlog::info("Config directory does not exist, creating...");
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            spdlog::error("Failed to create config directory \"{}\": {}", dir.string(), ec.message());
        }
    }
    if (!std::filesystem::exists(config_file_path, ec)) {
        std::ofstream ofs(config_file_path);
        spdlog::info("Config file does not exist, creating...");
    }

    try {
        config = toml::parse_file(config_file_path.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}",
                      config_file_path.string(),
                      std::string(err.description()));
        config = toml::table{};
    }

    loadSetting();
    spdlog::debug("Config loaded from {} (alias = {}, save-dir = {})",
                  config_file_path.string(),
                  settings.alias,
                  settings.save_dir.string());
}

void SaveConfig() {
    std::ofstream ofs(config_file_path);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving config.", config_file_path.string());
        return;
    }
    config.insert_or_assign("setting",
                            toml::table{
                                {"alias", settings.alias},
                                {"save-dir", settings.save_dir.string()},
                            });
    ofs << config;
}

} // namespace sendplus::core
