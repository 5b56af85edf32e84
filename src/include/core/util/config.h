/*
    config.h
    Application configuration stored as TOML.

    Reading a setting:
        std::string alias = sendplus::core::settings.alias;
        std::filesystem::path dir = sendplus::core::settings.save_dir;
    Writing a setting:
        sendplus::core::settings.alias = "new_alias";
        sendplus::core::SaveConfig();

    InitConfig() loads config.toml from path::kConfigDir (or the given file),
    creating it when missing. SaveConfig() writes the [setting] table back to
    the file that was loaded.
*/

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <toml++/toml.h>

namespace sendplus::core {

inline toml::table config;

struct Settings {
    std::string alias;              // Display name announced to peers
    std::filesystem::path save_dir; // Where received files are written
};

inline Settings settings;

void InitConfig(const std::optional<std::filesystem::path>& config_file = std::nullopt);

void SaveConfig();

std::filesystem::path ConfigFilePath();

} // namespace sendplus::core
