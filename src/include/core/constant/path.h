#pragma once

#include <cstdlib>
#include <filesystem>

namespace sendplus::core {
namespace path {

namespace details {

inline std::filesystem::path HomeDir() {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        return std::filesystem::temp_directory_path();
    }
    return std::filesystem::path(home);
}

} // namespace details

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "SendPlus"
                                             / "logs";

inline const std::filesystem::path kConfigDir = []() -> std::filesystem::path {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
        return std::filesystem::path(xdg) / "SendPlus";
    }
#if defined(__APPLE__)
    return details::HomeDir() / "Library" / "Application Support" / "SendPlus";
#else
    return details::HomeDir() / ".config" / "SendPlus";
#endif
}();

inline const std::filesystem::path kSystemDownloadDir = details::HomeDir() / "Downloads";

} // namespace path
} // namespace sendplus::core
