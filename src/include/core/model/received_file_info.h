#pragma once

#include <filesystem>
#include <string>

namespace sendplus::core {

struct ReceivedFileInfo {
    std::string filename;        // sanitized, no path separators
    std::filesystem::path path;  // where the server wrote the bytes

    bool operator==(const ReceivedFileInfo&) const = default;
};

} // namespace sendplus::core
