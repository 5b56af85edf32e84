#include <cctype>
#include <core/util/file_name.h>

namespace sendplus::core {

namespace {

constexpr std::string_view kReservedCharacters = "\\/:*?\"<>|";

} // namespace

std::string SanitizeFileName(std::string_view file_name) {
    std::string sanitized;
    sanitized.reserve(file_name.size());
    for (char c : file_name) {
        sanitized += kReservedCharacters.find(c) == std::string_view::npos ? c : '_';
    }

    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    std::size_t begin = 0;
    std::size_t end = sanitized.size();
    while (begin < end && is_space(sanitized[begin])) {
        ++begin;
    }
    while (end > begin && is_space(sanitized[end - 1])) {
        --end;
    }
    return sanitized.substr(begin, end - begin);
}

} // namespace sendplus::core
