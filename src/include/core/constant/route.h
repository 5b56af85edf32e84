#pragma once

#include <string_view>

namespace sendplus::core {

class ApiRoute {
public:
    static constexpr std::string_view kRoot = "/";
    static constexpr std::string_view kInfo = "/info";
    static constexpr std::string_view kReceive = "/receive";
    static constexpr std::string_view kReceiveText = "/receive-text";
};

} // namespace sendplus::core
