#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/host_name.hpp>
#include <boost/asio/ip/udp.hpp>
#include <core/util/system.h>
#include <cstdio>
#include <cstring>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>
#if defined(_WIN32) || defined(_WIN64)
#include <boost/asio/ip/tcp.hpp>
#include <windows.h>
#else
#include <arpa/inet.h>
#include <cerrno>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#if defined(__APPLE__) || defined(__MACH__)
#include <sys/sysctl.h>
#endif
#endif

namespace sendplus::core {

namespace system {

namespace {

constexpr auto kArchitecture =
#if defined(__x86_64__) || defined(_M_X64)
    "x86_64";
#elif defined(__i386__) || defined(_M_IX86)
    "x86";
#elif defined(__aarch64__)
    "aarch64";
#elif defined(__arm64__) || defined(_M_ARM64)
    "arm64";
#elif defined(__arm__) || defined(_M_ARM)
    "arm";
#else
    "Unknown";
#endif

} // namespace

std::string Hostname() {
    std::string hostname = boost::asio::ip::host_name();
    for (std::string_view suffix : {".localdomain", ".local", ".domain"}) {
        if (hostname.ends_with(suffix)) {
            hostname.resize(hostname.size() - suffix.size());
            break;
        }
    }
    return hostname;
}

std::string DefaultAlias() {
    try {
        auto hostname = Hostname();
        if (!hostname.empty()) {
            return hostname;
        }
    } catch (const std::exception& e) {
        spdlog::error("Error generating default alias: {}", e.what());
    }
    return "SendPlus Device";
}

std::vector<std::string> LocalIpv4Addresses() {
    std::vector<std::string> addresses;
#if defined(_WIN32) || defined(_WIN64)
    namespace net = boost::asio;
    net::io_context ioc;
    net::ip::tcp::resolver resolver(ioc);
    for (const auto& entry : resolver.resolve(net::ip::host_name(), "")) {
        auto address = entry.endpoint().address();
        if (address.is_v4() && !address.is_loopback()) {
            addresses.push_back(address.to_string());
        }
    }
#else
    ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0) {
        throw std::system_error(errno, std::generic_category(), "getifaddrs");
    }
    for (ifaddrs* it = interfaces; it != nullptr; it = it->ifa_next) {
        if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if ((it->ifa_flags & IFF_UP) == 0 || (it->ifa_flags & IFF_LOOPBACK) != 0) {
            continue;
        }
        char buffer[INET_ADDRSTRLEN] = {};
        const auto* sin = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
        if (inet_ntop(AF_INET, &sin->sin_addr, buffer, sizeof(buffer)) != nullptr) {
            addresses.emplace_back(buffer);
        }
    }
    freeifaddrs(interfaces);
#endif
    return addresses;
}

std::string PrimaryIpv4Address() {
    try {
        namespace net = boost::asio;
        net::io_context io_context;

        net::ip::udp::socket socket(io_context);

        // No packet is sent, connect() only selects the outgoing interface.
        socket.connect(net::ip::udp::endpoint(net::ip::make_address_v4("223.5.5.5"), 53));

        return socket.local_endpoint().address().to_string();
    } catch (const std::exception& e) {
        spdlog::error("Failed to get primary IPv4 address: {}", e.what());
        return "127.0.0.1";
    }
}

std::string OperatingSystem() {
#if defined(__APPLE__) || defined(__MACH__)
    char os_temp[20] = "";
    size_t os_temp_len = sizeof(os_temp);
    unsigned short major = 0, minor = 0, point = 0;

    int rslt = sysctlbyname("kern.osproductversion", os_temp, &os_temp_len, NULL, 0);
    if (rslt == 0) {
        sscanf(os_temp, "%hu.%hu.%hu", &major, &minor, &point);
        return fmt::format("macOS {}.{}.{} ({})", major, minor, point, kArchitecture);
    } else {
        spdlog::error("sysctlbyname failed: {}", strerror(errno));
        return fmt::format("macOS ({})", kArchitecture);
    }
#elif defined(__linux__)
    std::string pretty_name{};
    FILE* file = fopen("/etc/os-release", "r");
    if (file) {
        char line[256];
        while (fgets(line, sizeof(line), file)) {
            if (strncmp(line, "PRETTY_NAME=", 12) == 0) {
                pretty_name = line + 12;
                if (!pretty_name.empty() && pretty_name.back() == '\n') {
                    pretty_name.pop_back();
                }
                if (!pretty_name.empty() && pretty_name.front() == '"') {
                    pretty_name.erase(0, 1);
                }
                if (!pretty_name.empty() && pretty_name.back() == '"') {
                    pretty_name.pop_back();
                }
                break;
            }
        }
        fclose(file);
    }
    if (pretty_name.empty()) {
        return fmt::format("Linux ({})", kArchitecture);
    }
    return fmt::format("{} ({})", pretty_name, kArchitecture);
#elif defined(_WIN32) || defined(_WIN64)
    OSVERSIONINFOEXW osInfo = {0};
    osInfo.dwOSVersionInfoSize = sizeof(osInfo);

    typedef LONG(WINAPI * RtlGetVersionPtr)(PRTL_OSVERSIONINFOW);
    RtlGetVersionPtr RtlGetVersion = (RtlGetVersionPtr)
        GetProcAddress(GetModuleHandleW(L"ntdll.dll"), "RtlGetVersion");

    if (RtlGetVersion == nullptr) {
        return fmt::format("Windows ({})", kArchitecture);
    }
    RtlGetVersion((PRTL_OSVERSIONINFOW) &osInfo);

    if (osInfo.dwMajorVersion == 10 && osInfo.dwMinorVersion == 0) {
        if (osInfo.dwBuildNumber >= 22000) {
            return fmt::format("Windows 11 ({})", kArchitecture);
        }
        return fmt::format("Windows 10 ({})", kArchitecture);
    }
    return fmt::format("Windows {}.{} ({})",
                       osInfo.dwMajorVersion,
                       osInfo.dwMinorVersion,
                       kArchitecture);
#else
    return fmt::format("Unknown OS ({})", kArchitecture);
#endif
}

} // namespace system

} // namespace sendplus::core
