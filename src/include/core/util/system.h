#pragma once

#include <string>
#include <vector>

namespace sendplus::core {

namespace system {

std::string Hostname();
std::string DefaultAlias();
std::string OperatingSystem(); // etc: Ubuntu 22.04.4 LTS (x86_64)

// Non-loopback IPv4 addresses of every interface that is up.
// Throws std::system_error when the interface list cannot be read.
std::vector<std::string> LocalIpv4Addresses();

// Address of the interface that routes to the outside, "127.0.0.1" if none.
std::string PrimaryIpv4Address();

} // namespace system

} // namespace sendplus::core
