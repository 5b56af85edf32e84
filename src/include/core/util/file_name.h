#pragma once

#include <string>
#include <string_view>

namespace sendplus::core {

// Replaces \ / : * ? " < > | with '_' and trims surrounding whitespace.
// Only a whitespace-only name sanitizes to an empty string.
std::string SanitizeFileName(std::string_view file_name);

} // namespace sendplus::core
