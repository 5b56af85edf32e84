#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace sendplus::core {

namespace transfer {

constexpr std::string_view kVersion = "1.0.0";

// Request bodies the server holds in memory (text messages). File uploads
// are streamed to disk and are not limited.
constexpr std::size_t kMaxInMemoryBodySize = std::size_t{64} << 20; // 64 MiB

// Piece size for streamed request bodies.
constexpr std::size_t kBodyChunkSize = 64 * 1024;

// How much of an unread body is drained after an early answer before the
// connection is closed instead.
constexpr std::uint64_t kMaxDrainedBodySize = std::uint64_t{1} << 20;

// sendText retry policy
constexpr int kTextMaxRetries = 2;
constexpr std::chrono::milliseconds kTextRetryBaseDelay{500};
constexpr std::chrono::seconds kTextAttemptTimeout{10};

constexpr std::chrono::seconds kConnectTimeout{30};
constexpr std::chrono::seconds kServerReadTimeout{30};

} // namespace transfer

} // namespace sendplus::core
