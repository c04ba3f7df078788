// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <chrono>
#include <limits>
#include <string_view>

namespace webfile::core {

// Read size meaning "until end of stream"
constexpr std::size_t READ_ALL = std::numeric_limits<std::size_t>::max();

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t READ_TIMEOUT_SEC = 30;
constexpr std::uint32_t MAX_REDIRECTS = 10;

// Retry defaults: 5 tries, 1 s doubling, 1-5 s jitter
constexpr std::uint32_t RETRY_COUNT = 5;
constexpr std::chrono::milliseconds RETRY_BASE_DELAY{1000};
constexpr double RETRY_MULTIPLIER = 2.0;
constexpr std::chrono::milliseconds RETRY_JITTER_MIN{1000};
constexpr std::chrono::milliseconds RETRY_JITTER_MAX{5000};
constexpr std::chrono::milliseconds RETRY_MAX_DELAY{60000};

constexpr std::size_t DOWNLOAD_CHUNK_SIZE = 64 * 1024;     // 64 KB per sequential read
constexpr std::size_t JOIN_CHUNK_SIZE = 1024 * 1024;       // 1 MB per copy step
constexpr std::size_t READ_BUFFER_SIZE = 256 * 1024;       // 256 KB curl buffer

// Stem length limit in bytes, leaves room for ".part<offset>"
constexpr std::size_t MAX_STEM_BYTES = 255 - 10;

constexpr std::string_view DEFAULT_USER_AGENT =
    "Mozilla/5.0 (X11; Linux x86_64; rv:69.0) Gecko/20100101 Firefox/69.0";

constexpr std::string_view PART_SUFFIX = ".part";
constexpr std::string_view JOIN_SUFFIX = ".tmp";
constexpr std::string_view REMUX_PREFIX = ".tmp.";
constexpr std::string_view SEGMENT_MANIFEST = "playlist.m3u8";

} // namespace webfile::core
