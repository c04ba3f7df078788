// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace webfile::core {

using Bytes = std::vector<std::byte>;

// Progress of a download, bytes for plain resources and items for segment lists
struct TransferProgress {
    std::uint64_t downloaded_bytes{0};
    std::optional<std::uint64_t> total_bytes;
    std::uint32_t items_done{0};
    std::uint32_t items_total{0};
};

using ProgressCallback = std::function<void(const TransferProgress&)>;

inline Bytes to_bytes(std::string_view text) {
    const auto* first = reinterpret_cast<const std::byte*>(text.data());
    return Bytes(first, first + text.size());
}

inline std::string to_string(const Bytes& bytes) {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

} // namespace webfile::core
