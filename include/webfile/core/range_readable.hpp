// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <webfile/core/config.hpp>
#include <webfile/core/transfer.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <system_error>

namespace webfile::core {

// Seekable byte source whose total size may be unknown
class RangeReadable {
public:
    virtual ~RangeReadable() = default;

    [[nodiscard]] virtual std::error_code open() noexcept = 0;

    // Up to `size` bytes from the current position, READ_ALL for the rest.
    // An empty result means end of stream.
    [[nodiscard]] virtual std::expected<Bytes, std::error_code>
    read(std::size_t size = READ_ALL) noexcept = 0;

    // Fails with seek_out_of_range or range_unsupported when the offset
    // cannot be served
    [[nodiscard]] virtual std::error_code seek(std::int64_t offset) noexcept = 0;

    [[nodiscard]] virtual std::uint64_t tell() const noexcept = 0;

    // Empty optional when the source never reported one
    [[nodiscard]] virtual std::expected<std::optional<std::uint64_t>, std::error_code>
    size() noexcept = 0;

    // Size already learned from the source, never touches the network
    [[nodiscard]] virtual std::optional<std::uint64_t> known_size() const noexcept = 0;

    virtual void close() noexcept = 0;
};

} // namespace webfile::core
