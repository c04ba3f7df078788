// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <webfile/core/config.hpp>
#include <webfile/core/transfer.hpp>
#include <webfile/disk/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <system_error>
#include <vector>

namespace webfile::disk {

// Byte range [start, start + length) stored in its own file
struct Fragment {
    std::uint64_t start{0};
    std::uint64_t length{0};
    std::filesystem::path path;

    [[nodiscard]] std::uint64_t end() const noexcept { return start + length; }
};

// Partial local copy of a resource, addressed by absolute offset
class FragmentCache {
public:
    virtual ~FragmentCache() = default;

    // Bytes from `offset` until `size`, the first hole, or the end of data
    [[nodiscard]] virtual std::expected<core::Bytes, std::error_code>
    read(std::uint64_t offset, std::size_t size = core::READ_ALL) noexcept = 0;

    [[nodiscard]] virtual std::error_code
    write(std::uint64_t offset, std::span<const std::byte> data) noexcept = 0;

    // Length of the contiguous prefix starting at 0
    [[nodiscard]] virtual std::expected<std::uint64_t, std::error_code> size() noexcept = 0;

    // Compact into the final file once the prefix reaches `expected_size`.
    // True when the final file exists afterwards.
    [[nodiscard]] virtual std::expected<bool, std::error_code>
    join(std::uint64_t expected_size) noexcept = 0;

    [[nodiscard]] virtual bool joined() const noexcept = 0;

    [[nodiscard]] virtual std::error_code unlink() noexcept = 0;

    [[nodiscard]] virtual const std::filesystem::path& path() const noexcept = 0;
};

// Fragments kept beside the target as "<name>.part<start>"; joined through
// "<name>.tmp" into "<name>"
class PartialDownloadStore final : public FragmentCache {
public:
    explicit PartialDownloadStore(std::filesystem::path target);

    [[nodiscard]] std::expected<core::Bytes, std::error_code>
    read(std::uint64_t offset, std::size_t size = core::READ_ALL) noexcept override;

    [[nodiscard]] std::error_code
    write(std::uint64_t offset, std::span<const std::byte> data) noexcept override;

    [[nodiscard]] std::expected<std::uint64_t, std::error_code> size() noexcept override;

    [[nodiscard]] std::expected<bool, std::error_code>
    join(std::uint64_t expected_size) noexcept override;

    [[nodiscard]] bool joined() const noexcept override;

    [[nodiscard]] std::error_code unlink() noexcept override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept override { return target_; }

    // Fragments on disk, ascending by start
    [[nodiscard]] std::expected<std::vector<Fragment>, std::error_code> fragments() const noexcept;

    [[nodiscard]] std::filesystem::path fragment_path(std::uint64_t start) const;
    [[nodiscard]] std::filesystem::path staging_path() const;

private:
    std::filesystem::path target_;
};

} // namespace webfile::disk
