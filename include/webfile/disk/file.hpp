// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <webfile/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <system_error>

namespace webfile::disk {

// POSIX file descriptor with positional I/O
class File {
public:
    enum class Mode {
        read,       // Must exist
        write,      // Created if missing, contents kept
        truncate,   // Created if missing, emptied
    };

    static std::expected<File, std::error_code>
    open(const std::filesystem::path& path, Mode mode) noexcept;

    ~File();

    // Non-copyable, movable
    File(const File&) = delete;
    File& operator=(const File&) = delete;
    File(File&&) noexcept;
    File& operator=(File&&) noexcept;

    // Writes all of `data` at `offset`
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    write(std::uint64_t offset, const void* data, std::size_t size) noexcept;

    // Reads until `size` bytes or end of file
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    read(std::uint64_t offset, void* buffer, std::size_t size) noexcept;

    [[nodiscard]] std::expected<std::uint64_t, std::error_code> size() const noexcept;

    // Flush buffers to disk
    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    File() = default;

    int fd_{-1};
    std::filesystem::path path_;
};

// errno to DiskErrc, `fallback` for anything unrecognised
[[nodiscard]] std::error_code errno_to_error_code(int err, DiskErrc fallback) noexcept;

} // namespace webfile::disk
