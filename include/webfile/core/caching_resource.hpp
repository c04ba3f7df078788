// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <webfile/core/range_readable.hpp>
#include <webfile/disk/fragment_store.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <system_error>

namespace webfile::core {

// Read-through cache: bytes already on disk are served locally, missing
// bytes are fetched and persisted, and the fragments are joined into the
// final file once the whole resource is present
class CachingResource {
public:
    CachingResource(std::unique_ptr<RangeReadable> remote,
                    std::unique_ptr<disk::FragmentCache> cache,
                    std::size_t chunk_size = DOWNLOAD_CHUNK_SIZE);

    // Logical position only, no I/O
    [[nodiscard]] std::error_code seek(std::int64_t offset) noexcept;
    [[nodiscard]] std::uint64_t tell() const noexcept { return position_; }

    [[nodiscard]] std::expected<Bytes, std::error_code> read(std::size_t size = READ_ALL) noexcept;

    // Read everything from 0 so the final file ends up complete. No network
    // when it already is.
    [[nodiscard]] std::expected<std::filesystem::path, std::error_code>
    download(const ProgressCallback& progress = {}) noexcept;

    [[nodiscard]] std::error_code unlink() noexcept { return cache_->unlink(); }

    [[nodiscard]] RangeReadable& remote() noexcept { return *remote_; }
    [[nodiscard]] disk::FragmentCache& cache() noexcept { return *cache_; }

private:
    [[nodiscard]] std::error_code join_if_complete() noexcept;

    std::unique_ptr<RangeReadable> remote_;
    std::unique_ptr<disk::FragmentCache> cache_;
    std::size_t chunk_size_;
    std::uint64_t position_{0};
};

} // namespace webfile::core
