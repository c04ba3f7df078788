// Copyright (c) 2026 changcheng967. All rights reserved.

#include <webfile/core/caching_resource.hpp>
#include <webfile/core/error.hpp>
#include <webfile/core/log.hpp>

namespace webfile::core {

CachingResource::CachingResource(std::unique_ptr<RangeReadable> remote,
                                 std::unique_ptr<disk::FragmentCache> cache,
                                 std::size_t chunk_size)
    : remote_(std::move(remote))
    , cache_(std::move(cache))
    , chunk_size_(chunk_size == 0 ? DOWNLOAD_CHUNK_SIZE : chunk_size) {}

std::error_code CachingResource::seek(std::int64_t offset) noexcept {
    if (offset < 0) {
        return make_error_code(StreamErrc::seek_out_of_range);
    }
    position_ = static_cast<std::uint64_t>(offset);
    return {};
}

std::error_code CachingResource::join_if_complete() noexcept {
    auto total = remote_->size();
    if (!total) return total.error();
    if (!*total) return {};

    auto cached = cache_->size();
    if (!cached) return cached.error();
    if (*cached != **total) return {};

    auto joined = cache_->join(**total);
    if (!joined) return joined.error();
    return {};
}

std::expected<Bytes, std::error_code> CachingResource::read(std::size_t size) noexcept {
    auto log = logger("webfile.cache");

    if (cache_->joined()) {
        log->debug("Reading from cached file {}", cache_->path().string());
        auto data = cache_->read(position_, size);
        if (data) position_ += data->size();
        return data;
    }

    const std::uint64_t start = position_;
    auto cached = cache_->read(position_, size);
    if (!cached) return cached;
    position_ += cached->size();

    if (size != READ_ALL && cached->size() >= size) {
        return cached;
    }

    // Nothing left on the remote past the cached prefix
    if (auto total = remote_->known_size(); total && position_ >= *total) {
        if (auto ec = join_if_complete()) {
            log->warn("Joining {} failed: {}", cache_->path().string(), ec.message());
        }
        return cached;
    }

    if (auto ec = remote_->seek(static_cast<std::int64_t>(position_))) {
        if (ec == make_error_code(StreamErrc::seek_out_of_range)) {
            // Fragments left by an earlier run may already cover the whole resource
            if (auto join_ec = join_if_complete()) {
                log->warn("Joining {} failed: {}", cache_->path().string(), join_ec.message());
            }
        }
        if (is_seek_error(ec)) {
            log->debug("Serving {} cached bytes only: {}", cached->size(), ec.message());
            return cached;
        }
        position_ = start;
        return std::unexpected(ec);
    }

    auto fresh = remote_->read(size == READ_ALL ? READ_ALL : size - cached->size());
    if (!fresh) {
        position_ = start;
        return std::unexpected(fresh.error());
    }

    if (auto ec = cache_->write(position_, *fresh)) {
        position_ = start;
        return std::unexpected(ec);
    }
    position_ += fresh->size();

    if (auto ec = join_if_complete()) {
        log->warn("Joining {} failed: {}", cache_->path().string(), ec.message());
    }

    cached->insert(cached->end(), fresh->begin(), fresh->end());
    return cached;
}

std::expected<std::filesystem::path, std::error_code>
CachingResource::download(const ProgressCallback& progress) noexcept {
    auto log = logger("webfile.cache");
    const auto& target = cache_->path();

    if (cache_->joined()) {
        log->warn("{} is already downloaded.", target.string());
        return target;
    }

    log->info("Downloading to {}", target.string());

    position_ = 0;
    TransferProgress state;
    while (true) {
        auto chunk = read(chunk_size_);
        if (!chunk) return std::unexpected(chunk.error());
        if (chunk->empty()) break;

        state.downloaded_bytes = position_;
        if (!state.total_bytes) {
            if (auto total = remote_->size()) state.total_bytes = *total;
        }
        if (progress) progress(state);
    }

    if (!cache_->joined()) {
        auto total = remote_->size();
        if (!total) return std::unexpected(total.error());

        auto cached = cache_->size();
        if (!cached) return std::unexpected(cached.error());

        if (*total && *cached != **total) {
            log->warn("{}: {} of {} bytes cached", target.string(), *cached, **total);
            return std::unexpected(make_error_code(StreamErrc::size_mismatch));
        }

        // Unknown size, end of stream marks completion
        auto joined = cache_->join(*cached);
        if (!joined) return std::unexpected(joined.error());
    }
    return target;
}

} // namespace webfile::core
