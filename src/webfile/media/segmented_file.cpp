// Copyright (c) 2026 changcheng967. All rights reserved.

#include <webfile/media/segmented_file.hpp>
#include <webfile/core/log.hpp>
#include <webfile/core/url.hpp>
#include <webfile/disk/error.hpp>
#include <webfile/disk/file.hpp>
#include <cstdio>

namespace webfile::media {

namespace {

std::string segment_stem(std::size_t index) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "segment%05zu", index);
    return buffer;
}

std::string segment_suffix(const std::string& url) {
    auto parsed = core::Url::parse(url);
    auto suffix = parsed ? core::path_suffix(parsed->filename()) : std::string{};
    return suffix.empty() ? std::string(".ts") : suffix;
}

std::error_code remove_file(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return make_error_code(disk::DiskErrc::remove_error);
    }
    return {};
}

} // namespace

SegmentedRemoteFile::SegmentedRemoteFile(std::string url,
                                         std::shared_ptr<core::HttpTransport> transport,
                                         core::RequestOptions options,
                                         std::shared_ptr<Remuxer> remuxer)
    : url_(std::move(url))
    , transport_(std::move(transport))
    , options_(std::move(options))
    , remuxer_(std::move(remuxer)) {}

void SegmentedRemoteFile::set_url(std::string url) {
    url_ = std::move(url);
    playlist_.reset();
    content_.clear();
    base_url_.clear();
    segments_.clear();
    position_ = 0;
}

std::error_code SegmentedRemoteFile::resolve() noexcept {
    if (playlist_) {
        return {};
    }

    auto log = core::logger("webfile.hls");

    auto fetch = [this](const std::string& url,
                        std::string& text,
                        std::string& base) -> std::expected<HLSPlaylist, std::error_code> {
        core::RemoteResource resource(url, transport_, options_);
        auto body = resource.read();
        if (!body) {
            return std::unexpected(body.error());
        }
        text = core::to_string(*body);
        base = resource.url();
        return HLSParser::parse(text, base);
    };

    std::string text;
    std::string base;
    auto parsed = fetch(url_, text, base);
    if (!parsed) {
        log->debug("Resolving {} failed: {}", url_, parsed.error().message());
        return parsed.error();
    }

    if (const HLSVariant* best = parsed->best_variant()) {
        log->debug("Selected variant {} ({} bps)", best->url, best->bandwidth);
        const std::string variant_url = best->url;
        parsed = fetch(variant_url, text, base);
        if (!parsed) {
            return parsed.error();
        }
    }

    log->debug("{} segments in {}", parsed->segments.size(), base);
    playlist_ = std::move(*parsed);
    content_ = std::move(text);
    base_url_ = std::move(base);
    segments_.clear();
    segments_.resize(playlist_->segments.size());
    return {};
}

std::expected<const HLSPlaylist*, std::error_code> SegmentedRemoteFile::playlist() noexcept {
    if (auto ec = resolve()) {
        return std::unexpected(ec);
    }
    return &*playlist_;
}

std::expected<core::RemoteResource*, std::error_code>
SegmentedRemoteFile::segment(std::size_t index) noexcept {
    if (auto ec = resolve()) {
        return std::unexpected(ec);
    }
    if (index >= segments_.size()) {
        return std::unexpected(make_error_code(core::StreamErrc::seek_out_of_range));
    }

    auto& slot = segments_[index];
    if (!slot) {
        slot = std::make_unique<core::RemoteResource>(playlist_->segments[index].url, transport_, options_);
    }
    return slot.get();
}

std::error_code SegmentedRemoteFile::seek(std::int64_t offset) noexcept {
    if (offset < 0) {
        return make_error_code(core::StreamErrc::seek_out_of_range);
    }
    position_ = static_cast<std::uint64_t>(offset);
    return {};
}

std::expected<core::Bytes, std::error_code> SegmentedRemoteFile::read(std::size_t size) noexcept {
    if (auto ec = resolve()) {
        return std::unexpected(ec);
    }

    core::Bytes out;
    std::uint64_t skip = position_;
    std::size_t remaining = size;

    for (std::size_t i = 0; i < segments_.size() && remaining > 0; ++i) {
        auto seg = segment(i);
        if (!seg) return std::unexpected(seg.error());
        core::RemoteResource& resource = **seg;

        auto seg_size = resource.size();
        if (!seg_size) return std::unexpected(seg_size.error());
        if (!*seg_size) {
            return std::unexpected(make_error_code(core::StreamErrc::size_unknown));
        }

        if (skip >= **seg_size) {
            skip -= **seg_size;
            resource.close();  // Opened only to learn the size
            continue;
        }

        if (auto ec = resource.seek(static_cast<std::int64_t>(skip))) {
            return std::unexpected(ec);
        }
        skip = 0;

        auto chunk = resource.read(remaining);
        if (!chunk) return std::unexpected(chunk.error());

        // A segment that ends before its announced size would shift every later byte
        const bool short_read = size == core::READ_ALL || chunk->size() < remaining;
        if (short_read && resource.tell() < **seg_size) {
            core::logger("webfile.hls")->warn("Segment {} ended at {} of {} bytes",
                                              i, resource.tell(), **seg_size);
            return std::unexpected(make_error_code(core::StreamErrc::size_mismatch));
        }

        out.insert(out.end(), chunk->begin(), chunk->end());
        if (size != core::READ_ALL) {
            remaining -= chunk->size();
        }
    }

    position_ += out.size();
    return out;
}

std::expected<std::optional<std::uint64_t>, std::error_code> SegmentedRemoteFile::size() noexcept {
    if (auto ec = resolve()) {
        return std::unexpected(ec);
    }

    std::uint64_t total = 0;
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        auto seg = segment(i);
        if (!seg) return std::unexpected(seg.error());

        auto seg_size = (*seg)->size();
        if (!seg_size) return std::unexpected(seg_size.error());
        (*seg)->close();
        if (!*seg_size) return std::optional<std::uint64_t>{};
        total += **seg_size;
    }
    return total;
}

std::expected<bool, std::error_code> SegmentedRemoteFile::exists() noexcept {
    if (auto ec = resolve()) {
        if (core::is_client_error(ec)) return false;
        return std::unexpected(ec);
    }
    if (segments_.empty()) {
        return false;
    }

    auto first = segment(0);
    if (!first) return std::unexpected(first.error());
    return (*first)->exists();
}

std::expected<std::string, std::error_code> SegmentedRemoteFile::manifest() noexcept {
    if (auto ec = resolve()) {
        return std::unexpected(ec);
    }
    return HLSParser::absolutize(content_, base_url_);
}

std::string SegmentedRemoteFile::default_filename() const {
    auto parsed = core::Url::parse(url_);
    std::filesystem::path name = parsed ? parsed->filename() : url_.substr(url_.rfind('/') + 1);
    name.replace_extension(".mp4");
    return name.string();
}

std::filesystem::path SegmentedRemoteFile::filepath() const {
    return naming_.path(default_filename());
}

std::filesystem::path SegmentedRemoteFile::temp_directory() const {
    return naming_.directory() / naming_.stem(default_filename());
}

std::filesystem::path SegmentedRemoteFile::remux_staging_path() const {
    const auto target = filepath();
    return target.parent_path() / (std::string(core::REMUX_PREFIX) + target.filename().string());
}

std::filesystem::path SegmentedRemoteFile::concat_staging_path() const {
    auto staging = filepath();
    staging += core::PART_SUFFIX;
    return staging;
}

std::error_code SegmentedRemoteFile::concatenate(const std::vector<std::filesystem::path>& files,
                                                 const std::filesystem::path& target) noexcept {
    const auto staging = concat_staging_path();
    {
        auto out = disk::File::open(staging, disk::File::Mode::truncate);
        if (!out) return out.error();

        std::vector<std::byte> buffer(core::JOIN_CHUNK_SIZE);
        std::uint64_t offset = 0;
        for (const auto& path : files) {
            auto in = disk::File::open(path, disk::File::Mode::read);
            if (!in) return in.error();

            std::uint64_t in_offset = 0;
            while (true) {
                auto n = in->read(in_offset, buffer.data(), buffer.size());
                if (!n) return n.error();
                if (*n == 0) break;

                auto written = out->write(offset, buffer.data(), *n);
                if (!written) return written.error();
                in_offset += *n;
                offset += *n;
            }
        }
    }

    std::error_code ec;
    std::filesystem::rename(staging, target, ec);
    if (ec) return make_error_code(disk::DiskErrc::rename_error);
    return {};
}

std::error_code SegmentedRemoteFile::remux(const std::vector<std::filesystem::path>& files,
                                           const std::filesystem::path& target) noexcept {
    auto log = core::logger("webfile.remux");
    const auto manifest_path = temp_directory() / core::SEGMENT_MANIFEST;

    try {
        const auto local = HLSParser::rewrite(content_, base_url_,
            [&files](std::size_t index, const std::string& url) {
                return index < files.size() ? files[index].filename().string() : url;
            });

        auto out = disk::File::open(manifest_path, disk::File::Mode::truncate);
        if (!out) return out.error();
        auto written = out->write(0, local.data(), local.size());
        if (!written) return written.error();
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }

    const auto staging = remux_staging_path();
    if (auto ec = remove_file(staging)) return ec;

    if (auto ec = remuxer_->remux(manifest_path, staging, options_.request_headers())) {
        log->error("Remuxing {} into {} failed", manifest_path.string(), staging.string());
        (void)remove_file(staging);
        return ec;
    }

    std::error_code ec;
    std::filesystem::rename(staging, target, ec);
    if (ec) return make_error_code(disk::DiskErrc::rename_error);
    return {};
}

std::expected<std::filesystem::path, std::error_code>
SegmentedRemoteFile::download(const core::ProgressCallback& progress) noexcept {
    auto log = core::logger("webfile.hls");
    const auto target = filepath();

    std::error_code fs_ec;
    if (std::filesystem::exists(target, fs_ec)) {
        log->warn("{} is already downloaded.", target.string());
        return target;
    }

    log->info("Downloading {} to {}", url_, target.string());

    if (auto ec = resolve()) {
        return std::unexpected(ec);
    }

    const auto temp = temp_directory();
    std::filesystem::create_directories(temp, fs_ec);
    if (fs_ec) {
        return std::unexpected(make_error_code(disk::DiskErrc::invalid_path));
    }

    core::TransferProgress state;
    state.items_total = static_cast<std::uint32_t>(segments_.size());
    if (progress) progress(state);

    std::vector<std::filesystem::path> files;
    std::uint64_t finished_bytes = 0;
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        auto seg = segment(i);
        if (!seg) return std::unexpected(seg.error());
        core::RemoteResource& resource = **seg;

        resource.naming().directory(temp.string());
        resource.naming().filestem(segment_stem(i));
        resource.naming().filesuffix(segment_suffix(resource.request_url()));

        auto path = resource.download([&](const core::TransferProgress& p) {
            state.downloaded_bytes = finished_bytes + p.downloaded_bytes;
            if (progress) progress(state);
        });
        if (!path) {
            log->warn("Segment {} of {} failed: {}", i + 1, segments_.size(), path.error().message());
            return std::unexpected(path.error());
        }
        resource.close();

        finished_bytes += std::filesystem::file_size(*path, fs_ec);
        files.push_back(*path);

        state.items_done = static_cast<std::uint32_t>(i + 1);
        state.downloaded_bytes = finished_bytes;
        if (progress) progress(state);
    }

    const auto ec = remuxer_ ? remux(files, target) : concatenate(files, target);
    if (ec) {
        return std::unexpected(ec);
    }

    std::filesystem::remove_all(temp, fs_ec);
    if (fs_ec) {
        log->warn("Cannot remove {}: {}", temp.string(), fs_ec.message());
    }
    return target;
}

std::error_code SegmentedRemoteFile::unlink() noexcept {
    if (auto ec = remove_file(filepath())) return ec;
    if (auto ec = remove_file(remux_staging_path())) return ec;
    if (auto ec = remove_file(concat_staging_path())) return ec;

    std::error_code ec;
    std::filesystem::remove_all(temp_directory(), ec);
    if (ec) {
        return make_error_code(disk::DiskErrc::remove_error);
    }
    return {};
}

} // namespace webfile::media
