// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <webfile/core/file_name.hpp>
#include <webfile/core/http_session.hpp>
#include <webfile/core/remote_resource.hpp>
#include <webfile/core/transfer.hpp>
#include <webfile/media/hls_parser.hpp>
#include <webfile/media/remuxer.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace webfile::media {

// HLS stream presented as one seekable file: the concatenation of its
// segments in playlist order
class SegmentedRemoteFile {
public:
    // Without a remuxer, download() concatenates the segments
    SegmentedRemoteFile(std::string url,
                        std::shared_ptr<core::HttpTransport> transport,
                        core::RequestOptions options = {},
                        std::shared_ptr<Remuxer> remuxer = nullptr);

    SegmentedRemoteFile(const SegmentedRemoteFile&) = delete;
    SegmentedRemoteFile& operator=(const SegmentedRemoteFile&) = delete;

    [[nodiscard]] const std::string& url() const noexcept { return url_; }

    // Drops the resolved playlist and every segment
    void set_url(std::string url);

    [[nodiscard]] std::error_code seek(std::int64_t offset) noexcept;
    [[nodiscard]] std::uint64_t tell() const noexcept { return position_; }

    [[nodiscard]] std::expected<core::Bytes, std::error_code>
    read(std::size_t size = core::READ_ALL) noexcept;

    // Sum of segment sizes, empty when one of them is unknown
    [[nodiscard]] std::expected<std::optional<std::uint64_t>, std::error_code> size() noexcept;

    [[nodiscard]] std::expected<bool, std::error_code> exists() noexcept;

    // Media playlist that was selected, with absolute URIs
    [[nodiscard]] std::expected<std::string, std::error_code> manifest() noexcept;

    [[nodiscard]] std::expected<const HLSPlaylist*, std::error_code> playlist() noexcept;

    // Segment `index`, built on first access
    [[nodiscard]] std::expected<core::RemoteResource*, std::error_code> segment(std::size_t index) noexcept;

    [[nodiscard]] core::FileNaming& naming() noexcept { return naming_; }

    // Playlist name with ".mp4"
    [[nodiscard]] std::string default_filename() const;
    [[nodiscard]] std::filesystem::path filepath() const;

    // "<directory>/<stem>", holds the segments while downloading
    [[nodiscard]] std::filesystem::path temp_directory() const;

    [[nodiscard]] std::expected<std::filesystem::path, std::error_code>
    download(const core::ProgressCallback& progress = {}) noexcept;

    [[nodiscard]] std::error_code unlink() noexcept;

    void remuxer(std::shared_ptr<Remuxer> remuxer) noexcept { remuxer_ = std::move(remuxer); }

private:
    [[nodiscard]] std::error_code resolve() noexcept;
    [[nodiscard]] std::error_code concatenate(const std::vector<std::filesystem::path>& files,
                                              const std::filesystem::path& target) noexcept;
    [[nodiscard]] std::error_code remux(const std::vector<std::filesystem::path>& files,
                                        const std::filesystem::path& target) noexcept;
    [[nodiscard]] std::filesystem::path remux_staging_path() const;
    [[nodiscard]] std::filesystem::path concat_staging_path() const;

    std::string url_;
    std::shared_ptr<core::HttpTransport> transport_;
    core::RequestOptions options_;
    std::shared_ptr<Remuxer> remuxer_;
    core::FileNaming naming_;

    std::optional<HLSPlaylist> playlist_;
    std::string content_;   // Text of the selected media playlist
    std::string base_url_;  // URL it was fetched from
    std::vector<std::unique_ptr<core::RemoteResource>> segments_;

    std::uint64_t position_{0};
};

} // namespace webfile::media
