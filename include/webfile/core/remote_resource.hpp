// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <webfile/core/file_name.hpp>
#include <webfile/core/http_session.hpp>
#include <webfile/core/range_readable.hpp>
#include <webfile/core/retry.hpp>
#include <webfile/core/settings.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace webfile::core {

// Per-resource request customisation
struct RequestOptions {
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> cookies;
    std::string user_agent{DEFAULT_USER_AGENT};
    std::chrono::seconds connect_timeout{CONNECTION_TIMEOUT_SEC};
    std::chrono::seconds read_timeout{READ_TIMEOUT_SEC};
    std::size_t chunk_size{DOWNLOAD_CHUNK_SIZE};
    RetryPolicy retry;

    // Custom headers plus User-Agent and Cookie
    [[nodiscard]] std::map<std::string, std::string> request_headers() const;

    [[nodiscard]] static RequestOptions from(const Settings& settings);
};

// One HTTP(S) resource read as a seekable byte stream
class RemoteResource final : public RangeReadable {
public:
    RemoteResource(std::string url,
                   std::shared_ptr<HttpTransport> transport,
                   RequestOptions options = {});
    ~RemoteResource() override;

    RemoteResource(const RemoteResource&) = delete;
    RemoteResource& operator=(const RemoteResource&) = delete;

    [[nodiscard]] std::error_code open() noexcept override;

    [[nodiscard]] std::expected<Bytes, std::error_code>
    read(std::size_t size = READ_ALL) noexcept override;

    [[nodiscard]] std::error_code seek(std::int64_t offset) noexcept override;

    [[nodiscard]] std::uint64_t tell() const noexcept override { return position_; }

    [[nodiscard]] std::expected<std::optional<std::uint64_t>, std::error_code>
    size() noexcept override;

    [[nodiscard]] std::optional<std::uint64_t> known_size() const noexcept override { return size_; }

    void close() noexcept override;

    // False for the 4xx class, other failures propagate
    [[nodiscard]] std::expected<bool, std::error_code> exists() noexcept;

    // Effective URL after redirects once known, the request URL before that
    [[nodiscard]] std::string url() const;
    [[nodiscard]] const std::string& request_url() const noexcept { return request_url_; }
    void set_url(std::string url);

    // Headers of the first response, fetched on demand
    [[nodiscard]] std::expected<HttpResponse, std::error_code> metadata() noexcept;

    // Drop everything learned from the server
    void invalidate() noexcept;

    [[nodiscard]] FileNaming& naming() noexcept { return naming_; }
    [[nodiscard]] const FileNaming& naming() const noexcept { return naming_; }

    // Name suggested by Content-Disposition, else the last URL path component
    [[nodiscard]] std::expected<std::string, std::error_code> remote_filename() noexcept;

    [[nodiscard]] std::expected<std::filesystem::path, std::error_code> filepath() noexcept;

    // "<filepath>.part"
    [[nodiscard]] std::expected<std::filesystem::path, std::error_code> staging_path() noexcept;

    // Resumable single-shot download through the staging file. An existing
    // target is left alone.
    [[nodiscard]] std::expected<std::filesystem::path, std::error_code>
    download(const ProgressCallback& progress = {}) noexcept;

    // Remove the target and its staging file
    [[nodiscard]] std::error_code unlink() noexcept;

    [[nodiscard]] const RequestOptions& options() const noexcept { return options_; }

    [[nodiscard]] std::string to_string() const { return url(); }

    friend bool operator==(const RemoteResource& a, const RemoteResource& b) {
        return a.url() == b.url();
    }

private:
    [[nodiscard]] HttpRequest make_request() const;
    [[nodiscard]] std::error_code open_at(std::uint64_t offset) noexcept;
    void record(const HttpResponse& response, std::uint64_t offset);
    [[nodiscard]] std::error_code transfer(const std::filesystem::path& staging,
                                           const ProgressCallback& progress) noexcept;

    std::string request_url_;
    std::shared_ptr<HttpTransport> transport_;
    RequestOptions options_;
    FileNaming naming_;

    std::unique_ptr<HttpStream> stream_;
    std::uint64_t position_{0};

    std::optional<HttpResponse> metadata_;
    std::optional<std::uint64_t> size_;
};

} // namespace webfile::core
