// Copyright (c) 2026 changcheng967. All rights reserved.

#include <webfile/core/remote_resource.hpp>
#include <webfile/core/log.hpp>
#include <webfile/core/url.hpp>
#include <webfile/disk/error.hpp>
#include <webfile/disk/file.hpp>
#include <algorithm>

namespace webfile::core {

namespace {

bool is_gzip(const HttpResponse& response) {
    return response.content_encoding.find("gzip") != std::string::npos;
}

} // namespace

RequestOptions RequestOptions::from(const Settings& settings) {
    RequestOptions options;
    options.headers = settings.headers;
    options.cookies = settings.cookies;
    options.user_agent = settings.user_agent;
    options.connect_timeout = settings.connect_timeout;
    options.read_timeout = settings.read_timeout;
    options.chunk_size = settings.chunk_size;
    options.retry = settings.retry_policy();
    return options;
}

std::map<std::string, std::string> RequestOptions::request_headers() const {
    std::map<std::string, std::string> result;
    if (!user_agent.empty()) {
        result["User-Agent"] = user_agent;
    }
    for (const auto& [name, value] : headers) {
        result[name] = value;
    }

    if (!cookies.empty()) {
        std::string cookie;
        for (const auto& [name, value] : cookies) {
            if (!cookie.empty()) cookie += "; ";
            cookie += name + "=" + value;
        }
        result["Cookie"] = std::move(cookie);
    }
    return result;
}

//=============================================================================
// RemoteResource
//=============================================================================

RemoteResource::RemoteResource(std::string url,
                               std::shared_ptr<HttpTransport> transport,
                               RequestOptions options)
    : request_url_(std::move(url))
    , transport_(std::move(transport))
    , options_(std::move(options)) {
    logger("webfile.remote")->debug("{}", request_url_);
}

RemoteResource::~RemoteResource() = default;

HttpRequest RemoteResource::make_request() const {
    HttpRequest request;
    request.url = request_url_;
    request.headers = options_.request_headers();
    request.connect_timeout = options_.connect_timeout;
    request.read_timeout = options_.read_timeout;
    return request;
}

void RemoteResource::record(const HttpResponse& response, std::uint64_t offset) {
    if (metadata_) {
        if (response.status_code == 206) {
            metadata_->accepts_ranges = true;
        }
        return;
    }

    metadata_ = response;
    if (response.range_total) {
        size_ = response.range_total;
    } else if (response.content_length) {
        size_ = response.status_code == 206
            ? response.range_start.value_or(offset) + *response.content_length
            : *response.content_length;
    }

    auto log = logger("webfile.remote");
    log->debug("Response headers for {}:", url());
    for (const auto& [name, value] : response.headers) {
        log->debug("  {}: {}", name, value);
    }
}

std::error_code RemoteResource::open_at(std::uint64_t offset) noexcept {
    auto request = make_request();
    if (offset > 0) {
        request.headers["Range"] = "bytes=" + std::to_string(offset) + "-";
    }

    auto stream = transport_->open(request);
    if (!stream) {
        return stream.error();
    }

    const HttpResponse& response = (*stream)->response();
    if (auto ec = status_error(response.status_code)) {
        logger("webfile.remote")->debug("GET {} answered {}", request_url_, response.status_code);
        return ec;
    }

    if (offset > 0 && response.status_code != 206) {
        // Whole body instead of the requested range
        record(response, 0);
        metadata_->accepts_ranges = false;
        return make_error_code(StreamErrc::range_unsupported);
    }

    record(response, offset);
    stream_ = std::move(*stream);
    return {};
}

std::error_code RemoteResource::open() noexcept {
    if (stream_) {
        return {};
    }
    const std::string what = "GET " + request_url_;
    return options_.retry.run([this] { return open_at(position_); }, what);
}

void RemoteResource::close() noexcept {
    stream_.reset();
}

std::error_code RemoteResource::seek(std::int64_t offset) noexcept {
    auto log = logger("webfile.remote");
    log->debug("Seek to {}", offset);

    if (offset < 0) {
        return make_error_code(StreamErrc::seek_out_of_range);
    }
    const auto target = static_cast<std::uint64_t>(offset);

    if (!metadata_) {
        if (target == position_) {
            return {};
        }

        // Nothing known yet: open directly at the target
        const auto previous = position_;
        close();
        position_ = target;
        auto ec = open();
        if (ec) {
            position_ = previous;
            if (ec == make_error_code(StreamErrc::range_not_satisfiable)) {
                return make_error_code(StreamErrc::seek_out_of_range);
            }
        }
        return ec;
    }

    if (size_ && target >= *size_) {
        log->debug("{} is out of range 0-{}", target, *size_ - 1);
        return make_error_code(StreamErrc::seek_out_of_range);
    }
    if (target == position_) {
        return {};
    }
    // Offset 0 is a plain GET, anything else needs a range request
    if (target > 0 && !metadata_->accepts_ranges) {
        return make_error_code(StreamErrc::range_unsupported);
    }

    close();
    position_ = target;
    return {};
}

std::expected<Bytes, std::error_code> RemoteResource::read(std::size_t size) noexcept {
    Bytes out;
    if (size == 0) {
        return out;
    }

    const std::string what = "GET " + request_url_;
    auto ec = options_.retry.run([this, &out, size]() -> std::error_code {
        if (!stream_) {
            if (size_ && position_ >= *size_) {
                return {};  // Everything already delivered
            }
            if (auto opened = open_at(position_)) {
                return opened;
            }
        }

        while (out.size() < size) {
            const std::size_t old_size = out.size();
            const std::size_t want = std::min(size - old_size, READ_BUFFER_SIZE);
            out.resize(old_size + want);

            auto n = stream_->read(out.data() + old_size, want);
            if (!n) {
                out.resize(old_size);
                close();  // Next attempt resumes at position_
                return n.error();
            }
            out.resize(old_size + *n);
            position_ += *n;
            if (*n == 0) {
                break;
            }
        }
        return {};
    }, what);

    if (ec) {
        if (!out.empty()) {
            // Bytes of a failed read are dropped, the next read starts where this one did
            logger("webfile.remote")->warn("{} stopped after {} bytes: {}", request_url_, out.size(), ec.message());
            position_ -= out.size();
            close();
        }
        return std::unexpected(ec);
    }
    return out;
}

std::expected<std::optional<std::uint64_t>, std::error_code> RemoteResource::size() noexcept {
    if (!metadata_) {
        if (auto ec = open()) {
            return std::unexpected(ec);
        }
    }
    return size_;
}

std::expected<HttpResponse, std::error_code> RemoteResource::metadata() noexcept {
    if (!metadata_) {
        if (auto ec = open()) {
            return std::unexpected(ec);
        }
    }
    return *metadata_;
}

std::expected<bool, std::error_code> RemoteResource::exists() noexcept {
    long status = 0;
    const std::string what = "HEAD " + request_url_;
    std::error_code ec = options_.retry.run([this, &status]() -> std::error_code {
        auto response = transport_->head(make_request());
        if (!response) {
            return response.error();
        }
        status = response->status_code;
        if (status == 405 || status == 501) {
            return {};
        }
        return status_error(status);
    }, what);

    if (!ec && (status == 405 || status == 501)) {
        logger("webfile.remote")->debug("HEAD not allowed for {}, probing with GET", request_url_);
        ec = open();
    }

    if (!ec) return true;
    if (is_client_error(ec)) return false;
    return std::unexpected(ec);
}

std::string RemoteResource::url() const {
    if (metadata_ && !metadata_->effective_url.empty()) {
        return metadata_->effective_url;
    }
    return request_url_;
}

void RemoteResource::set_url(std::string url) {
    request_url_ = std::move(url);
    invalidate();
}

void RemoteResource::invalidate() noexcept {
    close();
    metadata_.reset();
    size_.reset();
    position_ = 0;
}

std::expected<std::string, std::error_code> RemoteResource::remote_filename() noexcept {
    auto meta = metadata();
    if (!meta) {
        return std::unexpected(meta.error());
    }
    if (!meta->filename.empty()) {
        return meta->filename;
    }

    const std::string current = url();
    if (auto parsed = Url::parse(current)) {
        return parsed->filename();
    }
    return current.substr(current.rfind('/') + 1);
}

std::expected<std::filesystem::path, std::error_code> RemoteResource::filepath() noexcept {
    if (naming_.is_explicit()) {
        return naming_.path({});
    }

    auto remote = remote_filename();
    if (!remote) {
        return std::unexpected(remote.error());
    }
    return naming_.path(*remote, guess_extension(metadata_->content_type));
}

std::expected<std::filesystem::path, std::error_code> RemoteResource::staging_path() noexcept {
    auto target = filepath();
    if (!target) {
        return std::unexpected(target.error());
    }
    auto staging = *target;
    staging += PART_SUFFIX;
    return staging;
}

std::error_code RemoteResource::transfer(const std::filesystem::path& staging,
                                         const ProgressCallback& progress) noexcept {
    auto log = logger("webfile.remote");

    std::error_code fs_ec;
    std::uint64_t offset = 0;
    if (std::filesystem::exists(staging, fs_ec)) {
        offset = std::filesystem::file_size(staging, fs_ec);
        if (fs_ec) return make_error_code(disk::DiskErrc::read_error);
    }

    // A leftover staging file is judged against the announced size
    if (offset > 0 && !metadata_) {
        auto known = size();
        if (!known) return known.error();
    }

    // Force a fresh request, an earlier attempt may have left the stream at EOF
    close();

    std::error_code ec;
    const bool complete = size_ && offset == *size_;
    if (!complete) {
        ec = seek(static_cast<std::int64_t>(offset));
    }

    if (!complete && !ec) {
        auto file = disk::File::open(staging, disk::File::Mode::write);
        if (!file) return file.error();

        TransferProgress state;
        state.downloaded_bytes = offset;
        state.total_bytes = size_;
        if (progress) progress(state);

        while (true) {
            auto chunk = read(options_.chunk_size);
            if (!chunk) {
                ec = chunk.error();
                break;
            }
            if (chunk->empty()) break;

            auto written = file->write(offset, chunk->data(), chunk->size());
            if (!written) return written.error();

            offset += chunk->size();
            state.downloaded_bytes = offset;
            state.total_bytes = size_;
            if (progress) progress(state);
        }
    }

    if (is_seek_error(ec) || ec == make_error_code(StreamErrc::range_not_satisfiable)) {
        log->warn("{}: {}. Removing {}", request_url_, ec.message(), staging.string());
        std::filesystem::remove(staging, fs_ec);
        return make_error_code(StreamErrc::range_not_satisfiable);
    }
    if (ec) {
        return ec;
    }

    if (size_ && !(metadata_ && is_gzip(*metadata_))) {
        log->debug("Comparing file size {} {}", offset, *size_);
        if (offset > *size_) {
            log->warn("{} is larger than expected. Removing it", staging.string());
            std::filesystem::remove(staging, fs_ec);
            return make_error_code(StreamErrc::size_mismatch);
        }
        if (offset < *size_) {
            log->warn("{} is smaller than expected ({} of {} bytes)", staging.string(), offset, *size_);
            return make_error_code(StreamErrc::size_mismatch);
        }
    }
    return {};
}

std::expected<std::filesystem::path, std::error_code>
RemoteResource::download(const ProgressCallback& progress) noexcept {
    auto log = logger("webfile.remote");

    auto target = filepath();
    if (!target) {
        return std::unexpected(target.error());
    }

    std::error_code fs_ec;
    if (std::filesystem::exists(*target, fs_ec)) {
        log->warn("{} is already downloaded.", target->string());
        return *target;
    }

    log->info("Downloading {} to {}", url(), target->string());

    if (auto parent = target->parent_path(); !parent.empty()) {
        std::filesystem::create_directories(parent, fs_ec);
        if (fs_ec) {
            return std::unexpected(make_error_code(disk::DiskErrc::invalid_path));
        }
    }

    auto staging = *target;
    staging += PART_SUFFIX;

    const auto policy = options_.retry.with_predicate([](const std::error_code& ec) {
        return ec == make_error_code(StreamErrc::size_mismatch);
    });
    const std::string what = "download " + request_url_;
    if (auto ec = policy.run([&] { return transfer(staging, progress); }, what)) {
        return std::unexpected(ec);
    }

    log->debug("Renaming {} to {}", staging.string(), target->string());
    std::filesystem::rename(staging, *target, fs_ec);
    if (fs_ec) {
        return std::unexpected(make_error_code(disk::DiskErrc::rename_error));
    }
    close();
    return *target;
}

std::error_code RemoteResource::unlink() noexcept {
    auto target = filepath();
    if (!target) {
        return target.error();
    }

    auto staging = *target;
    staging += PART_SUFFIX;

    for (const auto& path : {*target, staging}) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return make_error_code(disk::DiskErrc::remove_error);
        }
    }
    return {};
}

} // namespace webfile::core
