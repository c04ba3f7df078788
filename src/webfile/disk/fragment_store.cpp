// Copyright (c) 2026 changcheng967. All rights reserved.

#include <webfile/disk/fragment_store.hpp>
#include <webfile/disk/file.hpp>
#include <webfile/core/log.hpp>
#include <algorithm>
#include <charconv>
#include <string>

namespace webfile::disk {

namespace {

// Start offset encoded in "<name>.part<digits>", nullopt for other names
std::optional<std::uint64_t> fragment_start(std::string_view filename, std::string_view prefix) {
    if (!filename.starts_with(prefix) || filename.size() == prefix.size()) {
        return std::nullopt;
    }
    auto digits = filename.substr(prefix.size());
    std::uint64_t start = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), start);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return start;
}

std::error_code remove_if_exists(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return make_error_code(DiskErrc::remove_error);
    }
    return {};
}

} // namespace

PartialDownloadStore::PartialDownloadStore(std::filesystem::path target)
    : target_(std::move(target)) {}

std::filesystem::path PartialDownloadStore::fragment_path(std::uint64_t start) const {
    auto path = target_;
    path += std::string(core::PART_SUFFIX) + std::to_string(start);
    return path;
}

std::filesystem::path PartialDownloadStore::staging_path() const {
    auto path = target_;
    path += core::JOIN_SUFFIX;
    return path;
}

bool PartialDownloadStore::joined() const noexcept {
    std::error_code ec;
    return std::filesystem::is_regular_file(target_, ec);
}

std::expected<std::vector<Fragment>, std::error_code>
PartialDownloadStore::fragments() const noexcept {
    std::vector<Fragment> result;

    auto directory = target_.parent_path();
    if (directory.empty()) {
        directory = ".";
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return result;
    }

    try {
        const std::string prefix = target_.filename().string() + std::string(core::PART_SUFFIX);
        for (const auto& entry : std::filesystem::directory_iterator(directory)) {
            if (!entry.is_regular_file()) continue;

            auto start = fragment_start(entry.path().filename().string(), prefix);
            if (!start) continue;

            result.push_back(Fragment{*start, entry.file_size(), entry.path()});
        }
    } catch (const std::filesystem::filesystem_error& e) {
        core::logger("webfile.store")->error("Listing {} failed: {}", directory.string(), e.what());
        return std::unexpected(make_error_code(DiskErrc::read_error));
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }

    std::sort(result.begin(), result.end(),
              [](const Fragment& a, const Fragment& b) { return a.start < b.start; });
    return result;
}

std::expected<core::Bytes, std::error_code>
PartialDownloadStore::read(std::uint64_t offset, std::size_t size) noexcept {
    auto log = core::logger("webfile.store");
    core::Bytes data;

    if (joined()) {
        auto file = File::open(target_, File::Mode::read);
        if (!file) return std::unexpected(file.error());

        auto file_size = file->size();
        if (!file_size) return std::unexpected(file_size.error());
        if (offset >= *file_size) return data;

        const auto n = static_cast<std::size_t>(
            std::min<std::uint64_t>(size, *file_size - offset));
        data.resize(n);
        auto read = file->read(offset, data.data(), n);
        if (!read) return std::unexpected(read.error());
        data.resize(*read);
        log->debug("Read {} bytes at {} from {}", data.size(), offset, target_.string());
        return data;
    }

    auto fragments = this->fragments();
    if (!fragments) return std::unexpected(fragments.error());

    std::uint64_t cursor = offset;
    std::size_t remaining = size;
    for (const auto& fragment : *fragments) {
        if (remaining == 0) break;
        if (cursor < fragment.start || cursor >= fragment.end()) continue;

        const auto n = static_cast<std::size_t>(
            std::min<std::uint64_t>(remaining, fragment.end() - cursor));

        auto file = File::open(fragment.path, File::Mode::read);
        if (!file) return std::unexpected(file.error());

        const std::size_t old_size = data.size();
        data.resize(old_size + n);
        auto read = file->read(cursor - fragment.start, data.data() + old_size, n);
        if (!read) return std::unexpected(read.error());
        data.resize(old_size + *read);

        log->debug("Read {} bytes at {} from {}", *read, cursor, fragment.path.string());
        cursor += *read;
        remaining -= *read;
        if (*read < n) break;  // Fragment shrank underneath us
    }
    return data;
}

std::error_code
PartialDownloadStore::write(std::uint64_t offset, std::span<const std::byte> data) noexcept {
    if (data.empty()) {
        return {};
    }

    auto log = core::logger("webfile.store");

    std::filesystem::path destination;
    std::uint64_t local_offset = 0;
    File::Mode mode = File::Mode::write;

    if (joined()) {
        destination = target_;
        local_offset = offset;
    } else {
        auto fragments = this->fragments();
        if (!fragments) return fragments.error();

        auto it = std::find_if(fragments->begin(), fragments->end(), [offset](const Fragment& f) {
            return f.start <= offset && offset <= f.end();
        });
        if (it != fragments->end()) {
            destination = it->path;
            local_offset = offset - it->start;
        } else {
            destination = fragment_path(offset);
            mode = File::Mode::truncate;

            std::error_code ec;
            if (auto parent = target_.parent_path(); !parent.empty()) {
                std::filesystem::create_directories(parent, ec);
                if (ec) return make_error_code(DiskErrc::invalid_path);
            }
        }
    }

    auto file = File::open(destination, mode);
    if (!file) return file.error();

    auto written = file->write(local_offset, data.data(), data.size());
    if (!written) return written.error();

    log->debug("Wrote {} bytes at {} to {}", data.size(), offset, destination.string());
    return {};
}

std::expected<std::uint64_t, std::error_code> PartialDownloadStore::size() noexcept {
    if (joined()) {
        std::error_code ec;
        auto file_size = std::filesystem::file_size(target_, ec);
        if (ec) return std::unexpected(make_error_code(DiskErrc::read_error));
        return file_size;
    }

    auto fragments = this->fragments();
    if (!fragments) return std::unexpected(fragments.error());

    std::uint64_t cursor = 0;
    for (const auto& fragment : *fragments) {
        if (fragment.start <= cursor && fragment.end() > cursor) {
            cursor = fragment.end();
        }
    }
    return cursor;
}

std::expected<bool, std::error_code> PartialDownloadStore::join(std::uint64_t expected_size) noexcept {
    if (joined()) {
        return true;
    }

    auto cached = size();
    if (!cached) return std::unexpected(cached.error());
    if (*cached != expected_size) {
        return false;
    }

    auto log = core::logger("webfile.store");
    log->debug("Joining {} bytes into {}", expected_size, target_.string());

    const auto staging = staging_path();
    {
        auto out = File::open(staging, File::Mode::truncate);
        if (!out) return std::unexpected(out.error());

        std::uint64_t copied = 0;
        while (copied < expected_size) {
            const auto want = static_cast<std::size_t>(
                std::min<std::uint64_t>(core::JOIN_CHUNK_SIZE, expected_size - copied));
            auto chunk = read(copied, want);
            if (!chunk) return std::unexpected(chunk.error());
            if (chunk->empty()) break;

            auto written = out->write(copied, chunk->data(), chunk->size());
            if (!written) return std::unexpected(written.error());
            copied += chunk->size();
        }

        if (copied != expected_size) {
            out->close();
            (void)remove_if_exists(staging);
            return std::unexpected(make_error_code(DiskErrc::read_error));
        }
    }

    std::error_code ec;
    std::filesystem::rename(staging, target_, ec);
    if (ec) {
        log->error("Renaming {} failed: {}", staging.string(), ec.message());
        return std::unexpected(make_error_code(DiskErrc::rename_error));
    }

    auto fragments = this->fragments();
    if (!fragments) return std::unexpected(fragments.error());
    for (const auto& fragment : *fragments) {
        log->debug("Removing {}", fragment.path.string());
        if (auto removed = remove_if_exists(fragment.path)) {
            return std::unexpected(removed);
        }
    }
    return true;
}

std::error_code PartialDownloadStore::unlink() noexcept {
    if (auto ec = remove_if_exists(target_)) return ec;
    if (auto ec = remove_if_exists(staging_path())) return ec;

    auto fragments = this->fragments();
    if (!fragments) return fragments.error();
    for (const auto& fragment : *fragments) {
        if (auto ec = remove_if_exists(fragment.path)) return ec;
    }
    return {};
}

} // namespace webfile::disk
