// Copyright (c) 2026 changcheng967. All rights reserved.

#include <webfile/disk/file.hpp>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace webfile::disk {

std::error_code errno_to_error_code(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:        return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:        return make_error_code(DiskErrc::invalid_path);
        case EEXIST:        return make_error_code(DiskErrc::file_exists);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        default:            return make_error_code(fallback);
    }
}

//=============================================================================
// File
//=============================================================================

std::expected<File, std::error_code>
File::open(const std::filesystem::path& path, Mode mode) noexcept {
    int flags = O_CLOEXEC;
    switch (mode) {
        case Mode::read:     flags |= O_RDONLY; break;
        case Mode::write:    flags |= O_RDWR | O_CREAT; break;
        case Mode::truncate: flags |= O_RDWR | O_CREAT | O_TRUNC; break;
    }

    File file;
    file.fd_ = ::open(path.c_str(), flags, 0644);
    if (file.fd_ < 0) {
        return std::unexpected(errno_to_error_code(
            errno, mode == Mode::read ? DiskErrc::read_error : DiskErrc::write_error));
    }
    file.path_ = path;
    return file;
}

File::~File() {
    close();
}

File::File(File&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_)) {
    other.fd_ = -1;
}

File& File::operator=(File&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

std::expected<std::size_t, std::error_code>
File::write(std::uint64_t offset, const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    const auto* bytes = static_cast<const unsigned char*>(data);
    std::size_t written = 0;
    while (written < size) {
        const ssize_t n = ::pwrite(fd_, bytes + written, size - written,
                                   static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_to_error_code(errno, DiskErrc::write_error));
        }
        written += static_cast<std::size_t>(n);
    }
    return written;
}

std::expected<std::size_t, std::error_code>
File::read(std::uint64_t offset, void* buffer, std::size_t size) noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    auto* bytes = static_cast<unsigned char*>(buffer);
    std::size_t total = 0;
    while (total < size) {
        const ssize_t n = ::pread(fd_, bytes + total, size - total,
                                  static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_to_error_code(errno, DiskErrc::read_error));
        }
        if (n == 0) break;  // EOF
        total += static_cast<std::size_t>(n);
    }
    return total;
}

std::expected<std::uint64_t, std::error_code> File::size() const noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        return std::unexpected(errno_to_error_code(errno, DiskErrc::read_error));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

std::error_code File::flush() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fsync(fd_) != 0) {
        return errno_to_error_code(errno, DiskErrc::write_error);
    }
    return {};
}

void File::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace webfile::disk
