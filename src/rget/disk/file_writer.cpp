// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rget/disk/file_writer.hpp>
#include <cerrno>
#include <utility>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace rget::disk {

std::error_code errno_to_error_code(int err) noexcept {
    switch (err) {
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:
        case EFBIG:         return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case ELOOP:         return make_error_code(DiskErrc::invalid_path);
        case EISDIR:        return make_error_code(DiskErrc::is_directory);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        default:            return make_error_code(DiskErrc::write_error);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

std::error_code FileWriter::open(std::string_view path, OpenMode mode) noexcept {
    if (is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const std::string p(path);
    int flags = O_WRONLY | O_CLOEXEC;
    if (mode == OpenMode::truncate) {
        flags |= O_CREAT | O_TRUNC;
    } else {
        flags |= O_APPEND;
    }

    int fd = -1;
    do {
        fd = ::open(p.c_str(), flags, 0644);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        return errno_to_error_code(errno);
    }

    fd_ = fd;
    return {};
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (!is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* bytes = static_cast<const char*>(data);
    std::size_t remaining = size;
    while (remaining > 0) {
        ssize_t n = ::write(fd_, bytes, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno);
        }
        bytes += n;
        remaining -= static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (!is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    if (::fdatasync(fd_) != 0 && errno != EINVAL) {
        return errno_to_error_code(errno);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::expected<std::optional<std::uint64_t>, std::error_code>
file_length(std::string_view path) noexcept {
    const std::string p(path);

    struct stat st{};
    if (::stat(p.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            return std::optional<std::uint64_t>{};
        }
        return std::unexpected(errno_to_error_code(errno));
    }

    if (S_ISDIR(st.st_mode)) {
        return std::unexpected(make_error_code(DiskErrc::is_directory));
    }

    return std::optional<std::uint64_t>{static_cast<std::uint64_t>(st.st_size)};
}

} // namespace rget::disk
