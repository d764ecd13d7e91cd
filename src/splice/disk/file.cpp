// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splice/disk/file.hpp>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace splicer::disk {

namespace {

int open_retry(const std::string& path, int flags, mode_t mode) noexcept {
    int fd;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    } while (fd < 0 && errno == EINTR);
    return fd;
}

} // namespace

std::expected<File, std::error_code> File::create(std::string_view path) noexcept {
    if (path.empty()) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }
    std::string p(path);
    int fd = open_retry(p, O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        return std::unexpected(errno_to_error_code(errno, DiskErrc::write_error));
    }
    return File(fd, std::move(p));
}

std::expected<File, std::error_code> File::open_read(std::string_view path) noexcept {
    if (path.empty()) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }
    std::string p(path);
    int fd = open_retry(p, O_RDONLY, 0);
    if (fd < 0) {
        return std::unexpected(errno_to_error_code(errno, DiskErrc::read_error));
    }
    return File(fd, std::move(p));
}

File::~File() {
    close();
}

File::File(File&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_))
    , bytes_written_(other.bytes_written_) {
    other.fd_ = -1;
}

File& File::operator=(File&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        bytes_written_ = other.bytes_written_;
        other.fd_ = -1;
    }
    return *this;
}

std::error_code File::write(const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* p = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = ::write(fd_, p, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno, DiskErrc::write_error);
        }
        p += n;
        size -= static_cast<std::size_t>(n);
        bytes_written_ += static_cast<std::uint64_t>(n);
    }
    return {};
}

std::expected<std::size_t, std::error_code> File::read(void* buffer, std::size_t size) noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    ssize_t n;
    do {
        n = ::read(fd_, buffer, size);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        return std::unexpected(errno_to_error_code(errno, DiskErrc::read_error));
    }
    return static_cast<std::size_t>(n);
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

} // namespace splicer::disk
