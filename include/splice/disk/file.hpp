// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splice/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace splicer::disk {

// Sequential POSIX file handle: segment sinks, merge source and destination
class File {
public:
    // Create or truncate for writing
    static std::expected<File, std::error_code> create(std::string_view path) noexcept;

    // Open an existing file for reading
    static std::expected<File, std::error_code> open_read(std::string_view path) noexcept;

    File() = default;
    ~File();

    // Non-copyable, movable
    File(const File&) = delete;
    File& operator=(const File&) = delete;
    File(File&& other) noexcept;
    File& operator=(File&& other) noexcept;

    // Write all of data (retries short writes)
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // Returns 0 at end of file
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    read(void* buffer, std::size_t size) noexcept;

    // Flush buffers to disk
    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return bytes_written_; }

private:
    File(int fd, std::string path) noexcept : fd_(fd), path_(std::move(path)) {}

    int fd_{-1};
    std::string path_;
    std::uint64_t bytes_written_{0};
};

} // namespace splicer::disk
