// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/disk/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace volley::disk {

// Sequential writer over a POSIX file descriptor. Each part file and the
// merged output are owned by exactly one writer, so there is no locking.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Create or truncate the file
    [[nodiscard]] std::error_code open(std::string_view path) noexcept;

    // Append data at the current end of file
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // Flush kernel buffers to disk
    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return bytes_written_; }

private:
    int fd_{-1};
    std::string path_;
    std::uint64_t bytes_written_{0};
};

// Path of the temporary file holding one segment: "<destination>.part<index>"
[[nodiscard]] std::string part_path(std::string_view destination, std::uint32_t index);

} // namespace volley::disk
