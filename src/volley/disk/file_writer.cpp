// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/disk/file_writer.hpp>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <new>
#include <utility>

namespace volley::disk {

std::error_code errno_to_error_code(int err) noexcept {
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
    : fd_(other.fd_)
    , path_(std::move(other.path_))
    , bytes_written_(other.bytes_written_) {
    other.fd_ = -1;
    other.bytes_written_ = 0;
}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        bytes_written_ = other.bytes_written_;
        other.fd_ = -1;
        other.bytes_written_ = 0;
    }
    return *this;
}

std::error_code FileWriter::open(std::string_view path) noexcept {
    close();

    try {
        path_ = path;
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::invalid_path);
    }

    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        return errno_to_error_code(errno);
    }
    bytes_written_ = 0;
    return {};
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* ptr = static_cast<const char*>(data);
    std::size_t remaining = size;
    while (remaining > 0) {
        ssize_t n = ::write(fd_, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno);
        }
        ptr += n;
        remaining -= static_cast<std::size_t>(n);
    }

    bytes_written_ += size;
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fsync(fd_) != 0) {
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

std::string part_path(std::string_view destination, std::uint32_t index) {
    std::string result(destination);
    result += ".part";
    result += std::to_string(index);
    return result;
}

} // namespace volley::disk
