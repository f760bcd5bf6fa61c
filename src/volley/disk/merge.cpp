// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/disk/merge.hpp>
#include <volley/disk/file_writer.hpp>
#include <volley/core/config.hpp>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <filesystem>
#include <new>
#include <string>
#include <vector>

namespace volley::disk {

namespace {

// Append the whole of `source` to `out`
std::error_code append_file(FileWriter& out, const std::string& source,
                            std::vector<char>& buffer) noexcept {
    int fd = ::open(source.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return errno_to_error_code(errno);
    }

    std::error_code ec;
    while (true) {
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            ec = make_error_code(DiskErrc::read_error);
            break;
        }
        if (n == 0) break;

        ec = out.write(buffer.data(), static_cast<std::size_t>(n));
        if (ec) break;
    }

    ::close(fd);
    return ec;
}

} // namespace

std::error_code merge_parts(std::string_view destination, std::uint32_t part_count) noexcept {
    FileWriter out;
    if (auto ec = out.open(destination)) {
        return ec;
    }

    std::vector<char> buffer;
    try {
        buffer.resize(core::MERGE_BUFFER_SIZE);
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::write_error);
    }

    for (std::uint32_t i = 0; i < part_count; ++i) {
        std::string part;
        try {
            part = part_path(destination, i);
        } catch (const std::bad_alloc&) {
            return make_error_code(DiskErrc::invalid_path);
        }

        if (auto ec = append_file(out, part, buffer)) {
            return ec;
        }
        remove_file(part);
    }

    if (auto ec = out.flush()) {
        return ec;
    }
    out.close();
    return {};
}

void cleanup_parts(std::string_view destination, std::uint32_t part_count) noexcept {
    for (std::uint32_t i = 0; i < part_count; ++i) {
        remove_file(part_path(destination, i));
    }
}

void remove_file(std::string_view path) noexcept {
    std::error_code ec;
    std::filesystem::remove(std::filesystem::path(path), ec);
}

} // namespace volley::disk
