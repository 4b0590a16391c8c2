// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/disk/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>

namespace surge::disk {

// Read-only file handle for concurrent chunk reads. Reads carry explicit
// offsets, so several workers can share one reader without locking.
class FileReader {
public:
    [[nodiscard]] static std::expected<FileReader, std::error_code>
    open(std::string_view path) noexcept;

    ~FileReader();

    // Non-copyable, movable
    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;
    FileReader(FileReader&& other) noexcept;
    FileReader& operator=(FileReader&& other) noexcept;

    // Read exactly `size` bytes at `offset`, fewer only at end of file
    [[nodiscard]] std::expected<std::string, std::error_code>
    read(std::uint64_t offset, std::size_t size) const noexcept;

    // Bytes [index * chunk_size, min((index + 1) * chunk_size, size()))
    [[nodiscard]] std::expected<std::string, std::error_code>
    read_chunk(std::uint64_t index, std::uint64_t chunk_size) const noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    FileReader() = default;

    int fd_{-1};
    std::uint64_t size_{0};
    std::string path_;
};

} // namespace surge::disk
