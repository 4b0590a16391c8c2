// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/disk/file_reader.hpp>
#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace surge::disk {

namespace {

std::error_code from_errno(int err) noexcept {
    switch (err) {
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:         return make_error_code(DiskErrc::access_denied);
        case ENAMETOOLONG:
        case ENOTDIR:       return make_error_code(DiskErrc::invalid_path);
        case EISDIR:        return make_error_code(DiskErrc::not_a_file);
        default:            return make_error_code(DiskErrc::read_error);
    }
}

} // namespace

std::expected<FileReader, std::error_code> FileReader::open(std::string_view path) noexcept {
    if (path.empty()) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }

    FileReader reader;
    try {
        reader.path_ = std::string(path);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }

    reader.fd_ = ::open(reader.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (reader.fd_ < 0) {
        return std::unexpected(from_errno(errno));
    }

    struct stat st{};
    if (::fstat(reader.fd_, &st) != 0) {
        return std::unexpected(from_errno(errno));
    }
    if (!S_ISREG(st.st_mode)) {
        return std::unexpected(make_error_code(DiskErrc::not_a_file));
    }

    reader.size_ = static_cast<std::uint64_t>(st.st_size);
    return reader;
}

FileReader::~FileReader() {
    close();
}

FileReader::FileReader(FileReader&& other) noexcept
    : fd_(other.fd_)
    , size_(other.size_)
    , path_(std::move(other.path_)) {
    other.fd_ = -1;
    other.size_ = 0;
}

FileReader& FileReader::operator=(FileReader&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        size_ = other.size_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
        other.size_ = 0;
    }
    return *this;
}

std::expected<std::string, std::error_code>
FileReader::read(std::uint64_t offset, std::size_t size) const noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }
    if (offset > size_) {
        return std::unexpected(make_error_code(DiskErrc::out_of_range));
    }

    const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(size, size_ - offset));
    std::string buffer;
    try {
        buffer.resize(wanted);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }

    // pread may return less than asked; loop until the range is filled
    std::size_t done = 0;
    while (done < wanted) {
        const auto n = ::pread(fd_, buffer.data() + done, wanted - done,
                               static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(from_errno(errno));
        }
        if (n == 0) {
            return std::unexpected(make_error_code(DiskErrc::short_read));
        }
        done += static_cast<std::size_t>(n);
    }
    return buffer;
}

std::expected<std::string, std::error_code>
FileReader::read_chunk(std::uint64_t index, std::uint64_t chunk_size) const noexcept {
    if (chunk_size == 0) {
        return std::unexpected(make_error_code(DiskErrc::out_of_range));
    }
    const std::uint64_t offset = index * chunk_size;
    if (offset >= size_) {
        return std::unexpected(make_error_code(DiskErrc::out_of_range));
    }
    return read(offset, static_cast<std::size_t>(std::min(chunk_size, size_ - offset)));
}

void FileReader::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace surge::disk
