// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/upload_task.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <utility>

namespace surge::core {

namespace {

constexpr std::array<std::string_view, 9> VIDEO_EXTENSIONS = {
    "mp4", "avi", "mov", "mkv", "wmv", "flv", "webm", "3gp", "m4v",
};

constexpr std::array<std::pair<std::string_view, std::string_view>, 17> MEDIA_TYPES = {{
    {"mp4", "video/mp4"},
    {"m4v", "video/x-m4v"},
    {"avi", "video/x-msvideo"},
    {"mov", "video/quicktime"},
    {"mkv", "video/x-matroska"},
    {"wmv", "video/x-ms-wmv"},
    {"flv", "video/x-flv"},
    {"webm", "video/webm"},
    {"3gp", "video/3gpp"},
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"png", "image/png"},
    {"gif", "image/gif"},
    {"pdf", "application/pdf"},
    {"zip", "application/zip"},
    {"txt", "text/plain"},
    {"mp3", "audio/mpeg"},
}};

std::string lower_extension(std::string_view name) {
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == name.size()) {
        return {};
    }
    std::string ext(name.substr(dot + 1));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace

bool is_video_file(std::string_view name, std::string_view media_type) noexcept {
    if (media_type.starts_with("video/")) {
        return true;
    }
    try {
        const auto ext = lower_extension(name);
        return std::find(VIDEO_EXTENSIONS.begin(), VIDEO_EXTENSIONS.end(), ext) != VIDEO_EXTENSIONS.end();
    } catch (const std::bad_alloc&) {
        return false;
    }
}

std::string guess_media_type(std::string_view name) {
    const auto ext = lower_extension(name);
    for (const auto& [known, type] : MEDIA_TYPES) {
        if (known == ext) {
            return std::string(type);
        }
    }
    return {};
}

std::expected<FileSource, std::error_code> FileSource::from_path(std::string_view path) noexcept {
    namespace fs = std::filesystem;
    try {
        const fs::path p{std::string(path)};
        std::error_code ec;
        if (!fs::is_regular_file(p, ec)) {
            return std::unexpected(ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory));
        }
        const auto size = fs::file_size(p, ec);
        if (ec) {
            return std::unexpected(ec);
        }

        FileSource source;
        source.path = p.string();
        source.name = p.filename().string();
        source.size_bytes = size;
        source.media_type = guess_media_type(source.name);
        return source;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(UploadErrc::invalid_argument));
    }
}

std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::pending:    return "pending";
        case TaskStatus::uploading:  return "uploading";
        case TaskStatus::processing: return "processing";
        case TaskStatus::completed:  return "completed";
        case TaskStatus::error:      return "error";
    }
    return "unknown";
}

std::string_view to_string(ProcessingStatus status) noexcept {
    switch (status) {
        case ProcessingStatus::none:                    return "";
        case ProcessingStatus::processing:              return "processing";
        case ProcessingStatus::completed:               return "completed";
        case ProcessingStatus::no_processing_available: return "no_processing_available";
    }
    return "";
}

ProcessingStatus parse_processing_status(std::string_view text) noexcept {
    if (text == "processing") return ProcessingStatus::processing;
    if (text == "completed") return ProcessingStatus::completed;
    if (text == "no_processing_available") return ProcessingStatus::no_processing_available;
    return ProcessingStatus::none;
}

std::string_view status_text(const UploadTask& task) noexcept {
    switch (task.status) {
        case TaskStatus::completed:  return task.is_video ? "Video ready" : "Completed";
        case TaskStatus::error:      return "Failed";
        case TaskStatus::uploading:  return "Uploading...";
        case TaskStatus::processing: return "Converting to H.264...";
        case TaskStatus::pending:    break;
    }
    return task.is_video ? "Video ready to upload" : "Pending";
}

} // namespace surge::core
