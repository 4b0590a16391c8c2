// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace surge::core {

enum class TaskStatus : std::uint8_t {
    pending,
    uploading,
    processing,     // Server-side transcoding
    completed,
    error
};

enum class ProcessingStatus : std::uint8_t {
    none,
    processing,
    completed,
    no_processing_available
};

// A local file selected for upload
struct FileSource {
    std::string path;
    std::string name;           // Sent as the upload filename
    std::uint64_t size_bytes{0};
    std::string media_type;     // May be empty

    // Stat `path`; name is its last component, media type guessed from the extension
    [[nodiscard]] static std::expected<FileSource, std::error_code>
    from_path(std::string_view path) noexcept;
};

struct UploadTask {
    std::uint64_t id{0};
    FileSource file;
    double progress{0.0};       // 0..100
    TaskStatus status{TaskStatus::pending};
    std::string error;
    bool is_video{false};       // Client-side hint until finalize answers
    ProcessingStatus processing_status{ProcessingStatus::none};
    std::string processing_message;
    std::string file_id;        // Server id, set after finalize

    [[nodiscard]] bool is_active() const noexcept {
        return status == TaskStatus::uploading || status == TaskStatus::processing;
    }
    [[nodiscard]] bool is_finished() const noexcept {
        return status == TaskStatus::completed || status == TaskStatus::error;
    }
};

// Extension allow-list (mp4 avi mov mkv wmv flv webm 3gp m4v, any case) or
// a video/* media type
[[nodiscard]] bool is_video_file(std::string_view name, std::string_view media_type) noexcept;

// "video/mp4" for a.mp4 etc., empty when unknown
[[nodiscard]] std::string guess_media_type(std::string_view name);

[[nodiscard]] std::string_view to_string(TaskStatus status) noexcept;
[[nodiscard]] std::string_view to_string(ProcessingStatus status) noexcept;
[[nodiscard]] ProcessingStatus parse_processing_status(std::string_view text) noexcept;

// Label shown next to a task
[[nodiscard]] std::string_view status_text(const UploadTask& task) noexcept;

} // namespace surge::core
