// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <surge/core/task_event.hpp>
#include <surge/core/upload_api.hpp>
#include <surge/core/upload_task.hpp>
#include <surge/core/upload_types.hpp>
#include <surge/disk/file_reader.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <stop_token>

namespace surge::core {

// Called on the run() thread after every visible change to the task
using TaskObserver = std::function<void(const UploadTask&)>;

// Uploads one file in chunks and finalizes it.
//
// Chunks go out in index order, at most concurrent_chunks at a time, on a
// small pool of worker threads. Workers only report completions; run() is
// the single place the task is mutated, so progress never moves backwards.
// The first failed chunk ends the upload: nothing further is dispatched and
// transfers already in flight are drained and ignored.
class UploadSession {
public:
    UploadSession(UploadApi& api, UploadConfig config, Destination destination);
    ~UploadSession();

    // Non-copyable, non-movable (workers hold `this`)
    UploadSession(const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;
    UploadSession(UploadSession&&) = delete;
    UploadSession& operator=(UploadSession&&) = delete;

    // Blocks until the task is completed, processing or error. Returns the
    // failure reason; task.error carries the user facing text.
    [[nodiscard]] std::error_code run(UploadTask& task, const TaskObserver& observer = {}) noexcept;

    // Callable from any thread. In-flight transfers are aborted and the task
    // ends in error "Upload cancelled".
    void cancel() noexcept;

    [[nodiscard]] bool cancelled() const noexcept { return stop_.stop_requested(); }
    [[nodiscard]] const UploadConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::uint64_t acknowledged_chunks() const noexcept {
        return acknowledged_.load(std::memory_order_relaxed);
    }

private:
    // Worker side: read chunk `index`, send it, report the outcome
    [[nodiscard]] TaskEvent send_chunk(const disk::FileReader& reader, const ChunkRequest& base,
                                       std::uint64_t task_id, std::uint64_t index) noexcept;

    [[nodiscard]] std::error_code fail(UploadTask& task, std::error_code ec, std::string message,
                                       const TaskObserver& observer) noexcept;

    [[nodiscard]] std::error_code finalize(UploadTask& task, const TaskObserver& observer) noexcept;

    UploadApi& api_;
    UploadConfig config_;
    Destination destination_;

    std::stop_source stop_;
    std::atomic<std::uint64_t> acknowledged_{0};
};

} // namespace surge::core
