// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/chunk_planner.hpp>
#include <surge/core/network_probe.hpp>
#include <surge/core/processing_tracker.hpp>
#include <surge/core/task_event.hpp>
#include <surge/core/upload_api.hpp>
#include <surge/core/upload_session.hpp>
#include <surge/core/upload_task.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace surge::core {

struct BatchOptions {
    PollSchedule poll;
    bool remote_config{false};      // Ask the backend for the plan first
};

struct AddResult {
    std::vector<std::uint64_t> task_ids;
    bool probed{false};             // A video was added and the network measured
    bool optimizer_visible{false};
};

// Asked before discarding a batch with uploads running
using ConfirmCallback = std::function<bool(std::string_view prompt)>;

// The list of files queued for one upload operation.
//
// Files upload one at a time; chunk concurrency inside a file comes from
// the plan. The task list is guarded by a mutex so tasks(), remove() and
// close() may be called while start() runs on another thread.
class BatchCoordinator {
public:
    BatchCoordinator(UploadApi& api, NetworkProbe& probe, const ChunkPlanner& planner,
                     Destination destination, BatchOptions options = {});
    ~BatchCoordinator();

    BatchCoordinator(const BatchCoordinator&) = delete;
    BatchCoordinator& operator=(const BatchCoordinator&) = delete;

    // Queue files as pending tasks. Shows the optimizer when a file is over
    // 100 MB, more than one file is added at once, or the batch passes 500 MB.
    AddResult add_files(std::vector<FileSource> files);

    // Refused with invalid_state while the task is uploading or processing
    [[nodiscard]] std::error_code remove(std::uint64_t task_id) noexcept;

    // User overrides on top of the planned config
    [[nodiscard]] std::error_code select_chunk_size(ChunkSizeName name) noexcept;
    void select_concurrency(std::uint32_t concurrent_chunks) noexcept;

    // Upload every pending task in order. Returns how many reached
    // completed or processing.
    std::size_t start() noexcept;

    std::size_t clear_completed() noexcept;
    // Keeps tasks that are uploading or processing
    std::size_t clear_all() noexcept;

    // Discard the batch. With an upload running, `confirm` must agree first.
    // Returns false when the user declined.
    bool close(const ConfirmCallback& confirm = {}) noexcept;

    // Apply processing tracker events on this thread. Waits up to `wait` for
    // the first one. Returns the number applied.
    std::size_t pump_events(std::chrono::milliseconds wait = std::chrono::milliseconds{0}) noexcept;

    [[nodiscard]] std::vector<UploadTask> tasks() const;
    [[nodiscard]] std::optional<UploadTask> task(std::uint64_t task_id) const;

    void observer(TaskObserver callback);

    [[nodiscard]] std::optional<UploadConfig> current_config() const;
    [[nodiscard]] std::optional<NetworkCondition> network() const;
    [[nodiscard]] bool optimizer_visible() const noexcept { return optimizer_visible_.load(); }
    [[nodiscard]] bool is_uploading() const;
    [[nodiscard]] bool has_processing() const;
    [[nodiscard]] std::uint64_t total_bytes() const;

    [[nodiscard]] const ProcessingTracker& tracker() const noexcept { return tracker_; }

private:
    // Plan for the whole batch, with the user's overrides applied again
    void replan(std::uint64_t batch_bytes, const NetworkCondition& condition);
    [[nodiscard]] UploadConfig config_for(const FileSource& file) const;

    // Copy a session's view of the task back into the list
    void write_back(const UploadTask& task);
    void notify(const UploadTask& task);
    void apply(const TaskEvent& event);

    UploadApi& api_;
    NetworkProbe& probe_;
    const ChunkPlanner& planner_;
    Destination destination_;
    BatchOptions options_;

    mutable std::mutex mutex_;
    std::vector<UploadTask> tasks_;
    std::uint64_t next_id_{1};
    std::optional<NetworkCondition> condition_;
    std::optional<UploadConfig> config_;
    std::optional<ChunkSizeName> chunk_override_;
    std::optional<std::uint32_t> concurrency_override_;
    TaskObserver observer_;
    std::atomic<bool> optimizer_visible_{false};

    std::mutex session_mutex_;
    UploadSession* active_session_{nullptr};
    std::atomic<bool> closing_{false};
    std::atomic<bool> running_{false};

    ThreadSafeQueue<TaskEvent> events_;
    ProcessingTracker tracker_;     // After events_: its threads post there
};

} // namespace surge::core
