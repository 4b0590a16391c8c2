// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/config.hpp>
#include <surge/core/task_event.hpp>
#include <surge/core/upload_api.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace surge::core {

// Receives tracker events on the polling thread. Must not block.
using TaskEventSink = std::function<void(TaskEvent)>;

struct PollSchedule {
    std::chrono::milliseconds initial_delay{POLL_INITIAL_DELAY};
    std::chrono::milliseconds interval{POLL_INTERVAL};
};

// Polls server-side transcoding until it finishes. One thread per file.
//
// processing == false   -> processing_finished, stop
// non-2xx answer        -> keep polling
// no answer / bad body  -> processing_poll_failed, stop (task stays processing)
class ProcessingTracker {
public:
    ProcessingTracker(UploadApi& api, TaskEventSink sink, PollSchedule schedule = {});
    ~ProcessingTracker();

    ProcessingTracker(const ProcessingTracker&) = delete;
    ProcessingTracker& operator=(const ProcessingTracker&) = delete;

    // Start polling `file_id` on behalf of `task_id`, replacing any job the
    // task already has
    [[nodiscard]] std::error_code track(std::string file_id, std::uint64_t task_id) noexcept;

    // Cancel one job and wait for its thread
    void stop(std::uint64_t task_id) noexcept;
    void stop_all() noexcept;

    [[nodiscard]] bool is_tracking(std::uint64_t task_id) const noexcept;
    [[nodiscard]] std::size_t active_jobs() const noexcept;

private:
    struct Job {
        std::mutex mutex;
        std::condition_variable_any cv;
        std::atomic<bool> done{false};
        std::jthread thread;    // Last member: joins before the rest goes away
    };

    void poll_loop(std::stop_token stop, Job& job, std::string file_id, std::uint64_t task_id) noexcept;

    // False when stopped before the delay elapsed
    [[nodiscard]] static bool sleep_for(Job& job, std::stop_token& stop,
                                        std::chrono::milliseconds delay);

    void post(std::stop_token& stop, TaskEvent event) noexcept;

    UploadApi& api_;
    TaskEventSink sink_;
    PollSchedule schedule_;

    mutable std::mutex mutex_;
    std::map<std::uint64_t, std::unique_ptr<Job>> jobs_;
};

} // namespace surge::core
