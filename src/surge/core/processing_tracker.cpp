// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/processing_tracker.hpp>
#include <spdlog/spdlog.h>
#include <vector>

namespace surge::core {

ProcessingTracker::ProcessingTracker(UploadApi& api, TaskEventSink sink, PollSchedule schedule)
    : api_(api)
    , sink_(std::move(sink))
    , schedule_(schedule) {}

ProcessingTracker::~ProcessingTracker() {
    stop_all();
}

std::error_code ProcessingTracker::track(std::string file_id, std::uint64_t task_id) noexcept {
    if (file_id.empty()) {
        return make_error_code(UploadErrc::invalid_argument);
    }

    stop(task_id);

    try {
        auto job = std::make_unique<Job>();
        Job& ref = *job;

        std::lock_guard lock(mutex_);
        // Reap jobs that already ran to the end
        std::erase_if(jobs_, [](const auto& entry) { return entry.second->done.load(); });

        ref.thread = std::jthread([this, &ref, file_id, task_id](std::stop_token stop) {
            poll_loop(std::move(stop), ref, file_id, task_id);
        });
        jobs_.emplace(task_id, std::move(job));
    } catch (const std::system_error& e) {
        spdlog::error("Failed to start processing poll for {}: {}", file_id, e.what());
        return e.code();
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }

    spdlog::debug("Tracking processing of file {} (task {})", file_id, task_id);
    return {};
}

void ProcessingTracker::stop(std::uint64_t task_id) noexcept {
    std::unique_ptr<Job> job;
    {
        std::lock_guard lock(mutex_);
        auto it = jobs_.find(task_id);
        if (it == jobs_.end()) {
            return;
        }
        job = std::move(it->second);
        jobs_.erase(it);
    }

    // Join outside the lock; the poll thread may be inside the sink
    job->thread.request_stop();
    job->cv.notify_all();
}

void ProcessingTracker::stop_all() noexcept {
    std::map<std::uint64_t, std::unique_ptr<Job>> jobs;
    {
        std::lock_guard lock(mutex_);
        jobs.swap(jobs_);
    }
    for (auto& [id, job] : jobs) {
        job->thread.request_stop();
        job->cv.notify_all();
    }
    // ~jthread joins each job
}

bool ProcessingTracker::is_tracking(std::uint64_t task_id) const noexcept {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(task_id);
    return it != jobs_.end() && !it->second->done.load();
}

std::size_t ProcessingTracker::active_jobs() const noexcept {
    std::lock_guard lock(mutex_);
    std::size_t count = 0;
    for (const auto& [id, job] : jobs_) {
        if (!job->done.load()) ++count;
    }
    return count;
}

bool ProcessingTracker::sleep_for(Job& job, std::stop_token& stop, std::chrono::milliseconds delay) {
    std::unique_lock lock(job.mutex);
    job.cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

void ProcessingTracker::post(std::stop_token& stop, TaskEvent event) noexcept {
    if (stop.stop_requested() || !sink_) {
        return;
    }
    try {
        sink_(std::move(event));
    } catch (const std::exception& e) {
        spdlog::error("Processing event sink failed: {}", e.what());
    }
}

void ProcessingTracker::poll_loop(std::stop_token stop, Job& job, std::string file_id,
                                  std::uint64_t task_id) noexcept {
    TaskEvent event;
    event.task_id = task_id;

    try {
        if (!sleep_for(job, stop, schedule_.initial_delay)) {
            job.done.store(true);
            return;
        }

        for (;;) {
            auto state = api_.processing_status(file_id, stop);
            if (stop.stop_requested()) {
                break;
            }

            if (state) {
                if (!state->processing) {
                    spdlog::info("Processing of file {} finished", file_id);
                    event.kind = TaskEvent::Kind::processing_finished;
                    event.message = "Video conversion completed";
                    post(stop, std::move(event));
                    break;
                }
            } else if (state.error().is_rejection()) {
                spdlog::debug("Processing status for {} answered HTTP {}, polling again",
                              file_id, state.error().http_status);
            } else {
                spdlog::warn("Failed to check processing status of {}: {}", file_id, state.error().message());
                event.kind = TaskEvent::Kind::processing_poll_failed;
                event.error = state.error().code;
                event.message = state.error().message();
                post(stop, std::move(event));
                break;
            }

            if (!sleep_for(job, stop, schedule_.interval)) {
                break;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Processing poll for {} aborted: {}", file_id, e.what());
    }

    job.done.store(true);
}

} // namespace surge::core
