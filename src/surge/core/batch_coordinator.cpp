// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/batch_coordinator.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace surge::core {

namespace {

constexpr std::string_view CLOSE_PROMPT = "Upload in progress. Are you sure you want to close?";

} // namespace

BatchCoordinator::BatchCoordinator(UploadApi& api, NetworkProbe& probe, const ChunkPlanner& planner,
                                   Destination destination, BatchOptions options)
    : api_(api)
    , probe_(probe)
    , planner_(planner)
    , destination_(std::move(destination))
    , options_(options)
    , tracker_(api, [this](TaskEvent event) { events_.push(std::move(event)); }, options.poll) {}

BatchCoordinator::~BatchCoordinator() {
    {
        std::lock_guard lock(session_mutex_);
        if (active_session_) active_session_->cancel();
    }
    tracker_.stop_all();
}

AddResult BatchCoordinator::add_files(std::vector<FileSource> files) {
    AddResult result;
    if (files.empty()) {
        return result;
    }

    bool any_video = false;
    bool large_file = false;
    std::uint64_t batch_bytes = 0;
    std::vector<UploadTask> added;

    {
        std::lock_guard lock(mutex_);
        for (auto& file : files) {
            UploadTask task;
            task.id = next_id_++;
            task.is_video = is_video_file(file.name, file.media_type);
            task.file = std::move(file);

            any_video = any_video || task.is_video;
            large_file = large_file || task.file.size_bytes > LARGE_FILE_THRESHOLD;

            result.task_ids.push_back(task.id);
            tasks_.push_back(task);
            added.push_back(std::move(task));
        }
        for (const auto& task : tasks_) {
            batch_bytes += task.file.size_bytes;
        }
    }

    const bool large_batch = large_file || added.size() > 1 || batch_bytes > LARGE_BATCH_THRESHOLD;
    if (large_batch && !optimizer_visible_.exchange(true)) {
        spdlog::info("Batch of {} bytes, showing upload optimizer", batch_bytes);
    }
    result.optimizer_visible = optimizer_visible_.load();

    // Probe outside the lock; it may take seconds
    if (any_video || result.optimizer_visible) {
        const auto condition = probe_.measure();
        result.probed = any_video;
        {
            std::lock_guard lock(mutex_);
            condition_ = condition;
        }
        spdlog::info("Network: {}", format_condition(condition));
        if (result.optimizer_visible) {
            replan(batch_bytes, condition);
        }
    }

    for (const auto& task : added) {
        notify(task);
    }
    return result;
}

void BatchCoordinator::replan(std::uint64_t batch_bytes, const NetworkCondition& condition) {
    auto config = options_.remote_config
        ? planner_.plan_remote(api_, batch_bytes, condition)
        : planner_.plan(batch_bytes, condition);

    std::lock_guard lock(mutex_);
    if (chunk_override_) {
        if (auto overridden = planner_.override_chunk_size(config, *chunk_override_)) {
            config = *overridden;
        }
    }
    if (concurrency_override_) {
        config = planner_.override_concurrency(config, *concurrency_override_);
    }
    config_ = config;
}

std::error_code BatchCoordinator::remove(std::uint64_t task_id) noexcept {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [task_id](const UploadTask& t) { return t.id == task_id; });
    if (it == tasks_.end()) {
        return make_error_code(UploadErrc::not_found);
    }
    if (it->is_active()) {
        spdlog::debug("Refusing to remove task {} while {}", task_id, to_string(it->status));
        return make_error_code(UploadErrc::invalid_state);
    }
    tasks_.erase(it);
    return {};
}

std::error_code BatchCoordinator::select_chunk_size(ChunkSizeName name) noexcept {
    if (!planner_.find_option(name)) {
        return make_error_code(UploadErrc::unknown_chunk_size);
    }

    std::lock_guard lock(mutex_);
    chunk_override_ = name;
    if (config_) {
        if (auto updated = planner_.override_chunk_size(*config_, name)) {
            config_ = *updated;
        }
    }
    return {};
}

void BatchCoordinator::select_concurrency(std::uint32_t concurrent_chunks) noexcept {
    std::lock_guard lock(mutex_);
    concurrency_override_ = std::max<std::uint32_t>(concurrent_chunks, 1);
    if (config_) {
        config_ = planner_.override_concurrency(*config_, *concurrency_override_);
    }
}

UploadConfig BatchCoordinator::config_for(const FileSource& file) const {
    std::lock_guard lock(mutex_);
    if (config_) {
        return planner_.resize(*config_, file.size_bytes);
    }

    // No optimizer: plan the file on its own
    auto config = planner_.plan(file.size_bytes, condition_ ? *condition_ : default_condition());
    if (chunk_override_) {
        if (auto overridden = planner_.override_chunk_size(config, *chunk_override_)) {
            config = *overridden;
        }
    }
    if (concurrency_override_) {
        config = planner_.override_concurrency(config, *concurrency_override_);
    }
    return config;
}

std::size_t BatchCoordinator::start() noexcept {
    if (running_.exchange(true)) {
        spdlog::warn("Upload already running");
        return 0;
    }
    closing_.store(false);

    std::size_t uploaded = 0;
    try {
        std::vector<std::uint64_t> pending;
        {
            std::lock_guard lock(mutex_);
            for (const auto& task : tasks_) {
                if (task.status == TaskStatus::pending) pending.push_back(task.id);
            }
        }
        spdlog::info("Starting upload of {} file(s)", pending.size());

        for (const auto id : pending) {
            if (closing_.load()) {
                break;
            }

            // Claim the task under the lock so remove() cannot race the session
            UploadTask work;
            {
                std::lock_guard lock(mutex_);
                auto it = std::find_if(tasks_.begin(), tasks_.end(),
                                       [id](const UploadTask& t) { return t.id == id; });
                if (it == tasks_.end() || it->status != TaskStatus::pending) {
                    continue;
                }
                it->status = TaskStatus::uploading;
                work = *it;
            }

            UploadSession session(api_, config_for(work.file), destination_);
            {
                std::lock_guard lock(session_mutex_);
                active_session_ = &session;
            }

            (void)session.run(work, [this](const UploadTask& task) { write_back(task); });

            {
                std::lock_guard lock(session_mutex_);
                active_session_ = nullptr;
            }

            // Held across track() so close() either discards the task first
            // or stops the job it just started
            std::lock_guard lock(mutex_);
            const bool kept = !closing_.load() &&
                std::any_of(tasks_.begin(), tasks_.end(), [id](const UploadTask& t) { return t.id == id; });
            if (!kept) {
                spdlog::debug("Task {} discarded during upload", id);
                continue;
            }

            if (work.status == TaskStatus::processing) {
                if (auto ec = tracker_.track(work.file_id, work.id)) {
                    spdlog::error("Cannot track processing of {}: {}", work.file.name, ec.message());
                }
            }
            if (work.status == TaskStatus::processing || work.status == TaskStatus::completed) {
                ++uploaded;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Batch upload aborted: {}", e.what());
    }

    running_.store(false);
    return uploaded;
}

std::size_t BatchCoordinator::clear_completed() noexcept {
    std::lock_guard lock(mutex_);
    return std::erase_if(tasks_, [](const UploadTask& t) { return t.status == TaskStatus::completed; });
}

std::size_t BatchCoordinator::clear_all() noexcept {
    std::lock_guard lock(mutex_);
    const auto removed = std::erase_if(tasks_, [](const UploadTask& t) { return !t.is_active(); });
    if (tasks_.empty()) {
        optimizer_visible_.store(false);
        config_.reset();
    }
    return removed;
}

bool BatchCoordinator::close(const ConfirmCallback& confirm) noexcept {
    if (is_uploading()) {
        bool confirmed = false;
        try {
            confirmed = confirm && confirm(CLOSE_PROMPT);
        } catch (const std::exception& e) {
            spdlog::error("Close confirmation failed: {}", e.what());
        }
        if (!confirmed) {
            return false;
        }
        spdlog::warn("Closing batch with an upload in progress");
    }

    {
        std::lock_guard lock(mutex_);
        closing_.store(true);
        tasks_.clear();
        config_.reset();
        optimizer_visible_.store(false);
    }
    {
        std::lock_guard lock(session_mutex_);
        if (active_session_) active_session_->cancel();
    }

    // After the list is gone start() can no longer hand a task over
    tracker_.stop_all();
    while (events_.try_pop()) {
    }
    return true;
}

std::size_t BatchCoordinator::pump_events(std::chrono::milliseconds wait) noexcept {
    std::size_t applied = 0;
    try {
        auto event = wait.count() > 0 ? events_.pop_for(wait) : events_.try_pop();
        while (event) {
            apply(*event);
            ++applied;
            event = events_.try_pop();
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to apply task event: {}", e.what());
    }
    return applied;
}

void BatchCoordinator::apply(const TaskEvent& event) {
    std::optional<UploadTask> changed;
    {
        std::lock_guard lock(mutex_);
        auto it = std::find_if(tasks_.begin(), tasks_.end(),
                               [&](const UploadTask& t) { return t.id == event.task_id; });
        if (it == tasks_.end()) {
            return;
        }

        switch (event.kind) {
            case TaskEvent::Kind::processing_finished:
                it->status = TaskStatus::completed;
                it->processing_status = ProcessingStatus::completed;
                it->processing_message = event.message;
                it->progress = 100.0;
                changed = *it;
                break;
            case TaskEvent::Kind::processing_poll_failed:
                // Task stays processing; nothing to show
                spdlog::warn("Lost track of processing for {}: {}", it->file.name, event.message);
                break;
            default:
                break;
        }
    }
    if (changed) {
        notify(*changed);
    }
}

void BatchCoordinator::write_back(const UploadTask& task) {
    {
        std::lock_guard lock(mutex_);
        auto it = std::find_if(tasks_.begin(), tasks_.end(),
                               [&](const UploadTask& t) { return t.id == task.id; });
        if (it == tasks_.end()) {
            return;     // Discarded by close()
        }
        *it = task;
    }
    notify(task);
}

void BatchCoordinator::notify(const UploadTask& task) {
    TaskObserver callback;
    {
        std::lock_guard lock(mutex_);
        callback = observer_;
    }
    if (callback) {
        callback(task);
    }
}

std::vector<UploadTask> BatchCoordinator::tasks() const {
    std::lock_guard lock(mutex_);
    return tasks_;
}

std::optional<UploadTask> BatchCoordinator::task(std::uint64_t task_id) const {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [task_id](const UploadTask& t) { return t.id == task_id; });
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return *it;
}

void BatchCoordinator::observer(TaskObserver callback) {
    std::lock_guard lock(mutex_);
    observer_ = std::move(callback);
}

std::optional<UploadConfig> BatchCoordinator::current_config() const {
    std::lock_guard lock(mutex_);
    return config_;
}

std::optional<NetworkCondition> BatchCoordinator::network() const {
    std::lock_guard lock(mutex_);
    return condition_;
}

bool BatchCoordinator::is_uploading() const {
    std::lock_guard lock(mutex_);
    return std::any_of(tasks_.begin(), tasks_.end(),
                       [](const UploadTask& t) { return t.status == TaskStatus::uploading; });
}

bool BatchCoordinator::has_processing() const {
    std::lock_guard lock(mutex_);
    return std::any_of(tasks_.begin(), tasks_.end(),
                       [](const UploadTask& t) { return t.status == TaskStatus::processing; });
}

std::uint64_t BatchCoordinator::total_bytes() const {
    std::lock_guard lock(mutex_);
    std::uint64_t total = 0;
    for (const auto& task : tasks_) total += task.file.size_bytes;
    return total;
}

} // namespace surge::core
