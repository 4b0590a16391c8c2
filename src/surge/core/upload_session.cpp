// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/upload_session.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <string>
#include <thread>
#include <vector>

namespace surge::core {

namespace {

std::string chunk_failure_text(std::uint64_t index) {
    return "Chunk " + std::to_string(index) + " upload failed";
}

std::chrono::seconds request_timeout(const UploadConfig& config) noexcept {
    return std::chrono::seconds{config.timeout_seconds ? config.timeout_seconds : REQUEST_TIMEOUT_SEC};
}

} // namespace

UploadSession::UploadSession(UploadApi& api, UploadConfig config, Destination destination)
    : api_(api)
    , config_(std::move(config))
    , destination_(std::move(destination)) {}

UploadSession::~UploadSession() = default;

void UploadSession::cancel() noexcept {
    if (stop_.request_stop()) {
        spdlog::info("Upload cancel requested");
    }
}

std::error_code UploadSession::run(UploadTask& task, const TaskObserver& observer) noexcept {
    acknowledged_.store(0, std::memory_order_relaxed);
    task.error.clear();
    task.progress = 0.0;

    if (task.file.size_bytes == 0) {
        return fail(task, make_error_code(UploadErrc::empty_file), "File is empty", observer);
    }
    if (stop_.stop_requested()) {
        return fail(task, make_error_code(UploadErrc::cancelled), "Upload cancelled", observer);
    }
    if (config_.chunk_size_bytes == 0) {
        return fail(task, make_error_code(UploadErrc::invalid_argument), "Invalid chunk size", observer);
    }

    // Totals always follow the file actually being sent
    config_.file_size_bytes = task.file.size_bytes;
    config_.total_chunks = chunk_count(task.file.size_bytes, config_.chunk_size_bytes);
    const std::uint64_t total = config_.total_chunks;
    const std::uint64_t window = std::max<std::uint32_t>(config_.concurrent_chunks, 1);

    auto reader = disk::FileReader::open(task.file.path);
    if (!reader) {
        return fail(task, reader.error(), "Cannot read file: " + reader.error().message(), observer);
    }
    if (reader->size() != task.file.size_bytes) {
        return fail(task, make_error_code(UploadErrc::invalid_state),
                    "File changed since it was added", observer);
    }

    ChunkRequest base;
    base.filename = task.file.name;
    base.media_type = task.file.media_type;
    base.total_chunks = total;
    base.total_size = task.file.size_bytes;
    base.chunk_size_name = config_.chunk_size_name;
    base.destination = destination_;
    base.timeout = request_timeout(config_);

    task.status = TaskStatus::uploading;
    if (observer) observer(task);

    spdlog::info("Uploading {} ({} bytes) as {} chunks of {} bytes, {} at a time",
                 task.file.name, task.file.size_bytes, total, config_.chunk_size_bytes, window);

    const std::uint64_t task_id = task.id;
    ThreadSafeQueue<std::uint64_t> work;
    ThreadSafeQueue<TaskEvent> events;
    std::vector<std::jthread> workers;

    auto stop_workers = [&] {
        work.shutdown();
        workers.clear();    // joins
    };

    try {
        const auto count = std::min<std::uint64_t>(window, total);
        workers.reserve(count);
        for (std::uint64_t i = 0; i < count; ++i) {
            workers.emplace_back([&, this] {
                while (auto index = work.pop()) {
                    events.push(send_chunk(*reader, base, task_id, *index));
                }
            });
        }
    } catch (const std::system_error& e) {
        spdlog::error("Failed to start upload workers: {}", e.what());
        stop_workers();
        return fail(task, e.code(), "Failed to start upload", observer);
    }

    std::uint64_t next = 0;
    std::uint64_t in_flight = 0;
    std::error_code failure;
    std::string failure_text;

    for (;;) {
        while (!failure && !stop_.stop_requested() && in_flight < window && next < total) {
            work.push(next++);
            ++in_flight;
        }
        if (in_flight == 0) {
            break;
        }

        auto event = events.pop();
        if (!event) {
            break;
        }
        --in_flight;

        // After a failure the rest is drained, not applied
        if (failure) {
            continue;
        }

        if (event->kind == TaskEvent::Kind::chunk_acknowledged) {
            const auto acked = acknowledged_.fetch_add(1, std::memory_order_relaxed) + 1;
            // 100 is reserved for completed/processing
            if (acked < total) {
                task.progress = static_cast<double>(acked) * 100.0 / static_cast<double>(total);
                if (observer) observer(task);
            }
        } else {
            failure = event->error ? event->error : make_error_code(UploadErrc::rejected);
            failure_text = std::move(event->message);
            spdlog::warn("Chunk {}/{} of {} failed: {}", event->chunk_index, total,
                         task.file.name, failure_text);
        }
    }

    stop_workers();

    if (stop_.stop_requested()) {
        return fail(task, make_error_code(UploadErrc::cancelled), "Upload cancelled", observer);
    }
    if (failure) {
        return fail(task, failure, std::move(failure_text), observer);
    }
    return finalize(task, observer);
}

TaskEvent UploadSession::send_chunk(const disk::FileReader& reader, const ChunkRequest& base,
                                    std::uint64_t task_id, std::uint64_t index) noexcept {
    TaskEvent event;
    event.task_id = task_id;
    event.chunk_index = index;
    event.kind = TaskEvent::Kind::chunk_failed;

    if (stop_.stop_requested()) {
        event.error = make_error_code(UploadErrc::cancelled);
        event.message = "Upload cancelled";
        return event;
    }

    try {
        auto data = reader.read_chunk(index, config_.chunk_size_bytes);
        if (!data) {
            spdlog::error("Failed to read chunk {} of {}: {}", index, reader.path(), data.error().message());
            event.error = data.error();
            event.message = chunk_failure_text(index);
            return event;
        }

        ChunkRequest request = base;
        request.chunk_number = index;
        request.data = std::move(*data);

        auto receipt = api_.upload_chunk(request, stop_.get_token());
        if (!receipt) {
            const auto& err = receipt.error();
            spdlog::debug("Chunk {} not accepted (HTTP {}): {}", index, err.http_status, err.message());
            event.error = err.code;
            event.message = err.detail.empty() ? chunk_failure_text(index) : err.detail;
            return event;
        }

        event.kind = TaskEvent::Kind::chunk_acknowledged;
        event.message = std::move(receipt->message);
        return event;
    } catch (const std::exception& e) {
        spdlog::error("Chunk {} failed: {}", index, e.what());
        event.kind = TaskEvent::Kind::chunk_failed;
        event.error = make_error_code(UploadErrc::network_error);
        event.message = "Chunk " + std::to_string(index) + " upload failed";
        return event;
    }
}

std::error_code UploadSession::finalize(UploadTask& task, const TaskObserver& observer) noexcept {
    FinalizeRequest request;
    request.filename = task.file.name;
    request.destination = destination_;
    request.timeout = request_timeout(config_);

    auto result = api_.finalize(request);
    if (!result) {
        const auto& err = result.error();
        return fail(task, err.code, err.detail.empty() ? "Failed to complete upload" : err.detail, observer);
    }

    task.file_id = result->file_id;
    task.is_video = result->is_video;
    task.processing_status = parse_processing_status(result->processing_status);
    task.processing_message = result->message;
    task.status = result->requires_processing() ? TaskStatus::processing : TaskStatus::completed;
    task.progress = 100.0;
    if (observer) observer(task);

    spdlog::info("Uploaded {} as {} ({})", task.file.name, task.file_id, to_string(task.status));
    return {};
}

std::error_code UploadSession::fail(UploadTask& task, std::error_code ec, std::string message,
                                    const TaskObserver& observer) noexcept {
    task.status = TaskStatus::error;
    task.error = std::move(message);
    if (observer) observer(task);

    spdlog::error("Upload of {} failed: {}", task.file.name, task.error);
    return ec;
}

} // namespace surge::core
