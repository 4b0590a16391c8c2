// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/upload_session.hpp>
#include "fakes.hpp"
#include <algorithm>
#include <thread>

using namespace surge::core;
using namespace surge::test;

namespace {

struct Snapshot {
    TaskStatus status;
    double progress;
};

// Observer that keeps every published state
struct Recorder {
    std::vector<Snapshot> seen;

    TaskObserver observer() {
        return [this](const UploadTask& task) { seen.push_back({task.status, task.progress}); };
    }

    [[nodiscard]] bool monotonic() const {
        for (std::size_t i = 1; i < seen.size(); ++i) {
            if (seen[i].progress < seen[i - 1].progress) return false;
        }
        return true;
    }

    [[nodiscard]] bool hundred_only_when_done() const {
        return std::all_of(seen.begin(), seen.end(), [](const Snapshot& s) {
            const bool done = s.status == TaskStatus::completed || s.status == TaskStatus::processing;
            return (s.progress == 100.0) == done;
        });
    }
};

UploadTask make_task(const TempFile& file, std::uint64_t id = 1) {
    UploadTask task;
    task.id = id;
    task.file = file.source();
    return task;
}

const Destination DEST{"42", std::string("7")};

} // namespace

TEST_CASE("UploadSession uploads every chunk then finalizes", "[session]") {
    TempFile file(9500, "report.pdf");
    FakeUploadApi api;
    UploadSession session(api, test_config(1000, 3), DEST);
    auto task = make_task(file);
    Recorder recorder;

    auto ec = session.run(task, recorder.observer());

    REQUIRE(!ec);
    CHECK(task.status == TaskStatus::completed);
    CHECK(task.progress == 100.0);
    CHECK(task.error.empty());
    CHECK(task.file_id == "1");
    CHECK(task.processing_status == ProcessingStatus::no_processing_available);
    CHECK(session.acknowledged_chunks() == 10);

    auto dispatched = api.dispatched();
    std::sort(dispatched.begin(), dispatched.end());
    REQUIRE(dispatched.size() == 10);
    for (std::uint64_t i = 0; i < 10; ++i) {
        CHECK(dispatched[i] == i);
    }

    auto sizes = api.chunk_sizes();
    std::uint64_t sent = 0;
    for (auto size : sizes) sent += size;
    CHECK(sent == 9500);

    const auto requests = api.chunk_requests();
    CHECK(requests.front().filename == "report.pdf");
    CHECK(requests.front().total_chunks == 10);
    CHECK(requests.front().total_size == 9500);
    CHECK(requests.front().destination.project_id == "42");
    CHECK(requests.front().timeout == std::chrono::seconds{5});

    REQUIRE(api.finalize_calls == 1);
    CHECK(api.finalized().front().filename == "report.pdf");
    CHECK(*api.finalized().front().destination.folder_id == "7");

    CHECK(recorder.seen.front().status == TaskStatus::uploading);
    CHECK(recorder.monotonic());
    CHECK(recorder.hundred_only_when_done());
}

TEST_CASE("UploadSession respects the concurrency window", "[session]") {
    TempFile file(20 * 100);
    FakeUploadApi api;
    api.on_chunk = [](const ChunkRequest&, std::stop_token) -> ApiResult<ChunkReceipt> {
        std::this_thread::sleep_for(std::chrono::milliseconds{2});
        return ChunkReceipt{"success", {}};
    };

    SECTION("Three at a time") {
        UploadSession session(api, test_config(100, 3), DEST);
        auto task = make_task(file);
        REQUIRE(!session.run(task));
        CHECK(api.max_in_flight <= 3);
        CHECK(api.dispatched().size() == 20);
    }

    SECTION("One at a time keeps index order") {
        UploadSession session(api, test_config(100, 1), DEST);
        auto task = make_task(file);
        REQUIRE(!session.run(task));
        CHECK(api.max_in_flight == 1);
        auto dispatched = api.dispatched();
        CHECK(std::is_sorted(dispatched.begin(), dispatched.end()));
    }
}

TEST_CASE("UploadSession progress is monotonic with out-of-order acks", "[session]") {
    TempFile file(12 * 64);
    FakeUploadApi api;
    // Earlier chunks take longer, so acknowledgments arrive out of order
    api.on_chunk = [](const ChunkRequest& request, std::stop_token) -> ApiResult<ChunkReceipt> {
        std::this_thread::sleep_for(std::chrono::milliseconds{(12 - request.chunk_number) % 4 * 3});
        return ChunkReceipt{"success", {}};
    };

    UploadSession session(api, test_config(64, 4), DEST);
    auto task = make_task(file);
    Recorder recorder;
    REQUIRE(!session.run(task, recorder.observer()));

    CHECK(recorder.monotonic());
    CHECK(recorder.hundred_only_when_done());
    CHECK(task.progress == 100.0);
}

TEST_CASE("UploadSession stops at the first failed chunk", "[session]") {
    TempFile file(10 * 1000);
    FakeUploadApi api;
    std::atomic<int> after_failure{0};
    api.on_chunk = [&](const ChunkRequest& request, std::stop_token) -> ApiResult<ChunkReceipt> {
        if (request.chunk_number == 4) {
            return std::unexpected(no_response(UploadErrc::connection_lost));
        }
        if (request.chunk_number > 4) {
            ++after_failure;
            std::this_thread::sleep_for(std::chrono::milliseconds{20});
        }
        return ChunkReceipt{"success", {}};
    };

    // Strong network plan: concurrency 3
    UploadSession session(api, test_config(1000, 3), DEST);
    auto task = make_task(file);
    Recorder recorder;

    auto ec = session.run(task, recorder.observer());

    CHECK(ec == UploadErrc::connection_lost);
    CHECK(task.status == TaskStatus::error);
    CHECK(task.error == "Chunk 4 upload failed");
    CHECK(task.progress < 100.0);
    CHECK(api.finalize_calls == 0);

    // Nothing beyond the window that was open when chunk 4 failed
    const auto dispatched = api.dispatched();
    CHECK(*std::max_element(dispatched.begin(), dispatched.end()) <= 6);
    CHECK(after_failure <= 2);

    // Late acknowledgments never move the task past error
    REQUIRE(!recorder.seen.empty());
    CHECK(recorder.seen.back().status == TaskStatus::error);
    CHECK(std::count_if(recorder.seen.begin(), recorder.seen.end(),
                        [](const Snapshot& s) { return s.status == TaskStatus::error; }) == 1);
    CHECK(recorder.monotonic());
}

TEST_CASE("UploadSession reports the server's message", "[session]") {
    TempFile file(300);
    FakeUploadApi api;
    api.on_chunk = [](const ChunkRequest&, std::stop_token) -> ApiResult<ChunkReceipt> {
        return std::unexpected(rejection(413, "Quota exceeded"));
    };

    UploadSession session(api, test_config(100, 2), DEST);
    auto task = make_task(file);
    CHECK(session.run(task) == UploadErrc::rejected);
    CHECK(task.error == "Quota exceeded");
}

TEST_CASE("UploadSession finalize outcomes", "[session]") {
    TempFile file(1000, "holiday.mp4");
    FakeUploadApi api;

    SECTION("Video goes to processing") {
        api.on_finalize = [](const FinalizeRequest&) -> ApiResult<FinalizeResult> {
            return FinalizeResult{"77", true, "processing", "Video is being converted"};
        };
        UploadSession session(api, test_config(100, 3), DEST);
        auto task = make_task(file);
        Recorder recorder;

        REQUIRE(!session.run(task, recorder.observer()));
        CHECK(task.status == TaskStatus::processing);
        CHECK(task.progress == 100.0);
        CHECK(task.file_id == "77");
        CHECK(task.is_video);
        CHECK(task.processing_status == ProcessingStatus::processing);
        CHECK(task.processing_message == "Video is being converted");
        CHECK(recorder.hundred_only_when_done());
    }

    SECTION("Server says no processing for a video name") {
        api.on_finalize = [](const FinalizeRequest&) -> ApiResult<FinalizeResult> {
            return FinalizeResult{"78", true, "no_processing_available", ""};
        };
        UploadSession session(api, test_config(100, 3), DEST);
        auto task = make_task(file);
        REQUIRE(!session.run(task));
        CHECK(task.status == TaskStatus::completed);
    }

    SECTION("Finalize failure without a message") {
        api.on_finalize = [](const FinalizeRequest&) -> ApiResult<FinalizeResult> {
            return std::unexpected(no_response());
        };
        UploadSession session(api, test_config(100, 3), DEST);
        auto task = make_task(file);
        Recorder recorder;

        CHECK(session.run(task, recorder.observer()) == UploadErrc::timeout);
        CHECK(task.status == TaskStatus::error);
        CHECK(task.error == "Failed to complete upload");
        CHECK(task.progress == Catch::Approx(90.0));
        CHECK(recorder.hundred_only_when_done());
    }

    SECTION("Finalize rejection keeps the server text") {
        api.on_finalize = [](const FinalizeRequest&) -> ApiResult<FinalizeResult> {
            return std::unexpected(rejection(200, "Missing chunks: [3]"));
        };
        UploadSession session(api, test_config(100, 3), DEST);
        auto task = make_task(file);
        (void)session.run(task);
        CHECK(task.error == "Missing chunks: [3]");
    }
}

TEST_CASE("UploadSession rejects an empty file", "[session]") {
    TempFile file(0);
    FakeUploadApi api;
    UploadSession session(api, test_config(100, 3), DEST);
    auto task = make_task(file);

    CHECK(session.run(task) == UploadErrc::empty_file);
    CHECK(task.status == TaskStatus::error);
    CHECK(task.error == "File is empty");
    CHECK(api.dispatched().empty());
    CHECK(api.finalize_calls == 0);
}

TEST_CASE("UploadSession recomputes totals for the actual file", "[session]") {
    TempFile file(250);
    FakeUploadApi api;
    // Config planned for some other size
    UploadSession session(api, test_config(100, 2, 10'000), DEST);
    auto task = make_task(file);

    REQUIRE(!session.run(task));
    CHECK(session.config().total_chunks == 3);
    CHECK(api.chunk_requests().front().total_chunks == 3);
}

TEST_CASE("UploadSession::cancel aborts in-flight transfers", "[session]") {
    TempFile file(5000);
    FakeUploadApi api;
    std::atomic<bool> started{false};
    api.on_chunk = [&](const ChunkRequest&, std::stop_token stop) -> ApiResult<ChunkReceipt> {
        started = true;
        for (int i = 0; i < 5000 && !stop.stop_requested(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds{1});
        }
        return std::unexpected(no_response(UploadErrc::cancelled));
    };

    UploadSession session(api, test_config(100, 2), DEST);
    auto task = make_task(file);
    std::error_code ec;

    std::thread runner([&] { ec = session.run(task); });
    while (!started) {
        std::this_thread::sleep_for(std::chrono::milliseconds{1});
    }
    session.cancel();
    runner.join();

    CHECK(ec == UploadErrc::cancelled);
    CHECK(session.cancelled());
    CHECK(task.status == TaskStatus::error);
    CHECK(task.error == "Upload cancelled");
    CHECK(api.dispatched().size() <= 2);
    CHECK(api.finalize_calls == 0);
}
