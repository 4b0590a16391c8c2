// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/chunk_planner.hpp>
#include <surge/core/network_probe.hpp>
#include <surge/core/config.hpp>
#include "fakes.hpp"

using namespace surge::core;
using surge::test::FakeUploadApi;

TEST_CASE("ChunkPlanner::plan - step function", "[planner]") {
    ChunkPlanner planner;
    const std::uint64_t size = 500 * MIB;

    SECTION("Weak") {
        auto config = planner.plan(size, NetworkClass::weak);
        CHECK(config.chunk_size_name == ChunkSizeName::small);
        CHECK(config.chunk_size_bytes == SMALL_CHUNK_SIZE);
        CHECK(config.concurrent_chunks == 2);
        CHECK(config.timeout_seconds == 60);
    }

    SECTION("Medium") {
        auto config = planner.plan(size, NetworkClass::medium);
        CHECK(config.chunk_size_name == ChunkSizeName::medium);
        CHECK(config.concurrent_chunks == 3);
        CHECK(config.timeout_seconds == 30);
    }

    SECTION("Strong") {
        auto config = planner.plan(size, NetworkClass::strong);
        CHECK(config.chunk_size_name == ChunkSizeName::large);
        CHECK(config.concurrent_chunks == 4);
    }

    SECTION("Excellent switches to xlarge above 2 GB") {
        CHECK(planner.plan(2048 * MIB, NetworkClass::excellent).chunk_size_name == ChunkSizeName::large);
        auto config = planner.plan(2048 * MIB + 1, NetworkClass::excellent);
        CHECK(config.chunk_size_name == ChunkSizeName::xlarge);
        CHECK(config.chunk_size_bytes == XLARGE_CHUNK_SIZE);
        CHECK(config.concurrent_chunks == 6);
    }

    SECTION("Plan keeps the network and file size") {
        auto config = planner.plan(size, condition_for(NetworkClass::strong));
        CHECK(config.network == NetworkClass::strong);
        CHECK(config.file_size_bytes == size);
    }
}

TEST_CASE("ChunkPlanner::plan - total chunks", "[planner]") {
    ChunkPlanner planner;

    SECTION("250,000,000 bytes in 10 MB chunks") {
        auto config = planner.plan(250'000'000, NetworkClass::medium);
        CHECK(config.chunk_size_bytes == 10'485'760);
        CHECK(config.total_chunks == 24);
    }

    SECTION("Ceiling division for every class") {
        const std::uint64_t sizes[] = {1, 1'048'575, 1'048'576, 1'048'577, 99'999'999, 3'000'000'000};
        for (auto size : sizes) {
            for (auto network : {NetworkClass::weak, NetworkClass::medium,
                                 NetworkClass::strong, NetworkClass::excellent}) {
                auto config = planner.plan(size, network);
                REQUIRE(config.chunk_size_bytes > 0);
                const auto expected = (size + config.chunk_size_bytes - 1) / config.chunk_size_bytes;
                CHECK(config.total_chunks == expected);
                CHECK((config.total_chunks - 1) * config.chunk_size_bytes < size);
            }
        }
    }

    SECTION("Empty file has no chunks") {
        CHECK(planner.plan(0, NetworkClass::medium).total_chunks == 0);
    }
}

TEST_CASE("ChunkPlanner - estimate and resumability", "[planner]") {
    ChunkPlanner planner;

    auto config = planner.plan(600 * MIB, NetworkClass::medium);
    // 60 chunks of 10 MB at 10 MB/s is one minute
    CHECK(config.total_chunks == 60);
    CHECK(config.estimated_upload_time_minutes == Catch::Approx(1.0));

    CHECK(ChunkPlanner::resumability_for(ChunkSizeName::small).excellent);
    CHECK(ChunkPlanner::resumability_for(ChunkSizeName::medium).excellent);
    CHECK(ChunkPlanner::resumability_for(ChunkSizeName::large).good);
    CHECK(ChunkPlanner::resumability_for(ChunkSizeName::xlarge).limited);

    auto r = ChunkPlanner::resumability_for(ChunkSizeName::large);
    CHECK(!r.excellent);
    CHECK(!r.limited);
}

TEST_CASE("ChunkPlanner::override_chunk_size", "[planner]") {
    ChunkPlanner planner;
    auto config = planner.plan(250'000'000, NetworkClass::strong);
    REQUIRE(config.chunk_size_name == ChunkSizeName::large);

    auto updated = planner.override_chunk_size(config, ChunkSizeName::small);
    REQUIRE(updated.has_value());
    CHECK(updated->file_size_bytes == config.file_size_bytes);
    CHECK(updated->concurrent_chunks == config.concurrent_chunks);
    CHECK(updated->chunk_size_bytes == SMALL_CHUNK_SIZE);
    CHECK(updated->total_chunks == 239);
    CHECK(updated->estimated_upload_time_minutes ==
          Catch::Approx(ChunkPlanner::estimate_minutes(239, SMALL_CHUNK_SIZE)));
    CHECK(updated->resumability.excellent);
}

TEST_CASE("ChunkPlanner::override_concurrency", "[planner]") {
    ChunkPlanner planner;
    auto config = planner.plan(100 * MIB, NetworkClass::medium);

    CHECK(planner.override_concurrency(config, 8).concurrent_chunks == 8);
    CHECK(planner.override_concurrency(config, 0).concurrent_chunks == 1);
    CHECK(planner.override_concurrency(config, 8).total_chunks == config.total_chunks);
}

TEST_CASE("ChunkPlanner::resize", "[planner]") {
    ChunkPlanner planner;
    auto batch = planner.plan(900 * MIB, NetworkClass::strong);

    auto single = planner.resize(batch, 45 * MIB);
    CHECK(single.chunk_size_name == batch.chunk_size_name);
    CHECK(single.concurrent_chunks == batch.concurrent_chunks);
    CHECK(single.file_size_bytes == 45 * MIB);
    CHECK(single.total_chunks == 3);
}

TEST_CASE("ChunkPlanner catalog", "[planner]") {
    ChunkPlanner planner;

    SECTION("Built-in options ordered by size") {
        const auto& options = planner.list_chunk_options();
        REQUIRE(options.size() == 4);
        for (std::size_t i = 1; i < options.size(); ++i) {
            CHECK(options[i - 1].size_bytes < options[i].size_bytes);
        }
        CHECK(planner.find_option(ChunkSizeName::medium)->size_mb == Catch::Approx(10.0));
        CHECK(planner.default_option() == ChunkSizeName::large);
        CHECK(planner.recommendations().at("datacenter") == "xlarge");
        CHECK(planner.recommendations().at("mobile_data") == "small");
    }

    SECTION("Unreachable server keeps the built-in catalog") {
        FakeUploadApi api;
        CHECK(!planner.load_catalog(api));
        CHECK(planner.list_chunk_options().size() == 4);
    }

    SECTION("Server catalog replaces the built-in one") {
        FakeUploadApi api;
        ChunkCatalog catalog;
        catalog.options.push_back({ChunkSizeName::small, 2 * MIB, 2.0, "2MB", {}, {}});
        catalog.options.push_back({ChunkSizeName::medium, 8 * MIB, 8.0, "8MB", {}, {}});
        catalog.default_option = "medium";
        api.catalog = catalog;

        REQUIRE(planner.load_catalog(api));
        CHECK(planner.list_chunk_options().size() == 2);
        CHECK(planner.default_option() == ChunkSizeName::medium);
        CHECK(planner.plan(80 * MIB, NetworkClass::medium).chunk_size_bytes == 8 * MIB);

        // Tiers the server does not list keep their built-in size
        CHECK(planner.plan(80 * MIB, NetworkClass::strong).chunk_size_bytes == LARGE_CHUNK_SIZE);

        auto config = planner.plan(80 * MIB, NetworkClass::medium);
        auto missing = planner.override_chunk_size(config, ChunkSizeName::xlarge);
        REQUIRE(!missing.has_value());
        CHECK(missing.error() == UploadErrc::unknown_chunk_size);
    }

    SECTION("Empty server catalog is ignored") {
        FakeUploadApi api;
        api.catalog = ChunkCatalog{};
        CHECK(!planner.load_catalog(api));
        CHECK(planner.list_chunk_options().size() == 4);
    }
}

TEST_CASE("ChunkPlanner::plan_remote", "[planner]") {
    ChunkPlanner planner;
    FakeUploadApi api;
    const auto condition = condition_for(NetworkClass::strong);

    SECTION("Falls back to the local plan") {
        auto config = planner.plan_remote(api, 250'000'000, condition);
        auto local = planner.plan(250'000'000, condition);
        CHECK(config.chunk_size_name == local.chunk_size_name);
        CHECK(config.total_chunks == local.total_chunks);
    }

    SECTION("Server answer is normalized") {
        UploadConfig remote;
        remote.chunk_size_name = ChunkSizeName::medium;
        remote.chunk_size_bytes = 10 * MIB;
        remote.total_chunks = 999;
        remote.concurrent_chunks = 0;
        remote.timeout_seconds = 0;
        api.remote_config = remote;

        auto config = planner.plan_remote(api, 250'000'000, condition);
        CHECK(config.chunk_size_name == ChunkSizeName::medium);
        CHECK(config.total_chunks == 24);
        CHECK(config.concurrent_chunks == 1);
        CHECK(config.timeout_seconds == REQUEST_TIMEOUT_SEC);
        CHECK(config.resumability.excellent);
        CHECK(config.estimated_upload_time_minutes > 0.0);
    }
}

TEST_CASE("Chunk size names", "[planner]") {
    CHECK(to_string(ChunkSizeName::xlarge) == "xlarge");
    REQUIRE(parse_chunk_size_name("large").has_value());
    CHECK(*parse_chunk_size_name("large") == ChunkSizeName::large);
    CHECK(!parse_chunk_size_name("jumbo").has_value());
    CHECK(*parse_network_class("excellent") == NetworkClass::excellent);
}
