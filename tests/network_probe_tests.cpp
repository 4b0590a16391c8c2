// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/network_probe.hpp>
#include <surge/core/config.hpp>
#include "fakes.hpp"

using namespace surge::core;
using surge::test::FakeUploadApi;
using surge::test::no_response;

TEST_CASE("classify - thresholds", "[probe]") {
    SECTION("Excellent needs speed and low latency") {
        CHECK(classify(150.0, 100.0, 10.0) == NetworkClass::excellent);
        CHECK(classify(150.0, 100.0, 20.0) == NetworkClass::strong);
    }

    SECTION("Averages download and upload") {
        CHECK(classify(40.0, 10.0, 30.0) == NetworkClass::strong);     // avg 25
        CHECK(classify(40.0, 9.0, 30.0) == NetworkClass::medium);      // avg 24.5
    }

    SECTION("Medium") {
        CHECK(classify(5.0, 5.0, 99.0) == NetworkClass::medium);
        CHECK(classify(5.0, 5.0, 100.0) == NetworkClass::weak);
    }

    SECTION("Weak") {
        CHECK(classify(4.0, 5.0, 10.0) == NetworkClass::weak);
        CHECK(classify(0.1, 0.1, 500.0) == NetworkClass::weak);
    }
}

TEST_CASE("throughput_mbps", "[probe]") {
    CHECK(throughput_mbps(1'250'000, std::chrono::seconds{1}) == Catch::Approx(10.0));
    CHECK(throughput_mbps(100, std::chrono::seconds{10}) == Catch::Approx(MIN_MEASURED_MBPS));
    CHECK(throughput_mbps(1000, std::chrono::nanoseconds{0}) == Catch::Approx(MIN_MEASURED_MBPS));
}

TEST_CASE("default_condition", "[probe]") {
    auto condition = default_condition();
    CHECK(condition.classification == NetworkClass::medium);
    CHECK(condition.download_mbps == Catch::Approx(10.0));
    CHECK(condition.upload_mbps == Catch::Approx(8.0));
    CHECK(condition.latency_ms == Catch::Approx(50.0));
    CHECK(condition.packet_loss == 0.0);
    CHECK(!condition.measured);
}

TEST_CASE("condition_for matches its class", "[probe]") {
    for (auto network : {NetworkClass::weak, NetworkClass::medium, NetworkClass::strong, NetworkClass::excellent}) {
        auto condition = condition_for(network);
        CHECK(condition.classification == network);
        CHECK(classify(condition.download_mbps, condition.upload_mbps, condition.latency_ms) == network);
    }
}

TEST_CASE("format_condition", "[probe]") {
    NetworkCondition condition;
    condition.download_mbps = 30.0;
    condition.upload_mbps = 20.0;
    condition.latency_ms = 25.0;
    condition.classification = NetworkClass::strong;
    CHECK(format_condition(condition) == "Strong Network (30.0 Mbps down, 20.0 Mbps up, 25ms ping)");
}

TEST_CASE("HttpNetworkProbe::measure", "[probe]") {
    FakeUploadApi api;

    SECTION("Measures and classifies") {
        HttpNetworkProbe probe(api);
        auto condition = probe.measure();
        CHECK(condition.measured);
        CHECK(condition.download_mbps == Catch::Approx(100.0));
        CHECK(condition.latency_ms == Catch::Approx(10.0));
        CHECK(condition.classification == NetworkClass::excellent);
        REQUIRE(probe.last().has_value());
    }

    SECTION("Timeout falls back to medium") {
        api.download = std::unexpected(no_response(UploadErrc::timeout));
        HttpNetworkProbe probe(api);
        auto condition = probe.measure();
        CHECK(condition.classification == NetworkClass::medium);
        CHECK(!condition.measured);
        CHECK(!probe.last().has_value());
    }

    SECTION("Rejected latency check falls back too") {
        api.latency = std::unexpected(surge::test::rejection(500));
        HttpNetworkProbe probe(api);
        CHECK(probe.measure().classification == NetworkClass::medium);
    }

    SECTION("Empty download payload is a failure") {
        api.download = ProbeSample{0, std::chrono::milliseconds{5}};
        HttpNetworkProbe probe(api);
        CHECK(!probe.measure().measured);
    }

    SECTION("Results are cached until invalidated") {
        HttpNetworkProbe probe(api, std::chrono::minutes{5});
        (void)probe.measure();
        (void)probe.measure();
        CHECK(api.probe_calls == 1);

        probe.invalidate();
        (void)probe.measure();
        CHECK(api.probe_calls == 2);
    }

    SECTION("Zero TTL probes every time") {
        HttpNetworkProbe probe(api, std::chrono::milliseconds{0});
        (void)probe.measure();
        (void)probe.measure();
        CHECK(api.probe_calls == 2);
    }

    SECTION("Failures are not cached") {
        api.download = std::unexpected(no_response());
        HttpNetworkProbe probe(api);
        (void)probe.measure();
        api.download = ProbeSample{1'250'000, std::chrono::milliseconds{100}};
        CHECK(probe.measure().measured);
    }
}

TEST_CASE("StaticNetworkProbe", "[probe]") {
    StaticNetworkProbe probe(NetworkClass::weak);
    CHECK(probe.measure().classification == NetworkClass::weak);
}
