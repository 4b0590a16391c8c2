// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/network_probe.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdio>

namespace surge::core {

NetworkClass classify(double download_mbps, double upload_mbps, double latency_ms) noexcept {
    const double avg = (download_mbps + upload_mbps) / 2.0;

    if (avg >= EXCELLENT_MIN_MBPS && latency_ms < EXCELLENT_MAX_LATENCY_MS) return NetworkClass::excellent;
    if (avg >= STRONG_MIN_MBPS && latency_ms < STRONG_MAX_LATENCY_MS) return NetworkClass::strong;
    if (avg >= MEDIUM_MIN_MBPS && latency_ms < MEDIUM_MAX_LATENCY_MS) return NetworkClass::medium;
    return NetworkClass::weak;
}

NetworkCondition default_condition() noexcept {
    NetworkCondition condition;
    condition.download_mbps = DEFAULT_DOWNLOAD_MBPS;
    condition.upload_mbps = DEFAULT_UPLOAD_MBPS;
    condition.latency_ms = DEFAULT_LATENCY_MS;
    condition.classification = NetworkClass::medium;
    condition.measured = false;
    return condition;
}

NetworkCondition condition_for(NetworkClass network) noexcept {
    NetworkCondition condition;
    condition.classification = network;
    switch (network) {
        case NetworkClass::weak:
            condition.download_mbps = 1.0;
            condition.upload_mbps = 0.8;
            condition.latency_ms = 200.0;
            break;
        case NetworkClass::medium:
            return default_condition();
        case NetworkClass::strong:
            condition.download_mbps = 50.0;
            condition.upload_mbps = 30.0;
            condition.latency_ms = 30.0;
            break;
        case NetworkClass::excellent:
            condition.download_mbps = 300.0;
            condition.upload_mbps = 200.0;
            condition.latency_ms = 10.0;
            break;
    }
    return condition;
}

double throughput_mbps(std::uint64_t bytes, std::chrono::nanoseconds elapsed) noexcept {
    if (elapsed.count() <= 0) {
        return MIN_MEASURED_MBPS;
    }
    const double seconds = std::chrono::duration<double>(elapsed).count();
    const double mbps = static_cast<double>(bytes) * 8.0 / seconds / 1'000'000.0;
    return std::max(mbps, MIN_MEASURED_MBPS);
}

std::string format_condition(const NetworkCondition& condition) {
    const char* label = "Medium Network";
    switch (condition.classification) {
        case NetworkClass::weak:      label = "Weak Network"; break;
        case NetworkClass::medium:    label = "Medium Network"; break;
        case NetworkClass::strong:    label = "Strong Network"; break;
        case NetworkClass::excellent: label = "Excellent Network"; break;
    }

    char buffer[160];
    std::snprintf(buffer, sizeof(buffer), "%s (%.1f Mbps down, %.1f Mbps up, %.0fms ping)",
                  label, condition.download_mbps, condition.upload_mbps, condition.latency_ms);
    return buffer;
}

//=============================================================================
// HttpNetworkProbe
//=============================================================================

HttpNetworkProbe::HttpNetworkProbe(UploadApi& api, std::chrono::milliseconds cache_ttl) noexcept
    : api_(api)
    , cache_ttl_(cache_ttl) {}

NetworkCondition HttpNetworkProbe::measure() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cached_ && std::chrono::steady_clock::now() - measured_at_ < cache_ttl_) {
            return *cached_;
        }
    }

    auto result = probe_once();

    if (!result) {
        spdlog::warn("Network probe failed ({}), assuming medium network", result.error().message());
        return default_condition();
    }

    spdlog::info("Network probe: {}", format_condition(*result));

    std::lock_guard<std::mutex> lock(mutex_);
    cached_ = *result;
    measured_at_ = std::chrono::steady_clock::now();
    return *result;
}

std::expected<NetworkCondition, ApiError> HttpNetworkProbe::probe_once() noexcept {
    auto download = api_.probe_download();
    if (!download) return std::unexpected(download.error());
    if (download->bytes == 0) {
        return std::unexpected(ApiError{make_error_code(UploadErrc::probe_failed), "empty download payload", 0});
    }

    auto upload = api_.probe_upload(PROBE_UPLOAD_SIZE);
    if (!upload) return std::unexpected(upload.error());

    auto latency = api_.probe_latency();
    if (!latency) return std::unexpected(latency.error());

    NetworkCondition condition;
    condition.download_mbps = throughput_mbps(download->bytes, download->elapsed);
    condition.upload_mbps = throughput_mbps(upload->bytes > 0 ? upload->bytes : PROBE_UPLOAD_SIZE,
                                            upload->elapsed);
    condition.latency_ms = std::chrono::duration<double, std::milli>(latency->elapsed).count();
    condition.classification = classify(condition.download_mbps, condition.upload_mbps, condition.latency_ms);
    condition.measured = true;
    return condition;
}

void HttpNetworkProbe::invalidate() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    cached_.reset();
}

std::optional<NetworkCondition> HttpNetworkProbe::last() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cached_;
}

} // namespace surge::core
