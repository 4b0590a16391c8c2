// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/upload_api.hpp>
#include <surge/core/upload_types.hpp>
#include <surge/core/config.hpp>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace surge::core {

// Measures current network conditions. measure() never fails: when probing
// cannot complete it returns default_condition().
class NetworkProbe {
public:
    virtual ~NetworkProbe() = default;

    [[nodiscard]] virtual NetworkCondition measure() noexcept = 0;
};

// Thresholds live in config.hpp:
//   excellent  avg >= 100 Mbps, latency < 20 ms
//   strong     avg >= 25 Mbps,  latency < 50 ms
//   medium     avg >= 5 Mbps,   latency < 100 ms
//   weak       anything else
// where avg is the mean of download and upload throughput.
[[nodiscard]] NetworkClass classify(double download_mbps, double upload_mbps,
                                    double latency_ms) noexcept;

// Conservative result used when a probe fails
[[nodiscard]] NetworkCondition default_condition() noexcept;

// Representative measurement for a class (used to skip probing)
[[nodiscard]] NetworkCondition condition_for(NetworkClass network) noexcept;

[[nodiscard]] double throughput_mbps(std::uint64_t bytes, std::chrono::nanoseconds elapsed) noexcept;

// "Strong Network (30.0 Mbps down, 20.0 Mbps up, 25ms ping)"
[[nodiscard]] std::string format_condition(const NetworkCondition& condition);

// Probes through the backend's network test endpoint. Successful results
// are cached for cache_ttl.
class HttpNetworkProbe final : public NetworkProbe {
public:
    explicit HttpNetworkProbe(UploadApi& api,
                              std::chrono::milliseconds cache_ttl = PROBE_CACHE_TTL) noexcept;

    [[nodiscard]] NetworkCondition measure() noexcept override;

    // Force the next measure() to probe again
    void invalidate() noexcept;

    [[nodiscard]] std::optional<NetworkCondition> last() const;

private:
    [[nodiscard]] std::expected<NetworkCondition, ApiError> probe_once() noexcept;

    UploadApi& api_;
    std::chrono::milliseconds cache_ttl_;

    mutable std::mutex mutex_;
    std::optional<NetworkCondition> cached_;
    std::chrono::steady_clock::time_point measured_at_;
};

// Always reports the same condition
class StaticNetworkProbe final : public NetworkProbe {
public:
    explicit StaticNetworkProbe(NetworkCondition condition) noexcept : condition_(condition) {}
    explicit StaticNetworkProbe(NetworkClass network) noexcept : condition_(condition_for(network)) {}

    [[nodiscard]] NetworkCondition measure() noexcept override { return condition_; }

private:
    NetworkCondition condition_;
};

} // namespace surge::core
