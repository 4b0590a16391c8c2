// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>

namespace surge::core {

constexpr std::uint64_t MIB = 1024 * 1024;

// Chunk size catalog
constexpr std::uint64_t SMALL_CHUNK_SIZE = 1 * MIB;
constexpr std::uint64_t MEDIUM_CHUNK_SIZE = 10 * MIB;
constexpr std::uint64_t LARGE_CHUNK_SIZE = 20 * MIB;
constexpr std::uint64_t XLARGE_CHUNK_SIZE = 50 * MIB;
constexpr std::uint64_t XLARGE_FILE_THRESHOLD = 2048 * MIB;    // xlarge only above 2 GB

// Used when nothing has been planned yet
constexpr std::uint64_t DEFAULT_CHUNK_SIZE = MEDIUM_CHUNK_SIZE;
constexpr std::uint32_t DEFAULT_CONCURRENT_CHUNKS = 3;

// Reference rate for upload time estimates (10 MB/s)
constexpr double ESTIMATE_BYTES_PER_SECOND = 10.0 * MIB;

// Batch thresholds for showing the optimizer
constexpr std::uint64_t LARGE_FILE_THRESHOLD = 100 * MIB;
constexpr std::uint64_t LARGE_BATCH_THRESHOLD = 500 * MIB;

// Network classification (Mbps / ms)
constexpr double EXCELLENT_MIN_MBPS = 100.0;
constexpr double EXCELLENT_MAX_LATENCY_MS = 20.0;
constexpr double STRONG_MIN_MBPS = 25.0;
constexpr double STRONG_MAX_LATENCY_MS = 50.0;
constexpr double MEDIUM_MIN_MBPS = 5.0;
constexpr double MEDIUM_MAX_LATENCY_MS = 100.0;
constexpr double MIN_MEASURED_MBPS = 0.1;

// Fail-soft probe result
constexpr double DEFAULT_DOWNLOAD_MBPS = 10.0;
constexpr double DEFAULT_UPLOAD_MBPS = 8.0;
constexpr double DEFAULT_LATENCY_MS = 50.0;

constexpr std::size_t PROBE_UPLOAD_SIZE = 100 * 1024;          // 100 KB
constexpr std::chrono::minutes PROBE_CACHE_TTL{5};
constexpr std::uint32_t PROBE_TIMEOUT_SEC = 10;

// Per-call timeouts
constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 15;
constexpr std::uint32_t REQUEST_TIMEOUT_SEC = 30;
constexpr std::uint32_t WEAK_REQUEST_TIMEOUT_SEC = 60;
constexpr std::uint32_t POLL_TIMEOUT_SEC = 15;

// Transcoding status polling
constexpr std::chrono::milliseconds POLL_INITIAL_DELAY{2000};
constexpr std::chrono::milliseconds POLL_INTERVAL{3000};

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

} // namespace surge::core
