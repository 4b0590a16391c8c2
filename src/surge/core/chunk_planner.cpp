// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/chunk_planner.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace surge::core {

namespace {

std::uint64_t builtin_size(ChunkSizeName name) noexcept {
    switch (name) {
        case ChunkSizeName::small:  return SMALL_CHUNK_SIZE;
        case ChunkSizeName::medium: return MEDIUM_CHUNK_SIZE;
        case ChunkSizeName::large:  return LARGE_CHUNK_SIZE;
        case ChunkSizeName::xlarge: return XLARGE_CHUNK_SIZE;
    }
    return DEFAULT_CHUNK_SIZE;
}

std::map<std::string, std::string> builtin_recommendations() {
    return {
        {"weak_network", "small"},
        {"mobile_data", "small"},
        {"home_wifi", "medium"},
        {"office_ethernet", "large"},
        {"datacenter", "xlarge"},
    };
}

bool any_flag(const Resumability& r) noexcept {
    return r.excellent || r.good || r.limited;
}

} // namespace

ChunkPlanner::ChunkPlanner()
    : options_(builtin_catalog())
    , recommendations_(builtin_recommendations()) {}

std::vector<ChunkSizeOption> ChunkPlanner::builtin_catalog() {
    return {
        {ChunkSizeName::small, SMALL_CHUNK_SIZE, 1.0,
         "1MB - Good resumability, suitable for weak/unstable networks",
         {"Excellent resumability", "Low memory usage", "Works on slow connections"},
         {"Slower upload", "Many small requests", "Higher overhead"}},
        {ChunkSizeName::medium, MEDIUM_CHUNK_SIZE, 10.0,
         "10MB - Well-balanced choice, recommended for most cases",
         {"Good balance of speed and reliability", "Reasonable memory usage", "Good resumability"},
         {"May be slow for very large files"}},
        {ChunkSizeName::large, LARGE_CHUNK_SIZE, 20.0,
         "20MB - Faster uploads, suitable for strong networks",
         {"Fast upload speeds", "Fewer requests", "Good for large files"},
         {"Higher memory usage", "Less resumable on connection issues"}},
        {ChunkSizeName::xlarge, XLARGE_CHUNK_SIZE, 50.0,
         "50MB - Very fast, best for very large files (>2GB) on stable networks",
         {"Very fast uploads", "Minimal overhead", "Excellent for huge files"},
         {"High memory usage", "Difficult to resume", "Requires stable connection"}},
    };
}

Resumability ChunkPlanner::resumability_for(ChunkSizeName name) noexcept {
    Resumability r;
    switch (name) {
        case ChunkSizeName::small:
        case ChunkSizeName::medium:
            r.excellent = true;
            break;
        case ChunkSizeName::large:
            r.good = true;
            break;
        case ChunkSizeName::xlarge:
            r.limited = true;
            break;
    }
    return r;
}

double ChunkPlanner::estimate_minutes(std::uint64_t total_chunks, std::uint64_t chunk_size) noexcept {
    const double bytes = static_cast<double>(total_chunks) * static_cast<double>(chunk_size);
    return bytes / ESTIMATE_BYTES_PER_SECOND / 60.0;
}

const ChunkSizeOption* ChunkPlanner::find_option(ChunkSizeName name) const noexcept {
    auto it = std::find_if(options_.begin(), options_.end(),
                           [name](const ChunkSizeOption& o) { return o.name == name; });
    return it == options_.end() ? nullptr : &*it;
}

std::uint64_t ChunkPlanner::size_of(ChunkSizeName name) const noexcept {
    const auto* option = find_option(name);
    return option ? option->size_bytes : builtin_size(name);
}

UploadConfig ChunkPlanner::plan(std::uint64_t file_size, const NetworkCondition& condition) const noexcept {
    return plan(file_size, condition.classification);
}

UploadConfig ChunkPlanner::plan(std::uint64_t file_size, NetworkClass network) const noexcept {
    UploadConfig config;
    config.network = network;
    config.file_size_bytes = file_size;
    config.timeout_seconds = REQUEST_TIMEOUT_SEC;

    switch (network) {
        case NetworkClass::weak:
            config.chunk_size_name = ChunkSizeName::small;
            config.concurrent_chunks = 2;
            config.timeout_seconds = WEAK_REQUEST_TIMEOUT_SEC;
            break;
        case NetworkClass::medium:
            config.chunk_size_name = ChunkSizeName::medium;
            config.concurrent_chunks = 3;
            break;
        case NetworkClass::strong:
            config.chunk_size_name = ChunkSizeName::large;
            config.concurrent_chunks = 4;
            break;
        case NetworkClass::excellent:
            config.chunk_size_name = file_size > XLARGE_FILE_THRESHOLD
                ? ChunkSizeName::xlarge
                : ChunkSizeName::large;
            config.concurrent_chunks = 6;
            break;
    }

    config.chunk_size_bytes = size_of(config.chunk_size_name);
    config.total_chunks = chunk_count(file_size, config.chunk_size_bytes);
    config.estimated_upload_time_minutes = estimate_minutes(config.total_chunks, config.chunk_size_bytes);
    config.resumability = resumability_for(config.chunk_size_name);
    return config;
}

UploadConfig ChunkPlanner::plan_remote(UploadApi& api, std::uint64_t file_size,
                                       const NetworkCondition& condition) const noexcept {
    auto remote = api.upload_config(file_size, condition.classification);
    if (!remote) {
        spdlog::warn("Failed to get upload config from backend ({}), using local plan",
                     remote.error().message());
        return plan(file_size, condition);
    }

    UploadConfig config = *remote;
    config.file_size_bytes = file_size;
    config.network = condition.classification;
    config.concurrent_chunks = std::max<std::uint32_t>(config.concurrent_chunks, 1);
    if (config.timeout_seconds == 0) {
        config.timeout_seconds = REQUEST_TIMEOUT_SEC;
    }
    config.total_chunks = chunk_count(file_size, config.chunk_size_bytes);
    if (config.estimated_upload_time_minutes <= 0.0) {
        config.estimated_upload_time_minutes = estimate_minutes(config.total_chunks, config.chunk_size_bytes);
    }
    if (!any_flag(config.resumability)) {
        config.resumability = resumability_for(config.chunk_size_name);
    }
    return config;
}

std::expected<UploadConfig, std::error_code>
ChunkPlanner::override_chunk_size(const UploadConfig& config, ChunkSizeName name) const noexcept {
    const auto* option = find_option(name);
    if (!option) {
        return std::unexpected(make_error_code(UploadErrc::unknown_chunk_size));
    }

    UploadConfig updated = config;
    updated.chunk_size_name = name;
    updated.chunk_size_bytes = option->size_bytes;
    updated.total_chunks = chunk_count(config.file_size_bytes, option->size_bytes);
    updated.estimated_upload_time_minutes = estimate_minutes(updated.total_chunks, updated.chunk_size_bytes);
    updated.resumability = resumability_for(name);
    return updated;
}

UploadConfig ChunkPlanner::override_concurrency(const UploadConfig& config,
                                                std::uint32_t concurrent_chunks) const noexcept {
    UploadConfig updated = config;
    updated.concurrent_chunks = std::max<std::uint32_t>(concurrent_chunks, 1);
    return updated;
}

UploadConfig ChunkPlanner::resize(const UploadConfig& config, std::uint64_t file_size) const noexcept {
    UploadConfig updated = config;
    if (updated.chunk_size_bytes == 0) {
        updated.chunk_size_bytes = size_of(updated.chunk_size_name);
    }
    updated.file_size_bytes = file_size;
    updated.total_chunks = chunk_count(file_size, updated.chunk_size_bytes);
    updated.estimated_upload_time_minutes = estimate_minutes(updated.total_chunks, updated.chunk_size_bytes);
    return updated;
}

bool ChunkPlanner::load_catalog(UploadApi& api) noexcept {
    auto catalog = api.chunk_catalog();
    if (!catalog) {
        spdlog::warn("Failed to get chunk size options from backend ({}), keeping built-in catalog",
                     catalog.error().message());
        return false;
    }
    if (catalog->options.empty()) {
        spdlog::warn("Backend chunk size catalog is empty, keeping built-in catalog");
        return false;
    }

    try {
        options_ = std::move(catalog->options);
        if (auto name = parse_chunk_size_name(catalog->default_option)) {
            default_option_ = *name;
        }
        if (!catalog->recommendations.empty()) {
            recommendations_ = std::move(catalog->recommendations);
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to apply chunk size catalog: {}", e.what());
        options_ = builtin_catalog();
        return false;
    }

    spdlog::debug("Loaded {} chunk size options from backend", options_.size());
    return true;
}

} // namespace surge::core
