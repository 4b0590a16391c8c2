// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/upload_api.hpp>
#include <surge/core/upload_types.hpp>
#include <surge/core/config.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <string>
#include <vector>

namespace surge::core {

// Chooses chunk size and concurrency from the network class:
//
//   weak       small   x2  (60 s per request)
//   medium     medium  x3
//   strong     large   x4
//   excellent  large   x6, xlarge above 2 GB
//
// Not thread-safe while load_catalog() runs; planning itself is const.
class ChunkPlanner {
public:
    ChunkPlanner();

    [[nodiscard]] UploadConfig plan(std::uint64_t file_size,
                                    const NetworkCondition& condition) const noexcept;
    [[nodiscard]] UploadConfig plan(std::uint64_t file_size, NetworkClass network) const noexcept;

    // Ask the backend for a config, falling back to plan() when it is
    // unreachable. The answer is re-normalized against file_size.
    [[nodiscard]] UploadConfig plan_remote(UploadApi& api, std::uint64_t file_size,
                                           const NetworkCondition& condition) const noexcept;

    // User picked a different chunk size. File size and concurrency stay.
    [[nodiscard]] std::expected<UploadConfig, std::error_code>
    override_chunk_size(const UploadConfig& config, ChunkSizeName name) const noexcept;

    [[nodiscard]] UploadConfig override_concurrency(const UploadConfig& config,
                                                    std::uint32_t concurrent_chunks) const noexcept;

    // Same chunk choice applied to another file
    [[nodiscard]] UploadConfig resize(const UploadConfig& config, std::uint64_t file_size) const noexcept;

    [[nodiscard]] const std::vector<ChunkSizeOption>& list_chunk_options() const noexcept { return options_; }
    [[nodiscard]] const ChunkSizeOption* find_option(ChunkSizeName name) const noexcept;
    [[nodiscard]] ChunkSizeName default_option() const noexcept { return default_option_; }

    // Scenario ("home_wifi") to option name ("medium")
    [[nodiscard]] const std::map<std::string, std::string>& recommendations() const noexcept {
        return recommendations_;
    }

    // Replace the built-in catalog with the server's. Keeps the current
    // catalog and returns false when the server has none to offer.
    bool load_catalog(UploadApi& api) noexcept;

    [[nodiscard]] static std::vector<ChunkSizeOption> builtin_catalog();
    [[nodiscard]] static Resumability resumability_for(ChunkSizeName name) noexcept;
    [[nodiscard]] static double estimate_minutes(std::uint64_t total_chunks,
                                                 std::uint64_t chunk_size) noexcept;

private:
    [[nodiscard]] std::uint64_t size_of(ChunkSizeName name) const noexcept;

    std::vector<ChunkSizeOption> options_;
    ChunkSizeName default_option_{ChunkSizeName::large};
    std::map<std::string, std::string> recommendations_;
};

} // namespace surge::core
