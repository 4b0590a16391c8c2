// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <expected>

namespace surge::core {

// Network classification, weakest first
enum class NetworkClass : std::uint8_t {
    weak,
    medium,
    strong,
    excellent
};

// Result of one network probe. Never persisted.
struct NetworkCondition {
    double download_mbps{0.0};
    double upload_mbps{0.0};
    double latency_ms{0.0};
    double packet_loss{0.0};          // Not measured, always 0
    NetworkClass classification{NetworkClass::medium};
    bool measured{false};             // false when the fail-soft default was used
};

// Chunk size tiers, smallest first
enum class ChunkSizeName : std::uint8_t {
    small,
    medium,
    large,
    xlarge
};

struct ChunkSizeOption {
    ChunkSizeName name{ChunkSizeName::medium};
    std::uint64_t size_bytes{0};
    double size_mb{0.0};
    std::string description;
    std::vector<std::string> pros;
    std::vector<std::string> cons;
};

// Informational only, exactly one flag is set
struct Resumability {
    bool excellent{false};
    bool good{false};
    bool limited{false};
};

struct UploadConfig {
    ChunkSizeName chunk_size_name{ChunkSizeName::medium};
    std::uint64_t chunk_size_bytes{0};
    std::uint64_t total_chunks{0};
    std::uint32_t concurrent_chunks{1};
    std::uint32_t timeout_seconds{0};
    std::uint64_t file_size_bytes{0};
    NetworkClass network{NetworkClass::medium};
    double estimated_upload_time_minutes{0.0};
    Resumability resumability;
};

// Where finished files land on the server
struct Destination {
    std::string project_id;
    std::optional<std::string> folder_id;
};

[[nodiscard]] std::string_view to_string(NetworkClass network) noexcept;
[[nodiscard]] std::string_view to_string(ChunkSizeName name) noexcept;

[[nodiscard]] std::expected<NetworkClass, std::error_code>
parse_network_class(std::string_view text) noexcept;

[[nodiscard]] std::expected<ChunkSizeName, std::error_code>
parse_chunk_size_name(std::string_view text) noexcept;

// ceil(file_size / chunk_size); 0 for an empty file
[[nodiscard]] constexpr std::uint64_t chunk_count(std::uint64_t file_size,
                                                  std::uint64_t chunk_size) noexcept {
    if (chunk_size == 0 || file_size == 0) return 0;
    return (file_size + chunk_size - 1) / chunk_size;
}

} // namespace surge::core
