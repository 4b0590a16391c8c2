// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/settings.hpp>
#include <surge/core/upload_types.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace surge::cli {

// Exit code, or the error that stopped the command
using CliResult = std::expected<int, std::error_code>;

struct CliArgs {
    std::vector<std::string> files;
    std::string config_path;
    std::string server;
    std::string token;
    std::string project;
    std::string folder;
    std::optional<core::ChunkSizeName> chunk_size;
    std::uint32_t concurrency{0};
    std::optional<core::NetworkClass> network;  // Skip probing
    bool plan_only{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;                          // Set when parsing failed
};

[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Settings file (if any), then environment, then command line
[[nodiscard]] std::expected<core::ClientSettings, std::error_code>
resolve_settings(const CliArgs& args) noexcept;

// Upload every file; 0 when all completed or are processing
[[nodiscard]] CliResult upload(const CliArgs& args, const core::ClientSettings& settings) noexcept;

// Print the plan for each file without uploading
[[nodiscard]] CliResult plan(const CliArgs& args, const core::ClientSettings& settings) noexcept;

void print_help(std::string_view program_name) noexcept;
void print_version() noexcept;

} // namespace surge::cli
