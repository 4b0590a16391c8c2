// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/config.hpp>
#include <surge/core/upload_types.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace surge::core {

constexpr std::string_view DEFAULT_SERVER_URL = "http://localhost:8001/api/";

// Runtime client settings, read from a JSON file:
//
//   {
//     "server": "https://files.example.com/api/",
//     "token": "...",
//     "project_id": "42",
//     "folder_id": "7",
//     "request_timeout": 30,
//     "poll_initial_delay_ms": 2000,
//     "poll_interval_ms": 3000,
//     "probe_cache_ttl": 300,
//     "verify_tls": true,
//     "remote_config": false
//   }
//
// Every key is optional. SURGE_SERVER and SURGE_TOKEN override the file.
struct ClientSettings {
    std::string base_url{DEFAULT_SERVER_URL};
    std::string auth_token;
    std::string project_id;
    std::optional<std::string> folder_id;
    std::chrono::seconds request_timeout{REQUEST_TIMEOUT_SEC};
    std::chrono::milliseconds poll_initial_delay{POLL_INITIAL_DELAY};
    std::chrono::milliseconds poll_interval{POLL_INTERVAL};
    std::chrono::seconds probe_cache_ttl{PROBE_CACHE_TTL};
    bool verify_tls{true};
    bool remote_config{false};

    [[nodiscard]] static std::expected<ClientSettings, std::error_code>
    load(std::string_view path) noexcept;

    [[nodiscard]] static std::expected<ClientSettings, std::error_code>
    parse(std::string_view json_text) noexcept;

    [[nodiscard]] std::error_code save(std::string_view path) const noexcept;

    // Apply SURGE_SERVER / SURGE_TOKEN when set
    void apply_environment() noexcept;

    [[nodiscard]] Destination destination() const { return {project_id, folder_id}; }
};

} // namespace surge::core
