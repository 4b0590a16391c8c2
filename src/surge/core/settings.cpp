// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/settings.hpp>
#include <surge/disk/error.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace surge::core {

namespace {

using json = nlohmann::json;

// Ids may be written as "42" or 42
std::optional<std::string> read_id(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (j[key].is_string()) return j[key].get<std::string>();
    if (j[key].is_number_integer()) return std::to_string(j[key].get<std::int64_t>());
    throw std::invalid_argument(std::string("'") + key + "' must be a string or integer");
}

} // namespace

std::expected<ClientSettings, std::error_code> ClientSettings::parse(std::string_view json_text) noexcept {
    try {
        const auto j = json::parse(json_text);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(UploadErrc::invalid_argument));
        }

        ClientSettings settings;
        settings.base_url = j.value("server", settings.base_url);
        settings.auth_token = j.value("token", settings.auth_token);
        if (auto id = read_id(j, "project_id")) settings.project_id = *id;
        settings.folder_id = read_id(j, "folder_id");

        settings.request_timeout = std::chrono::seconds{
            j.value("request_timeout", static_cast<std::int64_t>(settings.request_timeout.count()))};
        settings.poll_initial_delay = std::chrono::milliseconds{
            j.value("poll_initial_delay_ms", static_cast<std::int64_t>(settings.poll_initial_delay.count()))};
        settings.poll_interval = std::chrono::milliseconds{
            j.value("poll_interval_ms", static_cast<std::int64_t>(settings.poll_interval.count()))};
        settings.probe_cache_ttl = std::chrono::seconds{
            j.value("probe_cache_ttl", static_cast<std::int64_t>(settings.probe_cache_ttl.count()))};
        settings.verify_tls = j.value("verify_tls", settings.verify_tls);
        settings.remote_config = j.value("remote_config", settings.remote_config);

        if (settings.request_timeout.count() <= 0 || settings.poll_interval.count() <= 0 ||
            settings.poll_initial_delay.count() < 0 || settings.probe_cache_ttl.count() < 0) {
            return std::unexpected(make_error_code(UploadErrc::invalid_argument));
        }
        return settings;
    } catch (const json::exception& e) {
        spdlog::error("Invalid settings: {}", e.what());
        return std::unexpected(make_error_code(UploadErrc::invalid_argument));
    } catch (const std::exception& e) {
        spdlog::error("Failed to read settings: {}", e.what());
        return std::unexpected(make_error_code(UploadErrc::invalid_argument));
    }
}

std::expected<ClientSettings, std::error_code> ClientSettings::load(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path)};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            return std::unexpected(make_error_code(disk::DiskErrc::read_error));
        }

        auto settings = parse(buffer.str());
        if (settings) {
            spdlog::debug("Loaded settings from {}", path);
        }
        return settings;
    } catch (const std::exception& e) {
        spdlog::error("Failed to read {}: {}", path, e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

std::error_code ClientSettings::save(std::string_view path) const noexcept {
    try {
        std::filesystem::path p(path);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }

        json j = {
            {"server", base_url},
            {"token", auth_token},
            {"project_id", project_id},
            {"request_timeout", request_timeout.count()},
            {"poll_initial_delay_ms", poll_initial_delay.count()},
            {"poll_interval_ms", poll_interval.count()},
            {"probe_cache_ttl", probe_cache_ttl.count()},
            {"verify_tls", verify_tls},
            {"remote_config", remote_config},
        };
        if (folder_id) {
            j["folder_id"] = *folder_id;
        }

        std::ofstream file(p, std::ios::trunc);
        if (!file) {
            return make_error_code(disk::DiskErrc::access_denied);
        }
        file << j.dump(2) << '\n';
        return file ? std::error_code{} : make_error_code(disk::DiskErrc::write_error);
    } catch (const std::exception& e) {
        spdlog::error("Failed to save settings to {}: {}", path, e.what());
        return make_error_code(disk::DiskErrc::access_denied);
    }
}

void ClientSettings::apply_environment() noexcept {
    try {
        if (const char* server = std::getenv("SURGE_SERVER"); server && *server) {
            base_url = server;
        }
        if (const char* token = std::getenv("SURGE_TOKEN"); token && *token) {
            auth_token = token;
        }
    } catch (const std::bad_alloc&) {
        spdlog::error("Out of memory applying environment settings");
    }
}

} // namespace surge::core
