// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/settings.hpp>
#include <surge/disk/error.hpp>
#include <cstdlib>
#include <filesystem>
#include <unistd.h>

using namespace surge::core;
using namespace std::chrono_literals;

TEST_CASE("ClientSettings defaults", "[settings]") {
    ClientSettings settings;
    CHECK(settings.base_url == "http://localhost:8001/api/");
    CHECK(settings.request_timeout == 30s);
    CHECK(settings.poll_initial_delay == 2000ms);
    CHECK(settings.poll_interval == 3000ms);
    CHECK(settings.verify_tls);
    CHECK(!settings.remote_config);
    CHECK(!settings.folder_id);
}

TEST_CASE("ClientSettings::parse", "[settings]") {
    SECTION("Every key") {
        auto settings = ClientSettings::parse(R"({
            "server": "https://files.example.com/api/",
            "token": "abc",
            "project_id": 42,
            "folder_id": "7",
            "request_timeout": 45,
            "poll_initial_delay_ms": 500,
            "poll_interval_ms": 1500,
            "probe_cache_ttl": 60,
            "verify_tls": false,
            "remote_config": true
        })");
        REQUIRE(settings);
        CHECK(settings->base_url == "https://files.example.com/api/");
        CHECK(settings->auth_token == "abc");
        CHECK(settings->project_id == "42");
        CHECK(settings->folder_id == "7");
        CHECK(settings->request_timeout == 45s);
        CHECK(settings->poll_initial_delay == 500ms);
        CHECK(settings->poll_interval == 1500ms);
        CHECK(settings->probe_cache_ttl == 60s);
        CHECK(!settings->verify_tls);
        CHECK(settings->remote_config);

        auto dest = settings->destination();
        CHECK(dest.project_id == "42");
        CHECK(dest.folder_id == "7");
    }

    SECTION("Missing keys keep defaults") {
        auto settings = ClientSettings::parse(R"({"project_id": "9", "folder_id": null})");
        REQUIRE(settings);
        CHECK(settings->project_id == "9");
        CHECK(!settings->folder_id);
        CHECK(settings->base_url == std::string(DEFAULT_SERVER_URL));
    }

    SECTION("Rejected input") {
        CHECK(ClientSettings::parse("not json").error() == UploadErrc::invalid_argument);
        CHECK(ClientSettings::parse("[1, 2]").error() == UploadErrc::invalid_argument);
        CHECK(ClientSettings::parse(R"({"project_id": true})").error() == UploadErrc::invalid_argument);
        CHECK(ClientSettings::parse(R"({"request_timeout": "slow"})").error() == UploadErrc::invalid_argument);
        CHECK(ClientSettings::parse(R"({"request_timeout": 0})").error() == UploadErrc::invalid_argument);
        CHECK(ClientSettings::parse(R"({"poll_interval_ms": -5})").error() == UploadErrc::invalid_argument);
    }
}

TEST_CASE("ClientSettings save and load", "[settings]") {
    const auto dir = std::filesystem::temp_directory_path() /
                     ("surge-settings-" + std::to_string(::getpid()));
    const auto path = (dir / "nested" / "surge.json").string();

    ClientSettings settings;
    settings.base_url = "https://example.org/api/";
    settings.project_id = "5";
    settings.folder_id = "11";
    settings.poll_interval = 750ms;
    REQUIRE(!settings.save(path));

    auto loaded = ClientSettings::load(path);
    REQUIRE(loaded);
    CHECK(loaded->base_url == "https://example.org/api/");
    CHECK(loaded->project_id == "5");
    CHECK(loaded->folder_id == "11");
    CHECK(loaded->poll_interval == 750ms);

    CHECK(ClientSettings::load((dir / "missing.json").string()).error() ==
          surge::disk::DiskErrc::file_not_found);

    std::filesystem::remove_all(dir);
}

TEST_CASE("ClientSettings::apply_environment", "[settings]") {
    ::setenv("SURGE_SERVER", "https://env.example.com/api/", 1);
    ::setenv("SURGE_TOKEN", "", 1);

    ClientSettings settings;
    settings.auth_token = "from-file";
    settings.apply_environment();
    CHECK(settings.base_url == "https://env.example.com/api/");
    CHECK(settings.auth_token == "from-file");     // Empty values are ignored

    ::setenv("SURGE_TOKEN", "from-env", 1);
    settings.apply_environment();
    CHECK(settings.auth_token == "from-env");

    ::unsetenv("SURGE_SERVER");
    ::unsetenv("SURGE_TOKEN");
}
