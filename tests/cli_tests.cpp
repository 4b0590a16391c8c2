// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/cli/commands.hpp>
#include <surge/cli/progress_bar.hpp>
#include <string>
#include <vector>

using namespace surge::cli;
using namespace surge::core;

namespace {

CliArgs parse(std::vector<std::string> words) {
    words.insert(words.begin(), "surge-upload");
    std::vector<char*> argv;
    for (auto& w : words) argv.push_back(w.data());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("parse_args", "[cli]") {
    SECTION("Files and options") {
        auto args = parse({"-p", "42", "--folder", "7", "-k", "small", "-n", "4",
                           "--network", "weak", "a.mp4", "b.pdf", "--plan", "-V"});
        CHECK(args.error.empty());
        CHECK(args.files == std::vector<std::string>{"a.mp4", "b.pdf"});
        CHECK(args.project == "42");
        CHECK(args.folder == "7");
        CHECK(args.chunk_size == ChunkSizeName::small);
        CHECK(args.concurrency == 4);
        CHECK(args.network == NetworkClass::weak);
        CHECK(args.plan_only);
        CHECK(args.verbose);
    }

    SECTION("Help and version stop parsing") {
        CHECK(parse({"--help", "--bogus"}).help);
        CHECK(parse({"-v"}).version);
    }

    SECTION("Errors") {
        CHECK(parse({"--bogus"}).error == "Unknown option: --bogus");
        CHECK(parse({"--server"}).error == "Missing value for --server");
        CHECK(parse({"-k", "huge"}).error == "Unknown chunk size: huge");
        CHECK(parse({"-n", "0"}).error == "Invalid concurrency: 0");
        CHECK(parse({"-n", "65"}).error == "Invalid concurrency: 65");
        CHECK(parse({"-n", "3x"}).error == "Invalid concurrency: 3x");
        CHECK(parse({"--network", "fast"}).error == "Unknown network class: fast");
    }

    SECTION("A lone dash is a file") {
        auto args = parse({"-"});
        CHECK(args.error.empty());
        CHECK(args.files == std::vector<std::string>{"-"});
    }
}

TEST_CASE("resolve_settings prefers flags", "[cli]") {
    auto args = parse({"-s", "https://cli.example.com/api/", "-t", "tok", "-p", "3", "-f", "9"});
    auto settings = resolve_settings(args);
    REQUIRE(settings);
    CHECK(settings->base_url == "https://cli.example.com/api/");
    CHECK(settings->auth_token == "tok");
    CHECK(settings->project_id == "3");
    CHECK(settings->folder_id == "9");

    auto missing = resolve_settings(parse({"-c", "/nonexistent/surge.json"}));
    CHECK(!missing);
}

TEST_CASE("ProgressBar formatting", "[cli]") {
    CHECK(ProgressBar::format_bytes(512) == "512 B");
    CHECK(ProgressBar::format_bytes(2048) == "2 KB");
    CHECK(ProgressBar::format_bytes(10 * MIB) == "10.0 MB");
    CHECK(ProgressBar::format_bytes(3ull * 1024 * MIB) == "3.00 GB");

    CHECK(ProgressBar::format_speed(100) == "100 B/s");
    CHECK(ProgressBar::format_speed(5 * MIB / 2) == "2.5 MB/s");

    CHECK(ProgressBar::format_time(42) == "42s");
    CHECK(ProgressBar::format_time(125) == "2m 5s");
    CHECK(ProgressBar::format_time(3725) == "1h 02m 05s");

    CHECK(ProgressBar::render_bar(0, 10) == "[>         ]");
    CHECK(ProgressBar::render_bar(50, 10) == "[=====>    ]");
    CHECK(ProgressBar::render_bar(100, 10) == "[==========]");
    CHECK(ProgressBar::render_bar(150, 4) == "[====]");
}
