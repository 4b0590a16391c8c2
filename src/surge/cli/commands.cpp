// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/cli/commands.hpp>
#include <surge/cli/progress_bar.hpp>
#include <surge/core/batch_coordinator.hpp>
#include <surge/core/chunk_planner.hpp>
#include <surge/core/http_session.hpp>
#include <surge/core/network_probe.hpp>
#include <surge/core/upload_api.hpp>
#include <surge/core/url.hpp>
#include <surge/version.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>

using namespace surge::core;

namespace surge::cli {

namespace {

// curl_global_init/cleanup for the lifetime of a command
struct CurlGlobal {
    CurlGlobal() noexcept { HttpSession::global_init(); }
    ~CurlGlobal() { HttpSession::global_cleanup(); }
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

bool take_value(int argc, char* argv[], int& i, std::string& out, CliArgs& args) {
    if (i + 1 >= argc) {
        args.error = std::string("Missing value for ") + argv[i];
        return false;
    }
    out = argv[++i];
    return true;
}

std::string describe(const UploadConfig& config) {
    std::ostringstream ss;
    ss << to_string(config.chunk_size_name) << " chunks ("
       << ProgressBar::format_bytes(config.chunk_size_bytes) << ") x" << config.total_chunks
       << ", " << config.concurrent_chunks << " concurrent, ~"
       << std::fixed << std::setprecision(1) << config.estimated_upload_time_minutes << " min, resumability "
       << (config.resumability.excellent ? "excellent" : config.resumability.good ? "good" : "limited");
    return ss.str();
}

std::unique_ptr<NetworkProbe> make_probe(const CliArgs& args, UploadApi& api,
                                         const ClientSettings& settings) {
    if (args.network) {
        return std::make_unique<StaticNetworkProbe>(*args.network);
    }
    return std::make_unique<HttpNetworkProbe>(
        api, std::chrono::duration_cast<std::chrono::milliseconds>(settings.probe_cache_ttl));
}

std::vector<FileSource> collect_files(const std::vector<std::string>& paths, int& exit_code) {
    std::vector<FileSource> sources;
    for (const auto& path : paths) {
        auto source = FileSource::from_path(path);
        if (!source) {
            std::cerr << "Error: " << path << ": " << source.error().message() << std::endl;
            exit_code = 1;
            continue;
        }
        sources.push_back(std::move(*source));
    }
    return sources;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                args.help = true;
                return args;
            }
            if (arg == "-v" || arg == "--version") {
                args.version = true;
                return args;
            }

            if (arg == "-V" || arg == "--verbose") {
                args.verbose = true;
            } else if (arg == "-q" || arg == "--quiet") {
                args.quiet = true;
            } else if (arg == "--plan") {
                args.plan_only = true;
            } else if (arg == "-c" || arg == "--config") {
                if (!take_value(argc, argv, i, args.config_path, args)) return args;
            } else if (arg == "-s" || arg == "--server") {
                if (!take_value(argc, argv, i, args.server, args)) return args;
            } else if (arg == "-t" || arg == "--token") {
                if (!take_value(argc, argv, i, args.token, args)) return args;
            } else if (arg == "-p" || arg == "--project") {
                if (!take_value(argc, argv, i, args.project, args)) return args;
            } else if (arg == "-f" || arg == "--folder") {
                if (!take_value(argc, argv, i, args.folder, args)) return args;
            } else if (arg == "-k" || arg == "--chunk-size") {
                std::string value;
                if (!take_value(argc, argv, i, value, args)) return args;
                auto name = parse_chunk_size_name(value);
                if (!name) {
                    args.error = "Unknown chunk size: " + value;
                    return args;
                }
                args.chunk_size = *name;
            } else if (arg == "-n" || arg == "--concurrency") {
                std::string value;
                if (!take_value(argc, argv, i, value, args)) return args;
                char* end = nullptr;
                const auto n = std::strtoul(value.c_str(), &end, 10);
                if (end == value.c_str() || *end != '\0' || n == 0 || n > 64) {
                    args.error = "Invalid concurrency: " + value;
                    return args;
                }
                args.concurrency = static_cast<std::uint32_t>(n);
            } else if (arg == "--network") {
                std::string value;
                if (!take_value(argc, argv, i, value, args)) return args;
                auto network = parse_network_class(value);
                if (!network) {
                    args.error = "Unknown network class: " + value;
                    return args;
                }
                args.network = *network;
            } else if (arg.starts_with("-") && arg.size() > 1) {
                args.error = "Unknown option: " + arg;
                return args;
            } else {
                args.files.push_back(std::move(arg));
            }
        }
    } catch (const std::exception& e) {
        args.error = e.what();
    }

    return args;
}

std::expected<ClientSettings, std::error_code> resolve_settings(const CliArgs& args) noexcept {
    ClientSettings settings;
    if (!args.config_path.empty()) {
        auto loaded = ClientSettings::load(args.config_path);
        if (!loaded) {
            std::cerr << "Error: Cannot load " << args.config_path << ": "
                      << loaded.error().message() << std::endl;
            return std::unexpected(loaded.error());
        }
        settings = std::move(*loaded);
    }

    settings.apply_environment();

    try {
        if (!args.server.empty()) settings.base_url = args.server;
        if (!args.token.empty()) settings.auth_token = args.token;
        if (!args.project.empty()) settings.project_id = args.project;
        if (!args.folder.empty()) settings.folder_id = args.folder;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }

    return settings;
}

//=============================================================================
// Commands
//=============================================================================

CliResult plan(const CliArgs& args, const ClientSettings& settings) noexcept {
    try {
        CurlGlobal curl;

        auto base = Url::parse(settings.base_url);
        if (!base) {
            std::cerr << "Error: Invalid server URL: " << settings.base_url << std::endl;
            return std::unexpected(base.error());
        }

        HttpSession http(settings.verify_tls);
        RemoteUploadApi api(http, std::move(*base), settings.auth_token);
        ChunkPlanner planner;
        if (!args.network) {
            (void)planner.load_catalog(api);
        }

        int exit_code = 0;
        auto sources = collect_files(args.files, exit_code);
        if (sources.empty()) {
            return 1;
        }

        auto probe = make_probe(args, api, settings);
        const auto condition = probe->measure();
        std::cout << format_condition(condition)
                  << (condition.measured ? "" : " [default, probe unavailable]") << std::endl;

        for (const auto& source : sources) {
            auto config = settings.remote_config
                ? planner.plan_remote(api, source.size_bytes, condition)
                : planner.plan(source.size_bytes, condition);
            if (args.chunk_size) {
                if (auto overridden = planner.override_chunk_size(config, *args.chunk_size)) {
                    config = *overridden;
                }
            }
            if (args.concurrency > 0) {
                config = planner.override_concurrency(config, args.concurrency);
            }

            std::cout << source.name << " (" << ProgressBar::format_bytes(source.size_bytes) << "): "
                      << describe(config) << std::endl;
        }

        if (args.verbose) {
            std::cout << "\nChunk sizes:\n";
            for (const auto& option : planner.list_chunk_options()) {
                std::cout << "  " << std::left << std::setw(7) << to_string(option.name)
                          << option.description << '\n';
            }
        }
        return exit_code;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(UploadErrc::invalid_state));
    }
}

CliResult upload(const CliArgs& args, const ClientSettings& settings) noexcept {
    try {
        CurlGlobal curl;

        if (settings.project_id.empty()) {
            std::cerr << "Error: No project specified (use -p or \"project_id\" in the config file)" << std::endl;
            return std::unexpected(make_error_code(UploadErrc::invalid_argument));
        }

        auto base = Url::parse(settings.base_url);
        if (!base) {
            std::cerr << "Error: Invalid server URL: " << settings.base_url << std::endl;
            return std::unexpected(base.error());
        }

        spdlog::debug("Uploading {} file(s) to {} (project {})", args.files.size(),
                      base->full(), settings.project_id);

        HttpSession http(settings.verify_tls);
        RemoteUploadApi api(http, std::move(*base), settings.auth_token);

        ChunkPlanner planner;
        if (!args.network) {
            (void)planner.load_catalog(api);
        }
        auto probe = make_probe(args, api, settings);

        int exit_code = 0;
        auto sources = collect_files(args.files, exit_code);
        if (sources.empty()) {
            return 1;
        }

        BatchOptions options;
        options.poll.initial_delay = settings.poll_initial_delay;
        options.poll.interval = settings.poll_interval;
        options.remote_config = settings.remote_config;

        BatchCoordinator batch(api, *probe, planner, settings.destination(), options);
        (void)batch.add_files(std::move(sources));

        if (args.chunk_size) {
            if (auto ec = batch.select_chunk_size(*args.chunk_size)) {
                std::cerr << "Error: " << ec.message() << std::endl;
                return std::unexpected(ec);
            }
        }
        if (args.concurrency > 0) {
            batch.select_concurrency(args.concurrency);
        }

        if (!args.quiet) {
            if (auto network = batch.network()) {
                std::cout << format_condition(*network) << std::endl;
            }
            if (auto config = batch.current_config()) {
                std::cout << "Plan: " << describe(*config) << std::endl;
            }
        }

        // Observer runs on this thread: start() drives the sessions here
        std::map<std::uint64_t, std::unique_ptr<ProgressBar>> bars;
        batch.observer([&](const UploadTask& task) {
            if (args.quiet) {
                if (task.status == TaskStatus::error) {
                    std::cerr << task.file.name << ": " << task.error << std::endl;
                }
                return;
            }

            auto& bar = bars[task.id];
            if (!bar) {
                bar = std::make_unique<ProgressBar>(task.file.size_bytes, task.file.name);
            }
            switch (task.status) {
                case TaskStatus::uploading:
                    bar->update(task.progress);
                    break;
                case TaskStatus::processing:
                case TaskStatus::completed:
                    bar->update(task.progress);
                    bar->finish(status_text(task));
                    break;
                case TaskStatus::error:
                    bar->finish(std::string(status_text(task)) + ": " + task.error);
                    break;
                case TaskStatus::pending:
                    break;
            }
        });

        (void)batch.start();

        // Wait for server-side conversion
        if (batch.has_processing()) {
            Spinner spinner("Converting to H.264...");
            while (batch.has_processing() && batch.tracker().active_jobs() > 0) {
                (void)batch.pump_events(std::chrono::milliseconds{250});
                if (!args.quiet) spinner.update();
            }
            (void)batch.pump_events();
            if (!args.quiet) {
                spinner.finish(batch.has_processing() ? "status unknown" : "done");
            }
        }

        for (const auto& task : batch.tasks()) {
            if (task.status != TaskStatus::completed && task.status != TaskStatus::processing) {
                exit_code = 1;
            }
        }
        return exit_code;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(UploadErrc::invalid_state));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Surge Upload " << program_name << " - Adaptive chunked uploader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <FILE>...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help                Show this help message\n";
    std::cout << "  -v, --version             Show version information\n";
    std::cout << "  -V, --verbose             Enable debug logging\n";
    std::cout << "  -q, --quiet               Quiet mode (no progress bar)\n";
    std::cout << "  -c, --config <FILE>       Read settings from a JSON file\n";
    std::cout << "  -s, --server <URL>        API base URL (default: " << DEFAULT_SERVER_URL << ")\n";
    std::cout << "  -t, --token <TOKEN>       Bearer token\n";
    std::cout << "  -p, --project <ID>        Destination project\n";
    std::cout << "  -f, --folder <ID>         Destination folder\n";
    std::cout << "  -k, --chunk-size <NAME>   small, medium, large or xlarge\n";
    std::cout << "  -n, --concurrency <N>     Chunks in flight per file\n";
    std::cout << "      --network <CLASS>     weak, medium, strong or excellent (skip probing)\n";
    std::cout << "      --plan                Show the upload plan and exit\n";
    std::cout << "\n";
    std::cout << "ENVIRONMENT:\n";
    std::cout << "  SURGE_SERVER, SURGE_TOKEN override the config file\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " -p 42 holiday.mp4\n";
    std::cout << "  " << program_name << " -p 42 -f 7 -k large *.zip\n";
    std::cout << "  " << program_name << " --plan --network weak backup.tar\n";
}

void print_version() noexcept {
    std::cout << "Surge Upload " << surge::version.to_string() << std::endl;
    std::cout << "\n";
    std::cout << "Built with C++23, libcurl, nlohmann/json, spdlog\n";
}

} // namespace surge::cli
