// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/upload_api.hpp>
#include <surge/core/config.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <string>

namespace surge::core {

namespace {

using nlohmann::json;

std::error_code status_to_error(std::int32_t status) noexcept {
    if (status == 404) return make_error_code(UploadErrc::not_found);
    if (status == 401 || status == 403) return make_error_code(UploadErrc::permission_denied);
    if (status >= 500) return make_error_code(UploadErrc::server_error);
    return make_error_code(UploadErrc::rejected);
}

ApiError transport_error(std::error_code ec) {
    return ApiError{ec, {}, 0};
}

ApiError malformed(std::string detail = {}) {
    return ApiError{make_error_code(UploadErrc::invalid_response), std::move(detail), 0};
}

// Accepts "abc" and 42 alike
std::string id_to_string(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<std::int64_t>());
    if (value.is_number_unsigned()) return std::to_string(value.get<std::uint64_t>());
    return {};
}

std::vector<std::string> string_list(const json& j, const char* key) {
    std::vector<std::string> out;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& item : j[key]) {
            if (item.is_string()) out.push_back(item.get<std::string>());
        }
    }
    return out;
}

void add_destination(std::vector<FormPart>& form, const Destination& destination) {
    form.push_back({"project_id", destination.project_id, {}, {}});
    if (destination.folder_id) {
        form.push_back({"folder_id", *destination.folder_id, {}, {}});
    }
}

} // namespace

//=============================================================================
// RemoteUploadApi
//=============================================================================

RemoteUploadApi::RemoteUploadApi(HttpTransport& transport, Url base_url, std::string auth_token)
    : transport_(transport)
    , base_url_(std::move(base_url))
    , auth_token_(std::move(auth_token)) {}

HttpRequest RemoteUploadApi::make_request(HttpMethod method, const Url& url,
                                          std::chrono::seconds timeout) const {
    HttpRequest request;
    request.method = method;
    request.url = url.full();
    request.timeout = timeout;
    if (!auth_token_.empty()) {
        request.headers.emplace_back("Authorization", "Bearer " + auth_token_);
    }
    return request;
}

ApiResult<HttpResponse> RemoteUploadApi::send(const HttpRequest& request,
                                              std::stop_token stop) noexcept {
    auto response = transport_.perform(request, std::move(stop));
    if (!response) {
        return std::unexpected(transport_error(response.error()));
    }

    if (!response->ok()) {
        ApiError error{status_to_error(response->status_code),
                       extract_message(response->body),
                       response->status_code};
        spdlog::debug("{} -> HTTP {} {}", request.url, response->status_code, error.detail);
        return std::unexpected(std::move(error));
    }

    return std::move(*response);
}

ApiResult<ProbeSample> RemoteUploadApi::timed(HttpRequest request) noexcept {
    auto response = send(request);
    if (!response) {
        return std::unexpected(response.error());
    }

    ProbeSample sample;
    sample.elapsed = response->elapsed;
    switch (request.method) {
        case HttpMethod::post:
            sample.bytes = response->bytes_sent;
            if (sample.bytes == 0) {
                for (const auto& part : request.form) sample.bytes += part.value.size();
            }
            break;
        case HttpMethod::get:
            sample.bytes = response->bytes_received > 0 ? response->bytes_received
                                                        : response->body.size();
            break;
        case HttpMethod::head:
            break;
    }
    return sample;
}

ApiResult<ProbeSample> RemoteUploadApi::probe_download() noexcept {
    try {
        return timed(make_request(HttpMethod::get, base_url_.resolve("network/test"),
                                  std::chrono::seconds{PROBE_TIMEOUT_SEC}));
    } catch (const std::exception& e) {
        return std::unexpected(ApiError{make_error_code(UploadErrc::probe_failed), e.what(), 0});
    }
}

ApiResult<ProbeSample> RemoteUploadApi::probe_upload(std::size_t payload_size) noexcept {
    try {
        auto request = make_request(HttpMethod::post, base_url_.resolve("network/test"),
                                    std::chrono::seconds{PROBE_TIMEOUT_SEC});
        request.form.push_back({"test", std::string(payload_size, '0'), "probe.bin",
                                "application/octet-stream"});
        return timed(std::move(request));
    } catch (const std::exception& e) {
        return std::unexpected(ApiError{make_error_code(UploadErrc::probe_failed), e.what(), 0});
    }
}

ApiResult<ProbeSample> RemoteUploadApi::probe_latency() noexcept {
    try {
        return timed(make_request(HttpMethod::head, base_url_.resolve("network/test"),
                                  std::chrono::seconds{PROBE_TIMEOUT_SEC}));
    } catch (const std::exception& e) {
        return std::unexpected(ApiError{make_error_code(UploadErrc::probe_failed), e.what(), 0});
    }
}

ApiResult<ChunkReceipt>
RemoteUploadApi::upload_chunk(const ChunkRequest& chunk, std::stop_token stop) noexcept {
    try {
        auto request = make_request(HttpMethod::post, base_url_.resolve("upload/chunk/"), chunk.timeout);

        auto& form = request.form;
        form.push_back({"file", chunk.data, chunk.filename,
                        chunk.media_type.empty() ? "application/octet-stream" : chunk.media_type});
        form.push_back({"filename", chunk.filename, {}, {}});
        form.push_back({"chunk_number", std::to_string(chunk.chunk_number), {}, {}});
        form.push_back({"total_chunks", std::to_string(chunk.total_chunks), {}, {}});
        form.push_back({"total_size", std::to_string(chunk.total_size), {}, {}});
        add_destination(form, chunk.destination);
        form.push_back({"chunk_size_name", std::string(to_string(chunk.chunk_size_name)), {}, {}});

        auto response = send(request, std::move(stop));
        if (!response) {
            return std::unexpected(response.error());
        }

        ChunkReceipt receipt;
        auto body = json::parse(response->body, nullptr, false);
        if (body.is_object()) {
            receipt.status = body.value("status", std::string{"success"});
            receipt.message = body.value("message", std::string{});
        } else {
            receipt.status = "success";
        }
        return receipt;
    } catch (const std::exception& e) {
        return std::unexpected(malformed(e.what()));
    }
}

ApiResult<FinalizeResult> RemoteUploadApi::finalize(const FinalizeRequest& finalize) noexcept {
    try {
        auto request = make_request(HttpMethod::post, base_url_.resolve("upload/complete/"), finalize.timeout);
        request.headers.emplace_back("Content-Type", "application/json");

        json payload = {
            {"filename", finalize.filename},
            {"project_id", finalize.destination.project_id},
        };
        if (finalize.destination.folder_id) {
            payload["folder_id"] = *finalize.destination.folder_id;
        }
        request.body = payload.dump();

        auto response = send(request);
        if (!response) {
            return std::unexpected(response.error());
        }

        auto body = json::parse(response->body, nullptr, false);
        if (!body.is_object()) {
            return std::unexpected(malformed("Failed to complete upload"));
        }

        // The backend answers 200 {"error": ...} when chunks are missing
        if (!body.contains("id") && body.contains("error")) {
            return std::unexpected(ApiError{make_error_code(UploadErrc::rejected),
                                            extract_message(response->body),
                                            response->status_code});
        }

        FinalizeResult result;
        if (body.contains("id")) {
            result.file_id = id_to_string(body["id"]);
        }
        result.is_video = body.value("is_video", false);
        if (body.contains("processing_status") && body["processing_status"].is_string()) {
            result.processing_status = body["processing_status"].get<std::string>();
        }
        if (body.contains("message") && body["message"].is_string()) {
            result.message = body["message"].get<std::string>();
        }

        if (result.requires_processing() && result.file_id.empty()) {
            return std::unexpected(malformed("Finalize response has no file id"));
        }
        return result;
    } catch (const std::exception& e) {
        return std::unexpected(malformed(e.what()));
    }
}

ApiResult<ProcessingState> RemoteUploadApi::processing_status(const std::string& file_id,
                                                              std::stop_token stop) noexcept {
    try {
        auto url = base_url_.resolve("video/processing-status/" + Url::encode_component(file_id));
        auto response = send(make_request(HttpMethod::get, url, std::chrono::seconds{POLL_TIMEOUT_SEC}),
                             std::move(stop));
        if (!response) {
            return std::unexpected(response.error());
        }

        auto body = json::parse(response->body, nullptr, false);
        if (!body.is_object() || !body.contains("processing") || !body["processing"].is_boolean()) {
            return std::unexpected(malformed("Processing status response has no 'processing' flag"));
        }

        ProcessingState state;
        state.processing = body["processing"].get<bool>();
        if (body.contains("message") && body["message"].is_string()) {
            state.message = body["message"].get<std::string>();
        }
        return state;
    } catch (const std::exception& e) {
        return std::unexpected(malformed(e.what()));
    }
}

ApiResult<ChunkCatalog> RemoteUploadApi::chunk_catalog() noexcept {
    try {
        auto response = send(make_request(HttpMethod::get, base_url_.resolve("upload/chunk-sizes"),
                                          std::chrono::seconds{REQUEST_TIMEOUT_SEC}));
        if (!response) {
            return std::unexpected(response.error());
        }

        auto body = json::parse(response->body, nullptr, false);
        if (!body.is_object() || !body.contains("options") || !body["options"].is_object()) {
            return std::unexpected(malformed("Chunk size catalog has no options"));
        }

        ChunkCatalog catalog;
        for (const auto& [key, value] : body["options"].items()) {
            auto name = parse_chunk_size_name(key);
            if (!name || !value.is_object()) {
                spdlog::debug("Skipping unknown chunk size option '{}'", key);
                continue;
            }

            ChunkSizeOption option;
            option.name = *name;
            option.size_bytes = value.value("sizeBytes", std::uint64_t{0});
            if (option.size_bytes == 0) {
                continue;
            }
            option.size_mb = value.value("sizeMB",
                static_cast<double>(option.size_bytes) / static_cast<double>(MIB));
            option.description = value.value("description", std::string{});
            option.pros = string_list(value, "pros");
            option.cons = string_list(value, "cons");
            catalog.options.push_back(std::move(option));
        }

        std::sort(catalog.options.begin(), catalog.options.end(),
                  [](const ChunkSizeOption& a, const ChunkSizeOption& b) {
                      return a.size_bytes < b.size_bytes;
                  });

        catalog.default_option = body.value("default", std::string{});
        if (body.contains("recommendations") && body["recommendations"].is_object()) {
            for (const auto& [scenario, option] : body["recommendations"].items()) {
                if (option.is_string()) {
                    catalog.recommendations[scenario] = option.get<std::string>();
                }
            }
        }
        return catalog;
    } catch (const std::exception& e) {
        return std::unexpected(malformed(e.what()));
    }
}

ApiResult<UploadConfig>
RemoteUploadApi::upload_config(std::uint64_t file_size, NetworkClass network) noexcept {
    try {
        auto url = base_url_.resolve("upload/config")
                       .with_query("file_size", std::to_string(file_size))
                       .with_query("network_condition", to_string(network));
        auto response = send(make_request(HttpMethod::get, url, std::chrono::seconds{REQUEST_TIMEOUT_SEC}));
        if (!response) {
            return std::unexpected(response.error());
        }

        auto body = json::parse(response->body, nullptr, false);
        if (!body.is_object()) {
            return std::unexpected(malformed("Upload config is not an object"));
        }

        auto name = parse_chunk_size_name(body.value("chunkSizeName", std::string{}));
        if (!name) {
            return std::unexpected(malformed("Upload config has an unknown chunk size"));
        }

        UploadConfig config;
        config.chunk_size_name = *name;
        config.chunk_size_bytes = body.value("chunkSizeBytes", std::uint64_t{0});
        config.concurrent_chunks = body.value("concurrentChunks", std::uint32_t{DEFAULT_CONCURRENT_CHUNKS});
        config.timeout_seconds = body.value("timeoutSeconds", std::uint32_t{REQUEST_TIMEOUT_SEC});
        config.total_chunks = body.value("totalChunks", std::uint64_t{0});
        config.file_size_bytes = file_size;
        config.network = network;
        config.estimated_upload_time_minutes = body.value("estimatedUploadTimeMinutes", 0.0);
        if (body.contains("resumability") && body["resumability"].is_object()) {
            const auto& r = body["resumability"];
            config.resumability.excellent = r.value("excellent", false);
            config.resumability.good = r.value("good", false);
            config.resumability.limited = r.value("limited", false);
        }

        if (config.chunk_size_bytes == 0) {
            return std::unexpected(malformed("Upload config has no chunk size"));
        }
        return config;
    } catch (const std::exception& e) {
        return std::unexpected(malformed(e.what()));
    }
}

std::string RemoteUploadApi::extract_message(std::string_view body) noexcept {
    try {
        auto j = json::parse(body, nullptr, false);
        if (!j.is_object()) {
            return {};
        }
        for (const char* key : {"detail", "message", "error"}) {
            if (j.contains(key) && j[key].is_string()) {
                return j[key].get<std::string>();
            }
        }
        return {};
    } catch (const std::exception&) {
        return {};
    }
}

} // namespace surge::core
