// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <surge/core/http_session.hpp>
#include <surge/core/upload_types.hpp>
#include <surge/core/url.hpp>
#include <cstdint>
#include <chrono>
#include <expected>
#include <map>
#include <string>
#include <vector>
#include <stop_token>

namespace surge::core {

// Failure of one API call. `detail` carries the server's own message when
// the response had one; `http_status` is 0 when no response arrived.
struct ApiError {
    std::error_code code;
    std::string detail;
    std::int32_t http_status{0};

    [[nodiscard]] std::string message() const { return detail.empty() ? code.message() : detail; }
    [[nodiscard]] bool is_rejection() const noexcept { return http_status != 0; }
};

template<typename T>
using ApiResult = std::expected<T, ApiError>;

// A timed round trip used by the network probe
struct ProbeSample {
    std::uint64_t bytes{0};
    std::chrono::nanoseconds elapsed{0};
};

struct ChunkRequest {
    std::string filename;
    std::string media_type;
    std::uint64_t chunk_number{0};
    std::uint64_t total_chunks{0};
    std::uint64_t total_size{0};
    ChunkSizeName chunk_size_name{ChunkSizeName::medium};
    Destination destination;
    std::string data;
    std::chrono::seconds timeout{REQUEST_TIMEOUT_SEC};
};

struct ChunkReceipt {
    std::string status;    // "success", or "complete" for the last chunk
    std::string message;
};

struct FinalizeRequest {
    std::string filename;
    Destination destination;
    std::chrono::seconds timeout{REQUEST_TIMEOUT_SEC};
};

struct FinalizeResult {
    std::string file_id;
    bool is_video{false};
    std::string processing_status;
    std::string message;

    // Authoritative: only the server decides whether transcoding follows
    [[nodiscard]] bool requires_processing() const noexcept {
        return is_video && processing_status == "processing";
    }
};

struct ProcessingState {
    bool processing{true};
    std::string message;
};

struct ChunkCatalog {
    std::vector<ChunkSizeOption> options;   // Ordered by size
    std::string default_option;
    std::map<std::string, std::string> recommendations;
};

// Boundary calls to the storage backend
class UploadApi {
public:
    virtual ~UploadApi() = default;

    [[nodiscard]] virtual ApiResult<ProbeSample> probe_download() noexcept = 0;
    [[nodiscard]] virtual ApiResult<ProbeSample> probe_upload(std::size_t payload_size) noexcept = 0;
    [[nodiscard]] virtual ApiResult<ProbeSample> probe_latency() noexcept = 0;

    [[nodiscard]] virtual ApiResult<ChunkReceipt>
    upload_chunk(const ChunkRequest& request, std::stop_token stop) noexcept = 0;

    [[nodiscard]] virtual ApiResult<FinalizeResult>
    finalize(const FinalizeRequest& request) noexcept = 0;

    [[nodiscard]] virtual ApiResult<ProcessingState>
    processing_status(const std::string& file_id, std::stop_token stop) noexcept = 0;

    [[nodiscard]] virtual ApiResult<ChunkCatalog> chunk_catalog() noexcept = 0;

    [[nodiscard]] virtual ApiResult<UploadConfig>
    upload_config(std::uint64_t file_size, NetworkClass network) noexcept = 0;
};

// UploadApi over HTTP + JSON
class RemoteUploadApi final : public UploadApi {
public:
    RemoteUploadApi(HttpTransport& transport, Url base_url, std::string auth_token);

    [[nodiscard]] ApiResult<ProbeSample> probe_download() noexcept override;
    [[nodiscard]] ApiResult<ProbeSample> probe_upload(std::size_t payload_size) noexcept override;
    [[nodiscard]] ApiResult<ProbeSample> probe_latency() noexcept override;

    [[nodiscard]] ApiResult<ChunkReceipt>
    upload_chunk(const ChunkRequest& request, std::stop_token stop) noexcept override;

    [[nodiscard]] ApiResult<FinalizeResult>
    finalize(const FinalizeRequest& request) noexcept override;

    [[nodiscard]] ApiResult<ProcessingState>
    processing_status(const std::string& file_id, std::stop_token stop) noexcept override;

    [[nodiscard]] ApiResult<ChunkCatalog> chunk_catalog() noexcept override;

    [[nodiscard]] ApiResult<UploadConfig>
    upload_config(std::uint64_t file_size, NetworkClass network) noexcept override;

    [[nodiscard]] const Url& base_url() const noexcept { return base_url_; }

    // Pull a human readable message out of an error body ("detail",
    // "message" or "error"); empty when there is none
    [[nodiscard]] static std::string extract_message(std::string_view body) noexcept;

private:
    [[nodiscard]] HttpRequest make_request(HttpMethod method, const Url& url,
                                           std::chrono::seconds timeout) const;

    [[nodiscard]] ApiResult<HttpResponse> send(const HttpRequest& request,
                                               std::stop_token stop = {}) noexcept;

    [[nodiscard]] ApiResult<ProbeSample> timed(HttpRequest request) noexcept;

    HttpTransport& transport_;
    Url base_url_;
    std::string auth_token_;
};

} // namespace surge::core
