// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/http_session.hpp>
#include <surge/version.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <string>

namespace surge::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct CurlHeaders {
    curl_slist* list = nullptr;

    CurlHeaders() = default;
    ~CurlHeaders() { if (list) curl_slist_free_all(list); }

    CurlHeaders(const CurlHeaders&) = delete;
    CurlHeaders& operator=(const CurlHeaders&) = delete;

    void append(const std::string& line) noexcept {
        if (auto* next = curl_slist_append(list, line.c_str())) {
            list = next;
        }
    }
};

struct CurlMime {
    curl_mime* ptr = nullptr;

    explicit CurlMime(CURL* curl) : ptr(curl_mime_init(curl)) {}
    ~CurlMime() { if (ptr) curl_mime_free(ptr); }

    CurlMime(const CurlMime&) = delete;
    CurlMime& operator=(const CurlMime&) = delete;
};

// Header callback, stores lower-cased header names
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);
    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    std::size_t total = size * nitems;
    body->append(ptr, total);
    return total;
}

// Aborts the transfer once a stop was requested
int progress_callback(void* userdata, curl_off_t dltotal, curl_off_t dlnow,
                      curl_off_t ultotal, curl_off_t ulnow) noexcept {
    (void)dltotal; (void)dlnow; (void)ultotal; (void)ulnow;
    auto* stop = static_cast<const std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

std::error_code map_curl_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:    return make_error_code(UploadErrc::timeout);
        case CURLE_COULDNT_CONNECT:       return make_error_code(UploadErrc::refused);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY: return make_error_code(UploadErrc::dns_error);
        case CURLE_ABORTED_BY_CALLBACK:   return make_error_code(UploadErrc::cancelled);
        case CURLE_URL_MALFORMAT:         return make_error_code(UploadErrc::invalid_url);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:    return make_error_code(UploadErrc::ssl_error);
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:          return make_error_code(UploadErrc::connection_lost);
        default:                          return make_error_code(UploadErrc::network_error);
    }
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

std::expected<HttpResponse, std::error_code>
HttpSession::perform(const HttpRequest& request, std::stop_token stop) noexcept {
    if (stop.stop_requested()) {
        return std::unexpected(make_error_code(UploadErrc::cancelled));
    }

    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return std::unexpected(make_error_code(UploadErrc::network_error));
        }

        HttpResponse response{};
        CurlHeaders headers;
        for (const auto& [name, value] : request.headers) {
            headers.append(name + ": " + value);
        }

        const std::string user_agent(surge::USER_AGENT);
        curl_easy_setopt(curl.ptr, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, user_agent.c_str());
        curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);

        // Timeouts: the whole call is bounded, not only the connect phase
        curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(connect_timeout_.count()));
        curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(request.timeout.count()));

        if (verify_tls_) {
            curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
            curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);
        } else {
            curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 0L);
        }

        if constexpr (FOLLOW_REDIRECTS) {
            curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
        }

        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &response.body);

        // Progress callback lets cancel() abort an in-flight transfer
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &stop);
        curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

        CurlMime mime(curl.ptr);
        switch (request.method) {
            case HttpMethod::head:
                curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
                break;
            case HttpMethod::get:
                curl_easy_setopt(curl.ptr, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::post:
                if (!request.form.empty()) {
                    for (const auto& part : request.form) {
                        curl_mimepart* mp = curl_mime_addpart(mime.ptr);
                        curl_mime_name(mp, part.name.c_str());
                        curl_mime_data(mp, part.value.data(), part.value.size());
                        if (!part.filename.empty()) {
                            curl_mime_filename(mp, part.filename.c_str());
                        }
                        if (!part.content_type.empty()) {
                            curl_mime_type(mp, part.content_type.c_str());
                        }
                    }
                    curl_easy_setopt(curl.ptr, CURLOPT_MIMEPOST, mime.ptr);
                } else {
                    curl_easy_setopt(curl.ptr, CURLOPT_POST, 1L);
                    curl_easy_setopt(curl.ptr, CURLOPT_POSTFIELDS, request.body.data());
                    curl_easy_setopt(curl.ptr, CURLOPT_POSTFIELDSIZE_LARGE,
                                     static_cast<curl_off_t>(request.body.size()));
                }
                break;
        }

        if (headers.list) {
            curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, headers.list);
        }

        auto start_time = std::chrono::steady_clock::now();
        CURLcode result = curl_easy_perform(curl.ptr);
        response.elapsed = std::chrono::steady_clock::now() - start_time;

        if (result != CURLE_OK) {
            spdlog::debug("HTTP {} failed: {}", request.url, curl_easy_strerror(result));
            return std::unexpected(map_curl_error(result));
        }

        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        response.status_code = static_cast<std::int32_t>(http_code);

        curl_off_t uploaded = 0;
        if (curl_easy_getinfo(curl.ptr, CURLINFO_SIZE_UPLOAD_T, &uploaded) == CURLE_OK && uploaded > 0) {
            response.bytes_sent = static_cast<std::uint64_t>(uploaded);
        }
        curl_off_t downloaded = 0;
        if (curl_easy_getinfo(curl.ptr, CURLINFO_SIZE_DOWNLOAD_T, &downloaded) == CURLE_OK && downloaded > 0) {
            response.bytes_received = static_cast<std::uint64_t>(downloaded);
        }

        char* ct = nullptr;
        if (curl_easy_getinfo(curl.ptr, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct) {
            response.content_type = ct;
        }

        return response;
    } catch (const std::exception& e) {
        spdlog::error("HTTP {} failed: {}", request.url, e.what());
        return std::unexpected(make_error_code(UploadErrc::network_error));
    }
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace surge::core
