// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <surge/core/config.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>
#include <map>
#include <vector>
#include <chrono>
#include <utility>
#include <stop_token>

namespace surge::core {

enum class HttpMethod : std::uint8_t {
    get,
    head,
    post
};

// One part of a multipart/form-data body. A part with a filename is sent
// as a file part and `value` holds its raw bytes.
struct FormPart {
    std::string name;
    std::string value;
    std::string filename;
    std::string content_type;
};

struct HttpRequest {
    HttpMethod method{HttpMethod::get};
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;                 // Raw body, sent when form is empty
    std::vector<FormPart> form;       // multipart/form-data when non-empty
    std::chrono::seconds timeout{REQUEST_TIMEOUT_SEC};
};

struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;  // Lower-case names
    std::string body;
    std::string content_type;
    std::uint64_t bytes_sent{0};
    std::uint64_t bytes_received{0};
    std::chrono::nanoseconds elapsed{0};

    [[nodiscard]] bool ok() const noexcept { return status_code >= 200 && status_code < 300; }
};

// Request/response seam. Returns an error only when no HTTP response was
// received (connect failure, timeout, abort); HTTP error statuses come back
// as a normal response so callers can read the server's message.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    perform(const HttpRequest& request, std::stop_token stop = {}) noexcept = 0;
};

// libcurl implementation. Each call uses its own easy handle so concurrent
// chunk workers can share one session.
class HttpSession final : public HttpTransport {
public:
    HttpSession() = default;
    explicit HttpSession(bool verify_tls) noexcept : verify_tls_(verify_tls) {}

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    perform(const HttpRequest& request, std::stop_token stop = {}) noexcept override;

    void connect_timeout(std::chrono::seconds timeout) noexcept { connect_timeout_ = timeout; }
    [[nodiscard]] std::chrono::seconds connect_timeout() const noexcept { return connect_timeout_; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    bool verify_tls_{true};
    std::chrono::seconds connect_timeout_{CONNECTION_TIMEOUT_SEC};
};

} // namespace surge::core
