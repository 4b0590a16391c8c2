// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace surge::core {

enum class UploadErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    not_found,
    server_error,
    rejected,
    permission_denied,
    invalid_url,
    invalid_response,
    invalid_state,
    invalid_argument,
    unknown_chunk_size,
    empty_file,
    probe_failed,
    cancelled,
    ssl_error,
    dns_error,
    connection_lost,
};

namespace detail {

struct UploadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "surge::upload";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<UploadErrc>(ev)) {
            case UploadErrc::success:            return "Success";
            case UploadErrc::network_error:      return "Network error";
            case UploadErrc::timeout:            return "Operation timed out";
            case UploadErrc::refused:            return "Connection refused";
            case UploadErrc::not_found:          return "Resource not found (404)";
            case UploadErrc::server_error:       return "Server error (5xx)";
            case UploadErrc::rejected:           return "Request rejected by server";
            case UploadErrc::permission_denied:  return "Permission denied";
            case UploadErrc::invalid_url:        return "Invalid URL";
            case UploadErrc::invalid_response:   return "Malformed server response";
            case UploadErrc::invalid_state:      return "Operation not allowed in current state";
            case UploadErrc::invalid_argument:   return "Invalid argument";
            case UploadErrc::unknown_chunk_size: return "Unknown chunk size option";
            case UploadErrc::empty_file:         return "File is empty";
            case UploadErrc::probe_failed:       return "Network probe failed";
            case UploadErrc::cancelled:          return "Upload cancelled";
            case UploadErrc::ssl_error:          return "SSL/TLS error";
            case UploadErrc::dns_error:          return "DNS resolution failed";
            case UploadErrc::connection_lost:    return "Connection lost";
            default:                             return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::UploadErrcCategory& upload_errc_category() noexcept {
    static detail::UploadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(UploadErrc e) noexcept {
    return {static_cast<int>(e), upload_errc_category()};
}

} // namespace surge::core

namespace std {

template<>
struct is_error_code_enum<surge::core::UploadErrc> : true_type {};

} // namespace std
