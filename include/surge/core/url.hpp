// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <expected>

namespace surge::core {

// Parsed server URL. The API client keeps one of these as its base and
// resolves every endpoint path against it.
class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://host[:port]
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }
    [[nodiscard]] std::uint16_t default_port() const noexcept;

    // Append a relative endpoint ("upload/chunk/") to this URL's path.
    // Query and fragment of the base are dropped.
    [[nodiscard]] Url resolve(std::string_view relative) const;

    // Copy with key=value appended to the query string (value percent-encoded)
    [[nodiscard]] Url with_query(std::string_view key, std::string_view value) const;

    [[nodiscard]] static std::string encode_component(std::string_view value);

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
};

} // namespace surge::core
