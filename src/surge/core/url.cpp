// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace surge::core {

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        Url url;

        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return std::unexpected(make_error_code(UploadErrc::invalid_url));
        }

        url.scheme_.reserve(scheme_end);
        for (std::size_t i = 0; i < scheme_end; ++i) {
            url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
        }
        if (url.scheme_ != "http" && url.scheme_ != "https") {
            return std::unexpected(make_error_code(UploadErrc::invalid_url));
        }

        auto rest_start = scheme_end + 3;

        auto path_start = url_str.find('/', rest_start);
        if (path_start == std::string_view::npos) path_start = url_str.length();
        auto query_start = url_str.find('?', rest_start);
        if (query_start == std::string_view::npos) query_start = url_str.length();
        auto fragment_start = url_str.find('#', rest_start);
        if (fragment_start == std::string_view::npos) fragment_start = url_str.length();

        auto host_end = std::min({path_start, query_start, fragment_start});

        // Skip user:pass@
        std::size_t authority_start = rest_start;
        auto at_pos = url_str.find('@', rest_start);
        if (at_pos != std::string_view::npos && at_pos < host_end) {
            authority_start = at_pos + 1;
        }

        auto bracket_start = url_str.find('[', authority_start);
        if (bracket_start != std::string_view::npos && bracket_start < host_end) {
            // IPv6 literal [::1]:port
            auto bracket_end = url_str.find(']', bracket_start);
            if (bracket_end == std::string_view::npos || bracket_end > host_end) {
                return std::unexpected(make_error_code(UploadErrc::invalid_url));
            }
            url.host_ = std::string(url_str.substr(bracket_start, bracket_end - bracket_start + 1));
            if (bracket_end + 1 < host_end && url_str[bracket_end + 1] == ':') {
                url.port_ = std::string(url_str.substr(bracket_end + 2, host_end - bracket_end - 2));
            }
        } else {
            auto colon_pos = url_str.find(':', authority_start);
            if (colon_pos != std::string_view::npos && colon_pos < host_end) {
                url.host_ = std::string(url_str.substr(authority_start, colon_pos - authority_start));
                url.port_ = std::string(url_str.substr(colon_pos + 1, host_end - colon_pos - 1));
            } else {
                url.host_ = std::string(url_str.substr(authority_start, host_end - authority_start));
            }
        }

        if (!url.port_.empty() &&
            !std::all_of(url.port_.begin(), url.port_.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::unexpected(make_error_code(UploadErrc::invalid_url));
        }

        if (path_start < url_str.length() && path_start < query_start && path_start < fragment_start) {
            auto path_end = std::min(query_start, fragment_start);
            url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
        } else {
            url.path_ = "/";
        }

        if (query_start < url_str.length() && query_start < fragment_start) {
            url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
        }

        if (url.host_.empty()) {
            return std::unexpected(make_error_code(UploadErrc::invalid_url));
        }

        return url;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(UploadErrc::invalid_url));
    }
}

std::string Url::full() const {
    std::string result = base();
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    return 0;
}

Url Url::resolve(std::string_view relative) const {
    Url out = *this;
    out.query_.clear();

    while (!relative.empty() && relative.front() == '/') {
        relative.remove_prefix(1);
    }

    if (out.path_.empty() || out.path_.back() != '/') {
        out.path_ += '/';
    }

    // Split "path?query"
    auto q = relative.find('?');
    out.path_ += std::string(relative.substr(0, q));
    if (q != std::string_view::npos) {
        out.query_ = std::string(relative.substr(q + 1));
    }
    return out;
}

Url Url::with_query(std::string_view key, std::string_view value) const {
    Url out = *this;
    if (!out.query_.empty()) {
        out.query_ += '&';
    }
    out.query_ += encode_component(key);
    out.query_ += '=';
    out.query_ += encode_component(value);
    return out;
}

std::string Url::encode_component(std::string_view value) {
    static constexpr char HEX[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += ch;
        } else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }
    return out;
}

} // namespace surge::core
