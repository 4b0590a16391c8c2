// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/upload_types.hpp>
#include <cctype>
#include <string>

namespace surge::core {

namespace {

std::string lowercase(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace

std::string_view to_string(NetworkClass network) noexcept {
    switch (network) {
        case NetworkClass::weak:      return "weak";
        case NetworkClass::medium:    return "medium";
        case NetworkClass::strong:    return "strong";
        case NetworkClass::excellent: return "excellent";
    }
    return "medium";
}

std::string_view to_string(ChunkSizeName name) noexcept {
    switch (name) {
        case ChunkSizeName::small:  return "small";
        case ChunkSizeName::medium: return "medium";
        case ChunkSizeName::large:  return "large";
        case ChunkSizeName::xlarge: return "xlarge";
    }
    return "medium";
}

std::expected<NetworkClass, std::error_code>
parse_network_class(std::string_view text) noexcept {
    try {
        auto value = lowercase(text);
        if (value == "weak") return NetworkClass::weak;
        if (value == "medium") return NetworkClass::medium;
        if (value == "strong") return NetworkClass::strong;
        if (value == "excellent") return NetworkClass::excellent;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(UploadErrc::invalid_argument));
    }
    return std::unexpected(make_error_code(UploadErrc::invalid_argument));
}

std::expected<ChunkSizeName, std::error_code>
parse_chunk_size_name(std::string_view text) noexcept {
    try {
        auto value = lowercase(text);
        if (value == "small") return ChunkSizeName::small;
        if (value == "medium") return ChunkSizeName::medium;
        if (value == "large") return ChunkSizeName::large;
        if (value == "xlarge") return ChunkSizeName::xlarge;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(UploadErrc::unknown_chunk_size));
    }
    return std::unexpected(make_error_code(UploadErrc::unknown_chunk_size));
}

} // namespace surge::core
