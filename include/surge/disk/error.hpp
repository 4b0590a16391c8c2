// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace surge::disk {

enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    invalid_path,
    not_a_file,
    read_error,
    write_error,
    short_read,
    out_of_range,
    handle_invalid,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "surge::disk";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:         return "Success";
            case DiskErrc::file_not_found:  return "File not found";
            case DiskErrc::access_denied:   return "Access denied";
            case DiskErrc::invalid_path:    return "Invalid path";
            case DiskErrc::not_a_file:      return "Not a regular file";
            case DiskErrc::read_error:      return "Read error";
            case DiskErrc::write_error:     return "Write error";
            case DiskErrc::short_read:      return "File ended before the requested range";
            case DiskErrc::out_of_range:    return "Offset past end of file";
            case DiskErrc::handle_invalid:  return "Invalid handle";
            default:                        return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

} // namespace surge::disk

namespace std {

template<>
struct is_error_code_enum<surge::disk::DiskErrc> : true_type {};

} // namespace std
