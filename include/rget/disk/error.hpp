// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rget/core/error.hpp>
#include <system_error>

namespace rget::disk {

enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    disk_full,
    invalid_path,
    is_directory,
    write_error,
    read_error,
    handle_invalid,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "rget::disk";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:         return "Success";
            case DiskErrc::file_not_found:  return "File not found";
            case DiskErrc::access_denied:   return "Access denied";
            case DiskErrc::disk_full:       return "Disk full";
            case DiskErrc::invalid_path:    return "Invalid path";
            case DiskErrc::is_directory:    return "Path is a directory";
            case DiskErrc::write_error:     return "Write error";
            case DiskErrc::read_error:      return "Read error";
            case DiskErrc::handle_invalid:  return "Invalid handle";
            default:                        return "Unknown error";
        }
    }

    // Every disk failure is an I/O error to callers of the engine
    [[nodiscard]] std::error_condition default_error_condition(int ev) const noexcept override {
        if (ev == static_cast<int>(DiskErrc::success)) {
            return {};
        }
        return core::make_error_condition(core::ErrorKind::io);
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

} // namespace rget::disk

namespace std {

template<>
struct is_error_code_enum<rget::disk::DiskErrc> : true_type {};

} // namespace std
