// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace rget::core {

// Coarse error kinds reported to callers. Every DownloadErrc and
// rget::disk::DiskErrc maps to exactly one of these.
enum class ErrorKind {
    request_failed = 1,
    io,
    invalid_header_value,
    directory_not_found,
};

enum class DownloadErrc {
    success = 0,
    connection_failed,
    dns_error,
    timeout,
    ssl_error,
    connection_lost,
    malformed_response,
    http_error,
    invalid_url,
    invalid_header_value,
    directory_not_found,
};

namespace detail {

struct ErrorKindCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "rget::kind";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<ErrorKind>(ev)) {
            case ErrorKind::request_failed:       return "Request failed";
            case ErrorKind::io:                   return "I/O error";
            case ErrorKind::invalid_header_value: return "Invalid header value";
            case ErrorKind::directory_not_found:  return "Directory not found";
            default:                              return "Unknown error kind";
        }
    }
};

} // namespace detail

inline const detail::ErrorKindCategory& error_kind_category() noexcept {
    static detail::ErrorKindCategory category;
    return category;
}

inline std::error_condition make_error_condition(ErrorKind k) noexcept {
    return {static_cast<int>(k), error_kind_category()};
}

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "rget::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:              return "Success";
            case DownloadErrc::connection_failed:    return "Connection failed";
            case DownloadErrc::dns_error:            return "DNS resolution failed";
            case DownloadErrc::timeout:              return "Operation timed out";
            case DownloadErrc::ssl_error:            return "SSL/TLS error";
            case DownloadErrc::connection_lost:      return "Connection lost";
            case DownloadErrc::malformed_response:   return "Malformed response";
            case DownloadErrc::http_error:           return "Server returned an error status";
            case DownloadErrc::invalid_url:          return "Invalid URL";
            case DownloadErrc::invalid_header_value: return "Invalid header value";
            case DownloadErrc::directory_not_found:  return "Directory not found";
            default:                                 return "Unknown error";
        }
    }

    [[nodiscard]] std::error_condition default_error_condition(int ev) const noexcept override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:
                return {};
            case DownloadErrc::invalid_header_value:
                return make_error_condition(ErrorKind::invalid_header_value);
            case DownloadErrc::directory_not_found:
                return make_error_condition(ErrorKind::directory_not_found);
            default:
                return make_error_condition(ErrorKind::request_failed);
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

} // namespace rget::core

namespace std {

template<>
struct is_error_code_enum<rget::core::DownloadErrc> : true_type {};

template<>
struct is_error_condition_enum<rget::core::ErrorKind> : true_type {};

} // namespace std
