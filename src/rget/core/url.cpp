// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rget/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace rget::core {

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) {
    Url url;

    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    url.scheme_.reserve(scheme_end);
    for (std::size_t i = 0; i < scheme_end; ++i) {
        url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
    }

    auto rest_start = scheme_end + 3;

    auto path_start = std::min(url_str.find('/', rest_start), url_str.length());
    auto query_start = std::min(url_str.find('?', rest_start), url_str.length());
    auto fragment_start = std::min(url_str.find('#', rest_start), url_str.length());

    // Authority ends at the first of /, ?, # or end of input
    auto host_end = std::min({path_start, query_start, fragment_start});

    // A '/' inside the query or fragment does not start a path
    if (path_start > host_end) {
        path_start = url_str.length();
    }

    std::size_t authority_start = rest_start;
    auto at_pos = url_str.find('@', rest_start);
    if (at_pos != std::string_view::npos && at_pos < host_end) {
        authority_start = at_pos + 1;
    }

    // IPv6 literal: [2001:db8::1]:port
    auto bracket_start = url_str.find('[', authority_start);
    if (bracket_start != std::string_view::npos && bracket_start < host_end) {
        auto bracket_end = url_str.find(']', bracket_start);
        if (bracket_end == std::string_view::npos || bracket_end >= host_end) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
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

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    if (!std::all_of(url.port_.begin(), url.port_.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    if (path_start < url_str.length()) {
        auto path_end = std::min(query_start, fragment_start);
        url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
    } else {
        url.path_ = "/";
    }

    if (query_start < fragment_start) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    if (fragment_start < url_str.length()) {
        url.fragment_ = std::string(url_str.substr(fragment_start + 1));
    }

    url.str_ = std::string(url_str);
    return url;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return path_.empty() ? "index.html" : path_;
    }
    auto name = path_.substr(last_slash + 1);
    if (name.empty()) {
        return "index.html";
    }
    return name;
}

} // namespace rget::core
