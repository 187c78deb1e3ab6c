// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rget/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace rget::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str);

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }
    [[nodiscard]] const std::string& fragment() const noexcept { return fragment_; }

    // Original text as given to parse()
    [[nodiscard]] const std::string& str() const noexcept { return str_; }
    [[nodiscard]] bool is_http() const noexcept { return scheme_ == "http" || scheme_ == "https"; }

    // Last path segment, "index.html" for a directory path
    [[nodiscard]] std::string filename() const;

    Url() = default;

private:
    std::string str_;
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

} // namespace rget::core
