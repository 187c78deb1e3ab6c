// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rget::core {

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 60;                     // Abort if below 1 B/s this long
constexpr int POLL_TIMEOUT_MS = 250;                                // Max wait per poll for body data

constexpr std::size_t READ_BUFFER_SIZE = 64 * 1024;                 // 64 KB libcurl receive buffer

constexpr int PROGRESS_BAR_WIDTH = 30;

constexpr std::string_view USER_AGENT = "rget/0.2";

// What to download and where to put it
struct TransferConfig {
    std::string source_url;                       // Required
    std::optional<std::string> output_path;       // Default: basename of the URL path

    // Output path with the default rule applied. Empty if source_url does not parse.
    [[nodiscard]] std::string resolved_output_path() const;
};

} // namespace rget::core
