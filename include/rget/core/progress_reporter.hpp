// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace rget::core {

// Live status line for one transfer, drawn on a text sink
class ProgressReporter {
public:
    explicit ProgressReporter(std::ostream& out) noexcept;

    // Known total: redraws the bar in place with '\r'.
    // Unknown total (0): prints a fresh "<name>: <n> bytes / unknown size" line.
    void report(std::string_view display_name,
                std::uint64_t downloaded_bytes,
                std::uint64_t total_bytes);

    // Move below the bar if one is on screen
    void finish();

    // "[█████     ]" style bar, width cells wide, fraction clamped to [0, 1]
    [[nodiscard]] static std::string render_bar(double fraction, int width);

    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);

    // Final path segment ("dir/file.iso" -> "file.iso")
    [[nodiscard]] static std::string display_name(std::string_view output_path);

private:
    std::ostream& out_;
    bool bar_drawn_{false};
};

} // namespace rget::core
