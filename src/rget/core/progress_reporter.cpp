// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rget/core/progress_reporter.hpp>
#include <rget/core/config.hpp>
#include <algorithm>
#include <cmath>
#include <format>
#include <ostream>

namespace rget::core {

namespace {

constexpr std::string_view FILL_GLYPH = "\xE2\x96\x88";  // U+2588 FULL BLOCK

} // namespace

ProgressReporter::ProgressReporter(std::ostream& out) noexcept
    : out_(out) {}

void ProgressReporter::report(std::string_view display_name,
                              std::uint64_t downloaded_bytes,
                              std::uint64_t total_bytes) {
    if (total_bytes == 0) {
        if (bar_drawn_) {
            out_ << '\n';
            bar_drawn_ = false;
        }
        out_ << std::format("{}: {} bytes / unknown size\n", display_name, downloaded_bytes);
        out_.flush();
        return;
    }

    double fraction = static_cast<double>(downloaded_bytes) / static_cast<double>(total_bytes);
    fraction = std::clamp(fraction, 0.0, 1.0);

    out_ << std::format("\r{}: {} {:.2f}%",
                        display_name,
                        render_bar(fraction, PROGRESS_BAR_WIDTH),
                        fraction * 100.0);
    out_.flush();
    bar_drawn_ = true;
}

void ProgressReporter::finish() {
    if (!bar_drawn_) return;
    out_ << '\n';
    out_.flush();
    bar_drawn_ = false;
}

std::string ProgressReporter::render_bar(double fraction, int width) {
    fraction = std::clamp(fraction, 0.0, 1.0);
    const int filled = std::min(width, static_cast<int>(std::floor(fraction * width)));

    std::string bar = "[";
    bar.reserve(static_cast<std::size_t>(width) * FILL_GLYPH.size() + 2);
    for (int i = 0; i < filled; ++i) {
        bar += FILL_GLYPH;
    }
    bar.append(static_cast<std::size_t>(width - filled), ' ');
    bar += ']';
    return bar;
}

std::string ProgressReporter::format_bytes(std::uint64_t bytes) {
    constexpr const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr std::size_t unit_count = sizeof(units) / sizeof(units[0]);

    double size = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (size >= 1024.0 && unit < unit_count - 1) {
        size /= 1024.0;
        ++unit;
    }
    return std::format("{:.2f} {}", size, units[unit]);
}

std::string ProgressReporter::display_name(std::string_view output_path) {
    auto last_slash = output_path.rfind('/');
    if (last_slash == std::string_view::npos) {
        return std::string(output_path);
    }
    return std::string(output_path.substr(last_slash + 1));
}

} // namespace rget::core
