// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <rget/core/progress_reporter.hpp>
#include <rget/core/config.hpp>
#include <sstream>
#include <string>

using namespace rget::core;

namespace {

const std::string BLOCK = "\xE2\x96\x88";

std::string blocks(int n) {
    std::string s;
    for (int i = 0; i < n; ++i) s += BLOCK;
    return s;
}

std::size_t count_blocks(const std::string& s) {
    std::size_t n = 0;
    for (auto pos = s.find(BLOCK); pos != std::string::npos; pos = s.find(BLOCK, pos + BLOCK.size())) {
        ++n;
    }
    return n;
}

} // namespace

TEST_CASE("ProgressReporter::render_bar", "[progress]") {
    SECTION("Empty") {
        CHECK(ProgressReporter::render_bar(0.0, 10) == "[          ]");
    }

    SECTION("Half") {
        CHECK(ProgressReporter::render_bar(0.5, 10) == "[" + blocks(5) + "     ]");
    }

    SECTION("Full") {
        CHECK(ProgressReporter::render_bar(1.0, 10) == "[" + blocks(10) + "]");
    }

    SECTION("Partial cells round down") {
        auto bar = ProgressReporter::render_bar(0.999, PROGRESS_BAR_WIDTH);
        CHECK(count_blocks(bar) == 29);
        CHECK(bar.ends_with(" ]"));
    }

    SECTION("Out of range fractions are clamped") {
        CHECK(ProgressReporter::render_bar(1.5, 10) == "[" + blocks(10) + "]");
        CHECK(ProgressReporter::render_bar(-0.5, 10) == "[          ]");
    }
}

TEST_CASE("ProgressReporter::report with a known total", "[progress]") {
    std::ostringstream out;
    ProgressReporter reporter(out);

    SECTION("Bar line is drawn in place") {
        reporter.report("file.iso", 500, 1000);
        CHECK(out.str() == "\rfile.iso: [" + blocks(15) + std::string(15, ' ') + "] 50.00%");
    }

    SECTION("Percentage keeps two decimals") {
        reporter.report("file.iso", 999, 1000);
        CHECK(out.str().ends_with("] 99.90%"));
        CHECK(count_blocks(out.str()) == 29);
    }

    SECTION("More bytes than declared shows a full bar") {
        reporter.report("file.iso", 1500, 1000);
        CHECK(out.str() == "\rfile.iso: [" + blocks(30) + "] 100.00%");
    }

    SECTION("finish moves below the bar once") {
        reporter.report("file.iso", 1000, 1000);
        reporter.finish();
        reporter.finish();
        CHECK(out.str().ends_with("100.00%\n"));
        CHECK(out.str().find('\n') == out.str().size() - 1);
    }
}

TEST_CASE("ProgressReporter::report with an unknown total", "[progress]") {
    std::ostringstream out;
    ProgressReporter reporter(out);

    SECTION("One line per report") {
        reporter.report("data", 1, 0);
        reporter.report("data", 65536, 0);
        CHECK(out.str() == "data: 1 bytes / unknown size\ndata: 65536 bytes / unknown size\n");
    }

    SECTION("finish adds nothing when no bar was drawn") {
        reporter.report("data", 10, 0);
        reporter.finish();
        CHECK(out.str() == "data: 10 bytes / unknown size\n");
    }

    SECTION("Bar on screen is ended before the line") {
        reporter.report("data", 10, 100);
        reporter.report("data", 20, 0);
        CHECK(out.str().ends_with("10.00%\ndata: 20 bytes / unknown size\n"));
    }
}

TEST_CASE("ProgressReporter without reports writes nothing", "[progress]") {
    std::ostringstream out;
    ProgressReporter reporter(out);
    reporter.finish();
    CHECK(out.str().empty());
}

TEST_CASE("ProgressReporter::display_name", "[progress]") {
    CHECK(ProgressReporter::display_name("file.iso") == "file.iso");
    CHECK(ProgressReporter::display_name("downloads/file.iso") == "file.iso");
    CHECK(ProgressReporter::display_name("/tmp/a/b/c.tar.gz") == "c.tar.gz");
}

TEST_CASE("ProgressReporter::format_bytes", "[progress]") {
    CHECK(ProgressReporter::format_bytes(0) == "0.00 B");
    CHECK(ProgressReporter::format_bytes(512) == "512.00 B");
    CHECK(ProgressReporter::format_bytes(1024) == "1.00 KB");
    CHECK(ProgressReporter::format_bytes(1536) == "1.50 KB");
    CHECK(ProgressReporter::format_bytes(10ULL * 1024 * 1024) == "10.00 MB");
    CHECK(ProgressReporter::format_bytes(3ULL * 1024 * 1024 * 1024) == "3.00 GB");
    CHECK(ProgressReporter::format_bytes(2ULL * 1024 * 1024 * 1024 * 1024) == "2.00 TB");
}
