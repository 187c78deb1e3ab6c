// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rget/core/config.hpp>
#include <rget/core/error.hpp>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace rget::cli {

// CLI result: exit code, or the error that caused a failure
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string url;
    std::optional<std::string> output_file;
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;          // Usage problem, empty if the arguments are usable
};

[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Route spdlog's default logger to stderr; debug level when verbose
void init_logging(bool verbose);

// The directory that will hold output_path must already exist
[[nodiscard]] std::error_code validate_output_path(const std::string& output_path);

// Download config.source_url, printing progress unless quiet
[[nodiscard]] CliResult download(const core::TransferConfig& config,
                                 bool quiet,
                                 std::stop_token stop);

void print_help(std::string_view program_name);

void print_version();

} // namespace rget::cli
