// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rget/cli/commands.hpp>
#include <rget/core/http_session.hpp>
#include <rget/core/transfer_engine.hpp>
#include <rget/core/url.hpp>
#include <rget/version.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <iostream>
#include <ostream>

namespace fs = std::filesystem;

namespace rget::cli {

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                args.error = "Option " + arg + " requires a file name";
                return args;
            }
            args.output_file = argv[++i];
        } else if (arg == "-u" || arg == "--url") {
            if (i + 1 >= argc) {
                args.error = "Option " + arg + " requires a URL";
                return args;
            }
            if (!args.url.empty()) {
                args.error = "Only one URL can be downloaded at a time";
                return args;
            }
            args.url = argv[++i];
        } else if (arg.starts_with("-") && arg.size() > 1) {
            args.error = "Unknown option: " + arg;
            return args;
        } else if (args.url.empty()) {
            args.url = arg;
        } else {
            args.error = "Only one URL can be downloaded at a time";
            return args;
        }
    }

    if (args.url.empty()) {
        args.error = "No URL specified";
    }

    return args;
}

void init_logging(bool verbose) {
    auto logger = spdlog::get(std::string(PROGRAM_NAME));
    if (!logger) {
        logger = spdlog::stderr_color_mt(std::string(PROGRAM_NAME));
    }
    logger->set_pattern("[%n] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

std::error_code validate_output_path(const std::string& output_path) {
    const fs::path parent = fs::path(output_path).parent_path();
    if (parent.empty()) {
        return {};
    }

    std::error_code ec;
    if (!fs::is_directory(parent, ec)) {
        spdlog::debug("Output directory {} does not exist", parent.string());
        return core::make_error_code(core::DownloadErrc::directory_not_found);
    }
    return {};
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const core::TransferConfig& config, bool quiet, std::stop_token stop) {
    auto url = core::Url::parse(config.source_url);
    if (!url || !url->is_http()) {
        auto ec = url ? core::make_error_code(core::DownloadErrc::invalid_url) : url.error();
        std::cerr << "Error: " << ec.message() << ": " << config.source_url << std::endl;
        return std::unexpected(ec);
    }

    const std::string output_path = config.resolved_output_path();
    if (auto ec = validate_output_path(output_path)) {
        std::cerr << "Error: " << ec.message() << ": "
                  << fs::path(output_path).parent_path().string() << std::endl;
        return std::unexpected(ec);
    }

    spdlog::debug("Output path: {}", output_path);

    core::HttpSession::global_init();

    // A stream without a buffer discards everything written to it
    std::ostream discard(nullptr);

    core::DownloadResult result;
    {
        core::HttpSession session;
        core::TransferEngine engine(session, quiet ? discard : std::cout);
        result = engine.download(config.source_url, output_path, std::move(stop));
    }

    core::HttpSession::global_cleanup();

    if (!result) {
        std::cerr << "Error: " << result.error().message() << std::endl;
        return std::unexpected(result.error());
    }

    switch (result->outcome) {
        case core::TransferOutcome::already_complete:
            if (!quiet) {
                std::cout << output_path << " is already fully downloaded" << std::endl;
            }
            break;
        case core::TransferOutcome::cancelled:
            std::cerr << "Download cancelled, " << result->downloaded_bytes
                      << " bytes kept in " << output_path << std::endl;
            break;
        default:
            spdlog::debug("Download {}: {} of {} bytes", core::to_string(result->outcome),
                          result->downloaded_bytes, result->total_bytes);
            break;
    }

    return 0;
}

void print_help(std::string_view program_name) {
    std::cout << "rget " << version.to_string() << " - resumable HTTP downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>\n";
    std::cout << "  " << program_name << " [OPTIONS] -u <URL>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -u, --url <URL>         URL to download (same as the positional argument)\n";
    std::cout << "  -o, --output <FILE>     Save to specified file (default: last URL path segment)\n";
    std::cout << "\n";
    std::cout << "Running again with the same output file resumes an interrupted download.\n";
    std::cout << "Ctrl+C stops after the current chunk and keeps the partial file.\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -o myfile.zip https://example.com/file.zip\n";
}

void print_version() {
    std::cout << "rget " << version.to_string() << std::endl;
    std::cout << "Built with C++23, libcurl, spdlog\n";
}

} // namespace rget::cli
