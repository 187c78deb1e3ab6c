// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rget/core/config.hpp>
#include <rget/core/error.hpp>
#include <rget/core/http_session.hpp>
#include <rget/disk/file_writer.hpp>
#include <cstdint>
#include <expected>
#include <iosfwd>
#include <stop_token>
#include <string>
#include <string_view>

namespace rget::core {

// How a download() call ended
enum class TransferOutcome : std::uint8_t {
    completed,         // Fresh download streamed to the end
    resumed,           // Appended the remaining range to a partial file
    restarted,         // Partial file was inconsistent, downloaded from scratch
    already_complete,  // Nothing to do, file left untouched
    cancelled          // Stop requested, partial file kept for a later resume
};

[[nodiscard]] std::string_view to_string(TransferOutcome outcome) noexcept;

// Byte counters for one download() call
struct Transfer {
    std::string source_url;
    std::string output_path;
    std::string display_name;
    std::uint64_t downloaded_bytes{0};
    std::uint64_t total_bytes{0};     // 0 when the server did not declare a length
};

struct TransferResult {
    TransferOutcome outcome{TransferOutcome::completed};
    std::uint64_t downloaded_bytes{0};
    std::uint64_t total_bytes{0};
};

using DownloadResult = std::expected<TransferResult, std::error_code>;

// Downloads one URL to one file, resuming from the file's current length.
//
// A missing file is downloaded from scratch. An existing file of length L is
// probed with "Range: bytes=L-": if the server has nothing past L the file is
// left alone, if the file is empty or longer than the resource it is
// re-downloaded, otherwise the remaining bytes are appended.
//
// The stop token is checked after each chunk is pulled and before it is
// written, so a cancelled transfer leaves only whole chunks on disk and
// returns success.
class TransferEngine {
public:
    TransferEngine(HttpClient& client, std::ostream& display) noexcept;

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    [[nodiscard]] DownloadResult download(const std::string& url,
                                          const std::string& output_path,
                                          std::stop_token stop);

    [[nodiscard]] DownloadResult download(const TransferConfig& config, std::stop_token stop);

private:
    // Plain GET, file truncated, offset 0
    [[nodiscard]] DownloadResult fresh_download(Transfer& transfer,
                                                TransferOutcome outcome,
                                                std::stop_token stop);

    // Pull chunks from stream and write them to the output file
    [[nodiscard]] DownloadResult stream_to_file(HttpStream& stream,
                                                Transfer& transfer,
                                                disk::OpenMode mode,
                                                TransferOutcome outcome,
                                                std::stop_token stop);

    HttpClient& client_;
    std::ostream& display_;
};

} // namespace rget::core
