// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rget/core/transfer_engine.hpp>
#include <rget/core/progress_reporter.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <optional>
#include <utility>

namespace rget::core {

std::string_view to_string(TransferOutcome outcome) noexcept {
    switch (outcome) {
        case TransferOutcome::completed:        return "completed";
        case TransferOutcome::resumed:          return "resumed";
        case TransferOutcome::restarted:        return "restarted";
        case TransferOutcome::already_complete: return "already complete";
        case TransferOutcome::cancelled:        return "cancelled";
    }
    return "unknown";
}

//=============================================================================
// TransferEngine
//=============================================================================

TransferEngine::TransferEngine(HttpClient& client, std::ostream& display) noexcept
    : client_(client)
    , display_(display) {}

DownloadResult TransferEngine::download(const TransferConfig& config, std::stop_token stop) {
    auto output_path = config.resolved_output_path();
    if (output_path.empty()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }
    return download(config.source_url, output_path, std::move(stop));
}

DownloadResult TransferEngine::download(const std::string& url,
                                        const std::string& output_path,
                                        std::stop_token stop) {
    Transfer transfer{url, output_path, ProgressReporter::display_name(output_path)};

    auto existing = disk::file_length(output_path);
    if (!existing) {
        spdlog::debug("Cannot inspect {}: {}", output_path, existing.error().message());
        return std::unexpected(existing.error());
    }

    if (!existing->has_value()) {
        spdlog::debug("Downloading url={} to path={}", url, output_path);
        return fresh_download(transfer, TransferOutcome::completed, std::move(stop));
    }

    const std::uint64_t have = **existing;

    auto range = make_range_header(have);
    if (!range) {
        return std::unexpected(range.error());
    }

    auto probe = client_.get(HttpRequest{url, {*range}});
    if (!probe) {
        return std::unexpected(probe.error());
    }
    const HttpResponse& head = (*probe)->response();
    if (auto ec = check_status(head.status_code)) {
        spdlog::debug("Unexpected status {} for url={}, leaving path={} untouched",
                      head.status_code, url, output_path);
        return std::unexpected(ec);
    }

    // A 206 that does not start at the requested offset cannot be appended
    std::optional<std::uint64_t> served_from;
    if (head.status_code == HTTP_PARTIAL_CONTENT && head.content_range) {
        served_from = head.content_range->first;
    }
    const bool misaligned = served_from && *served_from != have;

    // Range ignored: the body is the whole resource, so rewrite from offset 0
    if (head.status_code == HTTP_OK || (misaligned && *served_from == 0)) {
        spdlog::debug("Server ignored range request for url={}, starting download from scratch to path={}",
                      url, output_path);
        transfer.total_bytes = head.content_length;
        if (head.content_range && head.content_range->complete_length) {
            transfer.total_bytes = *head.content_range->complete_length;
        }
        return stream_to_file(**probe, transfer, disk::OpenMode::truncate,
                              TransferOutcome::restarted, std::move(stop));
    }

    if (misaligned) {
        spdlog::debug("Server answered range {}- from offset {}, starting download from scratch "
                      "for url={} to path={}", have, *served_from, url, output_path);
        probe->reset();
        return fresh_download(transfer, TransferOutcome::restarted, std::move(stop));
    }

    std::uint64_t remaining = head.content_length;
    bool resource_shorter = false;
    if (head.status_code == HTTP_RANGE_NOT_SATISFIABLE) {
        // Nothing past the offset. "Content-Range: bytes */N" tells us whether
        // that is because the file is complete or because it is too long.
        remaining = 0;
        std::optional<std::uint64_t> complete;
        if (head.content_range) {
            complete = head.content_range->complete_length;
        }
        resource_shorter = complete && *complete < have;
    } else if (head.content_range && head.content_range->complete_length) {
        // "bytes a-b/N" names the full size even without a Content-Length
        const std::uint64_t complete = *head.content_range->complete_length;
        resource_shorter = complete < have;
        remaining = complete > have ? complete - have : 0;
    }

    const std::uint64_t total = remaining + have;

    if (total == have && !resource_shorter) {
        spdlog::debug("File already downloaded: {}", output_path);
        return TransferResult{TransferOutcome::already_complete, have, total};
    }

    if (resource_shorter || have > total || have == 0) {
        spdlog::debug("File size={} is greater than the total bytes={} or 0, "
                      "starting download from scratch for url={} to path={}",
                      have, total, url, output_path);
        probe->reset();
        return fresh_download(transfer, TransferOutcome::restarted, std::move(stop));
    }

    spdlog::debug("Continuing download for url={} to path={}", url, output_path);
    transfer.downloaded_bytes = have;
    transfer.total_bytes = total;
    return stream_to_file(**probe, transfer, disk::OpenMode::append,
                          TransferOutcome::resumed, std::move(stop));
}

DownloadResult TransferEngine::fresh_download(Transfer& transfer,
                                              TransferOutcome outcome,
                                              std::stop_token stop) {
    auto stream = client_.get(HttpRequest{transfer.source_url, {}});
    if (!stream) {
        return std::unexpected(stream.error());
    }

    // Only a full 200 body belongs at offset 0
    const std::int32_t status = (*stream)->response().status_code;
    if (status != HTTP_OK) {
        spdlog::debug("Unexpected status {} for url={}", status, transfer.source_url);
        return std::unexpected(make_error_code(DownloadErrc::http_error));
    }

    transfer.downloaded_bytes = 0;
    transfer.total_bytes = (*stream)->response().content_length;
    return stream_to_file(**stream, transfer, disk::OpenMode::truncate, outcome, std::move(stop));
}

DownloadResult TransferEngine::stream_to_file(HttpStream& stream,
                                              Transfer& transfer,
                                              disk::OpenMode mode,
                                              TransferOutcome outcome,
                                              std::stop_token stop) {
    disk::FileWriter file;
    if (auto ec = file.open(transfer.output_path, mode)) {
        spdlog::debug("Cannot open {}: {}", transfer.output_path, ec.message());
        return std::unexpected(ec);
    }

    spdlog::debug("Downloading {}: remaining={} total={}",
                  transfer.display_name,
                  ProgressReporter::format_bytes(transfer.total_bytes - std::min(transfer.total_bytes,
                                                                                  transfer.downloaded_bytes)),
                  ProgressReporter::format_bytes(transfer.total_bytes));

    ProgressReporter reporter(display_);
    std::error_code failure;

    while (true) {
        auto chunk = stream.next_chunk();
        if (!chunk) {
            failure = chunk.error();
            break;
        }
        if (!chunk->has_value()) {
            break;
        }

        // Checked per chunk, the pulled chunk is dropped whole
        if (stop.stop_requested()) {
            outcome = TransferOutcome::cancelled;
            break;
        }

        const Chunk& bytes = **chunk;
        if (auto ec = file.write(bytes.data(), bytes.size())) {
            failure = ec;
            break;
        }

        transfer.downloaded_bytes += bytes.size();
        reporter.report(transfer.display_name, transfer.downloaded_bytes, transfer.total_bytes);
    }

    reporter.finish();

    if (!failure) {
        failure = file.flush();
    }
    file.close();

    if (failure) {
        spdlog::debug("Transfer of {} aborted after {} bytes: {}",
                      transfer.output_path, transfer.downloaded_bytes, failure.message());
        return std::unexpected(failure);
    }

    if (outcome == TransferOutcome::cancelled) {
        spdlog::debug("Download of {} cancelled at {} bytes", transfer.output_path, transfer.downloaded_bytes);
    }

    return TransferResult{outcome, transfer.downloaded_bytes, transfer.total_bytes};
}

} // namespace rget::core
