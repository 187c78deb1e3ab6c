// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rget/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rget::core {

// HTTP status codes the engine distinguishes
constexpr std::int32_t HTTP_OK = 200;
constexpr std::int32_t HTTP_PARTIAL_CONTENT = 206;
constexpr std::int32_t HTTP_RANGE_NOT_SATISFIABLE = 416;

using HttpHeader = std::pair<std::string, std::string>;

struct HttpRequest {
    std::string url;
    std::vector<HttpHeader> headers;
};

// Parsed "Content-Range: bytes first-last/complete" or "bytes */complete"
struct ContentRange {
    std::optional<std::uint64_t> first;
    std::optional<std::uint64_t> last;
    std::optional<std::uint64_t> complete_length;
};

// HTTP response head
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;   // Lower-case names
    std::uint64_t content_length{0};              // 0 when not declared
    std::optional<ContentRange> content_range;
};

using Chunk = std::vector<std::byte>;

// Next body chunk, std::nullopt at end of stream
using ChunkResult = std::expected<std::optional<Chunk>, std::error_code>;

// An open response whose body is pulled chunk by chunk
class HttpStream {
public:
    virtual ~HttpStream() = default;

    [[nodiscard]] virtual const HttpResponse& response() const noexcept = 0;

    // Blocks until the next chunk arrives or the body ends
    [[nodiscard]] virtual ChunkResult next_chunk() = 0;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Send a GET and return once the response head is available.
    // Statuses other than 200, 206 and 416 are reported as DownloadErrc::http_error.
    [[nodiscard]] virtual std::expected<std::unique_ptr<HttpStream>, std::error_code>
    get(const HttpRequest& request) = 0;
};

// libcurl-backed client. One easy handle per request, driven through a
// multi handle so the body can be pulled instead of pushed.
class HttpSession final : public HttpClient {
public:
    HttpSession() = default;
    ~HttpSession() override = default;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] std::expected<std::unique_ptr<HttpStream>, std::error_code>
    get(const HttpRequest& request) override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;
};

// Collects the header lines of one exchange into the final response head.
// Interim 1xx heads are discarded; the head is complete at the blank line
// that ends a head with a final status.
class ResponseHeadParser {
public:
    // One raw header line, CRLF included or not. Returns true once complete.
    bool feed(std::string_view line);

    [[nodiscard]] bool complete() const noexcept { return complete_; }

    // Final head with Content-Length and Content-Range decoded
    [[nodiscard]] const HttpResponse& response() const noexcept { return response_; }

private:
    HttpResponse response_;
    std::int32_t pending_status_{0};
    std::map<std::string, std::string> pending_headers_;
    bool complete_{false};
};

// 200, 206 and 416 carry something the transfer can use; anything else,
// redirects included, is DownloadErrc::http_error
[[nodiscard]] std::error_code check_status(std::int32_t status_code) noexcept;

// "HTTP/1.1 206 Partial Content" -> 206, 0 if the line is not a status line
[[nodiscard]] std::int32_t parse_status_line(std::string_view line) noexcept;

// "Content-Length: 42" -> {"content-length", "42"}
[[nodiscard]] std::optional<HttpHeader> parse_header_line(std::string_view line);

// Header values must be visible ASCII, space or tab
[[nodiscard]] bool is_valid_header_value(std::string_view value) noexcept;

// Build a header, failing with DownloadErrc::invalid_header_value
[[nodiscard]] std::expected<HttpHeader, std::error_code>
make_header(std::string_view name, std::string value);

// "Range: bytes=<offset>-"
[[nodiscard]] std::expected<HttpHeader, std::error_code>
make_range_header(std::uint64_t offset);

[[nodiscard]] std::optional<ContentRange> parse_content_range(std::string_view value) noexcept;

// Decimal Content-Length, std::nullopt if absent or malformed
[[nodiscard]] std::optional<std::uint64_t> parse_content_length(std::string_view value) noexcept;

} // namespace rget::core
