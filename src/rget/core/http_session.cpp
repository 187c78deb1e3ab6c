// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rget/core/http_session.hpp>
#include <rget/core/config.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <deque>

namespace rget::core {

namespace {

// RAII deleters for libcurl handles
struct CurlEasyDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

struct CurlMultiDeleter {
    void operator()(CURLM* handle) const noexcept { curl_multi_cleanup(handle); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using MultiHandle = std::unique_ptr<CURLM, CurlMultiDeleter>;
using SlistHandle = std::unique_ptr<curl_slist, CurlSlistDeleter>;

std::error_code curl_error_to_error_code(CURLcode code) noexcept {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:    return make_error_code(DownloadErrc::dns_error);
        case CURLE_COULDNT_CONNECT:          return make_error_code(DownloadErrc::connection_failed);
        case CURLE_OPERATION_TIMEDOUT:       return make_error_code(DownloadErrc::timeout);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:               return make_error_code(DownloadErrc::ssl_error);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:              return make_error_code(DownloadErrc::connection_lost);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:     return make_error_code(DownloadErrc::invalid_url);
        case CURLE_WEIRD_SERVER_REPLY:
        case CURLE_BAD_CONTENT_ENCODING:     return make_error_code(DownloadErrc::malformed_response);
        default:                             return make_error_code(DownloadErrc::connection_failed);
    }
}

std::string_view trim(std::string_view value) noexcept {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t' ||
                              value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }
    return value;
}

std::optional<std::uint64_t> parse_decimal(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

//=============================================================================
// CurlStream
//=============================================================================

class CurlStream final : public HttpStream {
public:
    CurlStream() = default;
    ~CurlStream() override;

    CurlStream(const CurlStream&) = delete;
    CurlStream& operator=(const CurlStream&) = delete;

    // Send the request and drive the transfer until the response head is in
    [[nodiscard]] std::error_code start(const HttpRequest& request);

    [[nodiscard]] const HttpResponse& response() const noexcept override { return response_; }

    [[nodiscard]] ChunkResult next_chunk() override;

private:
    static std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata);
    static std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata);

    // One perform step, then wait for socket activity if nothing arrived
    [[nodiscard]] std::error_code pump();

    [[nodiscard]] std::error_code transfer_error() const;

    SlistHandle headers_;
    MultiHandle multi_;
    EasyHandle easy_;
    bool attached_{false};

    std::string url_;
    ResponseHeadParser head_;
    HttpResponse response_;

    std::deque<Chunk> chunks_;
    bool finished_{false};
    CURLcode result_{CURLE_OK};
    char error_buffer_[CURL_ERROR_SIZE]{};
};

CurlStream::~CurlStream() {
    if (attached_) {
        curl_multi_remove_handle(multi_.get(), easy_.get());
    }
}

std::error_code CurlStream::start(const HttpRequest& request) {
    url_ = request.url;
    easy_.reset(curl_easy_init());
    multi_.reset(curl_multi_init());
    if (!easy_ || !multi_) {
        return make_error_code(DownloadErrc::connection_failed);
    }

    for (const auto& [name, value] : request.headers) {
        std::string line = name + ": " + value;
        curl_slist* list = headers_.release();
        curl_slist* appended = curl_slist_append(list, line.c_str());
        if (!appended) {
            headers_.reset(list);
            return make_error_code(DownloadErrc::connection_failed);
        }
        headers_.reset(appended);
    }

    CURL* curl = easy_.get();
    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    if (headers_) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_.get());
    }

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &CurlStream::header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, this);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &CurlStream::write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer_);

    // Single request, no redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT.data());

    // Timeouts
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(STALL_TIMEOUT_SEC));

    // SSL options
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(READ_BUFFER_SIZE));

    if (curl_multi_add_handle(multi_.get(), curl) != CURLM_OK) {
        return make_error_code(DownloadErrc::connection_failed);
    }
    attached_ = true;

    while (!head_.complete() && !finished_) {
        if (auto ec = pump()) {
            return ec;
        }
    }

    if (!head_.complete()) {
        if (result_ != CURLE_OK) {
            return transfer_error();
        }
        spdlog::debug("GET {}: transfer ended without a response head", url_);
        return make_error_code(DownloadErrc::malformed_response);
    }

    response_ = head_.response();

    spdlog::debug("GET {}: status={} content-length={}", url_, response_.status_code,
                  response_.content_length);

    return check_status(response_.status_code);
}

ChunkResult CurlStream::next_chunk() {
    while (chunks_.empty() && !finished_) {
        if (auto ec = pump()) {
            return std::unexpected(ec);
        }
    }

    // Bytes received before a failure are still delivered
    if (!chunks_.empty()) {
        std::optional<Chunk> chunk{std::move(chunks_.front())};
        chunks_.pop_front();
        return chunk;
    }

    if (result_ != CURLE_OK) {
        return std::unexpected(transfer_error());
    }
    return std::optional<Chunk>{};
}

std::error_code CurlStream::pump() {
    const bool had_head = head_.complete();
    const std::size_t had_chunks = chunks_.size();

    int running = 0;
    CURLMcode mc = curl_multi_perform(multi_.get(), &running);
    if (mc != CURLM_OK) {
        spdlog::debug("GET {}: curl_multi_perform failed: {}", url_, curl_multi_strerror(mc));
        return make_error_code(DownloadErrc::connection_failed);
    }

    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi_.get(), &queued)) {
        if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_.get()) {
            finished_ = true;
            result_ = msg->data.result;
        }
    }

    if (finished_ || had_head != head_.complete() || chunks_.size() != had_chunks) {
        return {};
    }

    mc = curl_multi_poll(multi_.get(), nullptr, 0, POLL_TIMEOUT_MS, nullptr);
    if (mc != CURLM_OK) {
        spdlog::debug("GET {}: curl_multi_poll failed: {}", url_, curl_multi_strerror(mc));
        return make_error_code(DownloadErrc::connection_failed);
    }
    return {};
}

std::error_code CurlStream::transfer_error() const {
    spdlog::debug("GET {}: curl error {}: {}", url_, static_cast<int>(result_),
                  error_buffer_[0] != '\0' ? error_buffer_ : curl_easy_strerror(result_));
    return curl_error_to_error_code(result_);
}

std::size_t CurlStream::header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* self = static_cast<CurlStream*>(userdata);
    if (!self) return 0;

    self->head_.feed(std::string_view(buffer, total));
    return total;
}

std::size_t CurlStream::write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    std::size_t total = size * nmemb;
    auto* self = static_cast<CurlStream*>(userdata);
    if (!self) return 0;

    if (total > 0) {
        Chunk chunk(total);
        std::memcpy(chunk.data(), ptr, total);
        self->chunks_.push_back(std::move(chunk));
    }
    return total;
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

std::expected<std::unique_ptr<HttpStream>, std::error_code>
HttpSession::get(const HttpRequest& request) {
    auto stream = std::make_unique<CurlStream>();
    if (auto ec = stream->start(request)) {
        return std::unexpected(ec);
    }
    return std::unique_ptr<HttpStream>(std::move(stream));
}

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

//=============================================================================
// Response head
//=============================================================================

bool ResponseHeadParser::feed(std::string_view line) {
    if (complete_) return true;

    line = trim(line);

    // Each head starts with a status line; interim 1xx heads precede the final one
    if (line.starts_with("HTTP/")) {
        pending_status_ = parse_status_line(line);
        pending_headers_.clear();
        return false;
    }

    if (line.empty()) {
        if (pending_status_ >= 200) {
            response_.status_code = pending_status_;
            response_.headers = std::move(pending_headers_);
            if (auto it = response_.headers.find("content-length"); it != response_.headers.end()) {
                response_.content_length = parse_content_length(it->second).value_or(0);
            }
            if (auto it = response_.headers.find("content-range"); it != response_.headers.end()) {
                response_.content_range = parse_content_range(it->second);
            }
            complete_ = true;
        }
        pending_headers_.clear();
        return complete_;
    }

    if (auto header = parse_header_line(line)) {
        pending_headers_[header->first] = std::move(header->second);
    }
    return false;
}

std::error_code check_status(std::int32_t status_code) noexcept {
    switch (status_code) {
        case HTTP_OK:
        case HTTP_PARTIAL_CONTENT:
        case HTTP_RANGE_NOT_SATISFIABLE:
            return {};
        default:
            return make_error_code(DownloadErrc::http_error);
    }
}

std::int32_t parse_status_line(std::string_view line) noexcept {
    line = trim(line);
    if (!line.starts_with("HTTP/")) {
        return 0;
    }
    auto space = line.find(' ');
    if (space == std::string_view::npos) {
        return 0;
    }
    auto code = line.substr(space + 1, 3);
    if (code.size() != 3) {
        return 0;
    }
    auto value = parse_decimal(code);
    return value ? static_cast<std::int32_t>(*value) : 0;
}

std::optional<HttpHeader> parse_header_line(std::string_view line) {
    line = trim(line);
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::nullopt;
    }

    std::string name;
    name.reserve(colon);
    for (char c : line.substr(0, colon)) {
        name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return HttpHeader{std::move(name), std::string(trim(line.substr(colon + 1)))};
}

//=============================================================================
// Header helpers
//=============================================================================

bool is_valid_header_value(std::string_view value) noexcept {
    return std::all_of(value.begin(), value.end(), [](char c) {
        auto b = static_cast<unsigned char>(c);
        return b == '\t' || (b >= 0x20 && b < 0x7f);
    });
}

std::expected<HttpHeader, std::error_code>
make_header(std::string_view name, std::string value) {
    const bool name_ok = !name.empty() && std::all_of(name.begin(), name.end(), [](char c) {
        auto b = static_cast<unsigned char>(c);
        return b > 0x20 && b < 0x7f && c != ':';
    });
    if (!name_ok || !is_valid_header_value(value)) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_header_value));
    }
    return HttpHeader{std::string(name), std::move(value)};
}

std::expected<HttpHeader, std::error_code> make_range_header(std::uint64_t offset) {
    return make_header("Range", "bytes=" + std::to_string(offset) + "-");
}

std::optional<ContentRange> parse_content_range(std::string_view value) noexcept {
    value = trim(value);
    constexpr std::string_view unit = "bytes";
    if (!value.starts_with(unit)) {
        return std::nullopt;
    }
    value.remove_prefix(unit.size());
    if (value.empty() || value.front() != ' ') {
        return std::nullopt;
    }
    value = trim(value);

    auto slash = value.find('/');
    if (slash == std::string_view::npos) {
        return std::nullopt;
    }

    ContentRange range;
    auto span = value.substr(0, slash);
    auto complete = value.substr(slash + 1);

    if (span != "*") {
        auto dash = span.find('-');
        if (dash == std::string_view::npos) {
            return std::nullopt;
        }
        range.first = parse_decimal(span.substr(0, dash));
        range.last = parse_decimal(span.substr(dash + 1));
        if (!range.first || !range.last || *range.first > *range.last) {
            return std::nullopt;
        }
    }

    if (complete != "*") {
        range.complete_length = parse_decimal(complete);
        if (!range.complete_length) {
            return std::nullopt;
        }
    }

    return range;
}

std::optional<std::uint64_t> parse_content_length(std::string_view value) noexcept {
    return parse_decimal(trim(value));
}

} // namespace rget::core
