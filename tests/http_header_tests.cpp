// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <rget/core/http_session.hpp>
#include <cstdint>

using namespace rget::core;

TEST_CASE("make_range_header", "[http]") {
    SECTION("Open-ended range from an offset") {
        auto header = make_range_header(300);
        REQUIRE(header.has_value());
        CHECK(header->first == "Range");
        CHECK(header->second == "bytes=300-");
    }

    SECTION("Offsets beyond 4 GB") {
        auto header = make_range_header(5'000'000'000ULL);
        REQUIRE(header.has_value());
        CHECK(header->second == "bytes=5000000000-");
    }
}

TEST_CASE("make_header rejects unsafe values", "[http]") {
    SECTION("Plain value") {
        auto header = make_header("Accept", "*/*");
        REQUIRE(header.has_value());
        CHECK(header->second == "*/*");
    }

    SECTION("Line breaks") {
        auto header = make_header("X-Test", "a\r\nInjected: yes");
        REQUIRE_FALSE(header.has_value());
        CHECK(header.error() == ErrorKind::invalid_header_value);
        CHECK(header.error() == DownloadErrc::invalid_header_value);
    }

    SECTION("Control characters") {
        CHECK_FALSE(make_header("X-Test", std::string("a\0b", 3)).has_value());
        CHECK_FALSE(make_header("X-Test", "bell\a").has_value());
    }

    SECTION("Bad names") {
        CHECK_FALSE(make_header("", "value").has_value());
        CHECK_FALSE(make_header("Bad Name", "value").has_value());
        CHECK_FALSE(make_header("Bad:Name", "value").has_value());
    }

    SECTION("Tabs are allowed") {
        CHECK(is_valid_header_value("a\tb"));
        CHECK_FALSE(is_valid_header_value("a\nb"));
    }
}

TEST_CASE("parse_content_range", "[http]") {
    SECTION("Satisfied range") {
        auto range = parse_content_range("bytes 300-999/1000");
        REQUIRE(range.has_value());
        CHECK(range->first == 300u);
        CHECK(range->last == 999u);
        CHECK(range->complete_length == 1000u);
    }

    SECTION("Unsatisfied range") {
        auto range = parse_content_range("bytes */1000");
        REQUIRE(range.has_value());
        CHECK_FALSE(range->first.has_value());
        CHECK_FALSE(range->last.has_value());
        CHECK(range->complete_length == 1000u);
    }

    SECTION("Unknown complete length") {
        auto range = parse_content_range("bytes 0-99/*");
        REQUIRE(range.has_value());
        CHECK(range->first == 0u);
        CHECK_FALSE(range->complete_length.has_value());
    }

    SECTION("Surrounding whitespace") {
        auto range = parse_content_range("  bytes 0-0/1\r\n");
        REQUIRE(range.has_value());
        CHECK(range->complete_length == 1u);
    }

    SECTION("Malformed") {
        CHECK_FALSE(parse_content_range("").has_value());
        CHECK_FALSE(parse_content_range("items 0-1/2").has_value());
        CHECK_FALSE(parse_content_range("bytes 0-1").has_value());
        CHECK_FALSE(parse_content_range("bytes 5-1/10").has_value());
        CHECK_FALSE(parse_content_range("bytes a-b/c").has_value());
        CHECK_FALSE(parse_content_range("bytes 0-1/x").has_value());
    }
}

TEST_CASE("parse_content_length", "[http]") {
    CHECK(parse_content_length("1000") == 1000u);
    CHECK(parse_content_length(" 42 ") == 42u);
    CHECK(parse_content_length("0") == 0u);
    CHECK_FALSE(parse_content_length("").has_value());
    CHECK_FALSE(parse_content_length("-1").has_value());
    CHECK_FALSE(parse_content_length("12abc").has_value());
}

TEST_CASE("parse_status_line", "[http]") {
    CHECK(parse_status_line("HTTP/1.1 206 Partial Content\r\n") == 206);
    CHECK(parse_status_line("HTTP/1.0 200 OK") == 200);
    CHECK(parse_status_line("HTTP/2 200\r\n") == 200);
    CHECK(parse_status_line("HTTP/1.1 100 Continue") == 100);
    CHECK(parse_status_line("Content-Length: 10") == 0);
    CHECK(parse_status_line("HTTP/1.1") == 0);
    CHECK(parse_status_line("HTTP/1.1 2x0 Odd") == 0);
}

TEST_CASE("parse_header_line", "[http]") {
    SECTION("Name is lower-cased and the value trimmed") {
        auto header = parse_header_line("Content-Range:  bytes 0-9/10 \r\n");
        REQUIRE(header.has_value());
        CHECK(header->first == "content-range");
        CHECK(header->second == "bytes 0-9/10");
    }

    SECTION("Colons in the value are kept") {
        auto header = parse_header_line("Location: http://example.com:8080/x");
        REQUIRE(header.has_value());
        CHECK(header->second == "http://example.com:8080/x");
    }

    SECTION("Lines without a name") {
        CHECK_FALSE(parse_header_line("no colon here").has_value());
        CHECK_FALSE(parse_header_line(": value").has_value());
    }
}

TEST_CASE("ResponseHeadParser", "[http]") {
    ResponseHeadParser parser;

    SECTION("Partial content head") {
        CHECK_FALSE(parser.feed("HTTP/1.1 206 Partial Content\r\n"));
        CHECK_FALSE(parser.feed("Content-Length: 700\r\n"));
        CHECK_FALSE(parser.feed("Content-Range: bytes 300-999/1000\r\n"));
        CHECK(parser.feed("\r\n"));

        REQUIRE(parser.complete());
        const auto& response = parser.response();
        CHECK(response.status_code == HTTP_PARTIAL_CONTENT);
        CHECK(response.content_length == 700);
        REQUIRE(response.content_range.has_value());
        CHECK(response.content_range->first == 300u);
        CHECK(response.content_range->complete_length == 1000u);
        CHECK(response.headers.at("content-length") == "700");
    }

    SECTION("Interim 100 Continue head is skipped") {
        parser.feed("HTTP/1.1 100 Continue\r\n");
        parser.feed("X-Interim: yes\r\n");
        CHECK_FALSE(parser.feed("\r\n"));
        CHECK_FALSE(parser.complete());

        parser.feed("HTTP/2 200\r\n");
        parser.feed("content-length: 1000\r\n");
        CHECK(parser.feed("\r\n"));

        CHECK(parser.response().status_code == HTTP_OK);
        CHECK(parser.response().content_length == 1000);
        CHECK_FALSE(parser.response().headers.contains("x-interim"));
    }

    SECTION("Unsatisfiable range head") {
        parser.feed("HTTP/1.1 416 Range Not Satisfiable\r\n");
        parser.feed("Content-Range: bytes */1000\r\n");
        parser.feed("\r\n");

        REQUIRE(parser.complete());
        CHECK(parser.response().status_code == HTTP_RANGE_NOT_SATISFIABLE);
        CHECK(parser.response().content_length == 0);
        REQUIRE(parser.response().content_range.has_value());
        CHECK_FALSE(parser.response().content_range->first.has_value());
        CHECK(parser.response().content_range->complete_length == 1000u);
    }

    SECTION("Redirect head") {
        parser.feed("HTTP/1.1 302 Found\r\n");
        parser.feed("Location: /real/file.bin\r\n");
        parser.feed("Content-Length: 38\r\n");
        parser.feed("\r\n");

        REQUIRE(parser.complete());
        CHECK(parser.response().status_code == 302);
        CHECK(check_status(parser.response().status_code) == DownloadErrc::http_error);
    }

    SECTION("Lines after completion are ignored") {
        parser.feed("HTTP/1.1 200 OK\r\n");
        parser.feed("\r\n");
        CHECK(parser.feed("HTTP/1.1 500 Trailer\r\n"));
        CHECK(parser.response().status_code == HTTP_OK);
    }
}

TEST_CASE("check_status", "[http]") {
    SECTION("Usable statuses") {
        CHECK_FALSE(check_status(HTTP_OK));
        CHECK_FALSE(check_status(HTTP_PARTIAL_CONTENT));
        CHECK_FALSE(check_status(HTTP_RANGE_NOT_SATISFIABLE));
    }

    SECTION("Everything else is an HTTP error") {
        for (std::int32_t status : {0, 100, 201, 204, 301, 302, 304, 307, 308, 400, 403, 404, 500, 503}) {
            auto ec = check_status(status);
            CHECK(ec == DownloadErrc::http_error);
            CHECK(ec == ErrorKind::request_failed);
        }
    }
}
