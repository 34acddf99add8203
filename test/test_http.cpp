#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <elio/elio.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "fileshare/http/message.h"
#include "fileshare/http/range.h"
#include "fileshare/transfer/multipart_reader.h"
#include "memory_streams.h"

using namespace fileshare;
using namespace fileshare::test;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

TEST_CASE("Parse Request Head", "[http][request]") {
    auto request = parse_request_head(
        "GET /api/download?x=1 HTTP/1.1\r\n"
        "Host: 192.168.1.10:8080\r\n"
        "Range: bytes=0-99\r\n"
        "Accept: text/html\r\n"
        "accept: application/json");

    REQUIRE(request.has_value());
    REQUIRE(request->method == "GET");
    REQUIRE(request->path == "/api/download");
    REQUIRE(request->query_string == "x=1");
    REQUIRE(request->version == "HTTP/1.1");
    REQUIRE(request->get_header("RANGE") == "bytes=0-99");
    REQUIRE(request->has_header("host"));
    REQUIRE_FALSE(request->has_header("content-length"));
    REQUIRE(request->get_header("accept") == "text/html, application/json");
    REQUIRE_FALSE(request->content_length().has_value());
}

TEST_CASE("Request Body Framing Headers", "[http][request]") {
    auto request = parse_request_head(
        "POST /api/upload HTTP/1.1\r\n"
        "Content-Length: 1234\r\n"
        "Content-Length: 1234\r\n"
        "Transfer-Encoding: gzip, Chunked");
    REQUIRE(request.has_value());
    REQUIRE(request->content_length() == std::optional<uint64_t>(1234));
    REQUIRE(request->is_chunked());

    auto signed_length = parse_request_head("POST / HTTP/1.1\r\nContent-Length: -5");
    REQUIRE(signed_length.has_value());
    REQUIRE_FALSE(signed_length->content_length().has_value());
}

TEST_CASE("Reject Malformed Request Heads", "[http][request]") {
    REQUIRE_FALSE(parse_request_head("GET /").has_value());
    REQUIRE_FALSE(parse_request_head("GET / HTTP/1.1 extra").has_value());
    REQUIRE_FALSE(parse_request_head("GET api HTTP/1.1").has_value());
    REQUIRE_FALSE(parse_request_head("GET / SPDY/3").has_value());
    REQUIRE_FALSE(parse_request_head("G(E)T / HTTP/1.1").has_value());
    REQUIRE_FALSE(parse_request_head("GET / HTTP/1.1\r\nNo colon here").has_value());
    REQUIRE_FALSE(parse_request_head("GET / HTTP/1.1\r\nBad Name: x").has_value());
    REQUIRE_FALSE(parse_request_head("GET / HTTP/1.1\r\nHost: a\r\n folded").has_value());
    REQUIRE_FALSE(parse_request_head(
        "POST / HTTP/1.1\r\nContent-Length: 10\r\nContent-Length: 11").has_value());
}

TEST_CASE("Serialize Responses", "[http][response]") {
    SECTION("Whole body responses carry length and close") {
        std::string wire = serialize_response(HttpResponse(200, "text/plain", "hello"));
        REQUIRE_THAT(wire, StartsWith("HTTP/1.1 200 OK\r\n"));
        REQUIRE_THAT(wire, ContainsSubstring("Content-Type: text/plain\r\n"));
        REQUIRE_THAT(wire, ContainsSubstring("Content-Length: 5\r\n"));
        REQUIRE_THAT(wire, ContainsSubstring("Connection: close\r\n"));
        REQUIRE(wire.substr(wire.size() - 9) == "\r\n\r\nhello");
    }

    SECTION("Streamed heads end at the blank line") {
        HttpResponse head(206, "application/octet-stream", "");
        head.set_header("Content-Length", "100");
        std::string wire = serialize_streamed_head(head);
        REQUIRE_THAT(wire, StartsWith("HTTP/1.1 206 Partial Content\r\n"));
        REQUIRE_THAT(wire, ContainsSubstring("Content-Length: 100\r\n"));
        REQUIRE(wire.substr(wire.size() - 4) == "\r\n\r\n");
    }

    SECTION("Error bodies are JSON") {
        auto response = error_response(503, "Another client is already connected");
        REQUIRE(response.status_code == 503);
        REQUIRE(response.status_message == "Service Unavailable");
        REQUIRE(response.get_header("Content-Type") == "application/json");
        auto body = nlohmann::json::parse(response.body);
        REQUIRE(body["error"] == "Another client is already connected");
    }

    REQUIRE(std::string(status_reason(416)) == "Range Not Satisfiable");
    REQUIRE(std::string(status_reason(431)) == "Request Header Fields Too Large");
    REQUIRE(std::string(status_reason(999)) == "Unknown");
}

TEST_CASE("Quote Header Values", "[http][response]") {
    REQUIRE(quote_header_value("report.pdf") == "\"report.pdf\"");
    REQUIRE(quote_header_value("say \"hi\".txt") == "\"say \\\"hi\\\".txt\"");
    REQUIRE(quote_header_value("a\\b") == "\"a\\\\b\"");

    SECTION("Line breaks cannot start a new header") {
        std::string quoted = quote_header_value("evil\r\nSet-Cookie: x=1.bin");
        REQUIRE(quoted == "\"evilSet-Cookie: x=1.bin\"");
        REQUIRE(quoted.find('\r') == std::string::npos);
        REQUIRE(quoted.find('\n') == std::string::npos);
    }

    REQUIRE(quote_header_value(std::string("tab\tnul\0del\x7f", 12)) == "\"tabnuldel\"");
}

TEST_CASE("Parse Range Header", "[http][range]") {
    const uint64_t size = 1000;

    SECTION("Closed range") {
        auto r = parse_range_header("bytes=0-99", size);
        REQUIRE(r.kind == RangeKind::Satisfiable);
        REQUIRE(r.range.first == 0);
        REQUIRE(r.range.last == 99);
        REQUIRE(r.range.length() == 100);
        REQUIRE(content_range(r.range, size) == "bytes 0-99/1000");
    }

    SECTION("Open-ended range") {
        auto r = parse_range_header("bytes=900-", size);
        REQUIRE(r.kind == RangeKind::Satisfiable);
        REQUIRE(r.range.first == 900);
        REQUIRE(r.range.last == 999);
    }

    SECTION("Last position is clamped to the file") {
        auto r = parse_range_header("bytes=500-5000", size);
        REQUIRE(r.kind == RangeKind::Satisfiable);
        REQUIRE(r.range.last == 999);
    }

    SECTION("Suffix range") {
        auto r = parse_range_header("bytes=-100", size);
        REQUIRE(r.kind == RangeKind::Satisfiable);
        REQUIRE(r.range.first == 900);
        REQUIRE(r.range.last == 999);

        auto whole = parse_range_header("bytes=-5000", size);
        REQUIRE(whole.kind == RangeKind::Satisfiable);
        REQUIRE(whole.range.first == 0);
        REQUIRE(whole.range.length() == size);
    }

    SECTION("Unsatisfiable ranges") {
        REQUIRE(parse_range_header("bytes=1000-", size).kind == RangeKind::Unsatisfiable);
        REQUIRE(parse_range_header("bytes=2000-3000", size).kind == RangeKind::Unsatisfiable);
        REQUIRE(parse_range_header("bytes=-0", size).kind == RangeKind::Unsatisfiable);
        REQUIRE(parse_range_header("bytes=0-", 0).kind == RangeKind::Unsatisfiable);
        REQUIRE(unsatisfied_range(size) == "bytes */1000");
    }

    SECTION("Ignored headers serve the whole file") {
        REQUIRE(parse_range_header("", size).kind == RangeKind::None);
        REQUIRE(parse_range_header("items=0-10", size).kind == RangeKind::None);
        REQUIRE(parse_range_header("bytes=0-10,20-30", size).kind == RangeKind::None);
        REQUIRE(parse_range_header("bytes=abc-", size).kind == RangeKind::None);
        REQUIRE(parse_range_header("bytes=50-10", size).kind == RangeKind::None);
        REQUIRE(parse_range_header("bytes=10", size).kind == RangeKind::None);
    }
}

TEST_CASE("Extract Multipart Boundary", "[http][multipart]") {
    REQUIRE(extract_boundary("multipart/form-data; boundary=----abc123") ==
            std::optional<std::string>("----abc123"));
    REQUIRE(extract_boundary("Multipart/Form-Data; charset=utf-8; BOUNDARY=\"quoted value\"") ==
            std::optional<std::string>("quoted value"));
    REQUIRE_FALSE(extract_boundary("application/json").has_value());
    REQUIRE_FALSE(extract_boundary("multipart/form-data").has_value());
    REQUIRE_FALSE(extract_boundary("multipart/mixed; boundary=x").has_value());
    REQUIRE_FALSE(extract_boundary("multipart/form-data; boundary=" + std::string(201, 'b')).has_value());
}

TEST_CASE("Multipart Reader Streams Parts", "[http][multipart]") {
    const std::string boundary = "XyZ";
    const std::string file_data = "line one\r\nline two\r\nx--XyZ is not a delimiter here\r\n-";
    std::string body = "preamble text\r\n" +
                       multipart_field(boundary, "size", "57") +
                       multipart_file(boundary, "file", "notes.txt", file_data) +
                       multipart_end(boundary) +
                       "epilogue";

    // Tiny reads make delimiters straddle buffer refills
    auto max_read = GENERATE(as<size_t>{}, 1, 3, 7, 4096);
    MemoryInputStream input(body, max_read);

    std::optional<MultipartPart> size_part;
    std::optional<std::string> size_text;
    std::optional<MultipartPart> file_part;
    std::string received;
    uint64_t data_offset = 0;
    std::optional<MultipartPart> after;
    bool done = false;

    elio::run([&]() -> elio::coro::task<void> {
        MultipartReader reader(input, boundary, 16);
        size_part = co_await reader.next_part();
        size_text = co_await reader.read_text(32);
        file_part = co_await reader.next_part();
        data_offset = reader.body_offset();

        char buf[5];
        while (true) {
            ssize_t n = co_await reader.read(buf, sizeof(buf));
            if (n <= 0) break;
            received.append(buf, static_cast<size_t>(n));
        }
        after = co_await reader.next_part();
        done = reader.done();
    }());

    REQUIRE(size_part.has_value());
    REQUIRE(size_part->name == "size");
    REQUIRE_FALSE(size_part->is_file());
    REQUIRE(size_text == std::optional<std::string>("57"));

    REQUIRE(file_part.has_value());
    REQUIRE(file_part->name == "file");
    REQUIRE(file_part->filename == "notes.txt");
    REQUIRE(file_part->content_type == "application/octet-stream");
    REQUIRE(file_part->is_file());
    REQUIRE(data_offset == body.find("line one"));

    REQUIRE(received == file_data);
    REQUIRE_FALSE(after.has_value());
    REQUIRE(done);
}

TEST_CASE("Multipart Reader Skips Unread Parts", "[http][multipart]") {
    const std::string boundary = "b0undary";
    std::string body = multipart_field(boundary, "note", std::string(300, 'n')) +
                       "--" + boundary + "  \t\r\n"
                       "Content-Disposition: form-data; name=\"file\"; filename=\"x.bin\"\r\n\r\n"
                       "DATA\r\n" +
                       multipart_end(boundary);
    MemoryInputStream input(body, 11);

    std::optional<MultipartPart> first;
    std::optional<MultipartPart> second;
    std::string data;

    elio::run([&]() -> elio::coro::task<void> {
        MultipartReader reader(input, boundary, 32);
        first = co_await reader.next_part();
        second = co_await reader.next_part();
        char buf[64];
        while (true) {
            ssize_t n = co_await reader.read(buf, sizeof(buf));
            if (n <= 0) break;
            data.append(buf, static_cast<size_t>(n));
        }
    }());

    REQUIRE(first.has_value());
    REQUIRE(first->name == "note");
    REQUIRE(second.has_value());
    REQUIRE(second->filename == "x.bin");
    REQUIRE(data == "DATA");
}

TEST_CASE("Multipart Reader Errors", "[http][multipart]") {
    const std::string boundary = "B";
    ErrorCode error = ErrorCode::Success;
    std::optional<MultipartPart> part;
    ssize_t last_read = 0;

    SECTION("No boundary in the body") {
        MemoryInputStream input("just some bytes without any delimiter");
        elio::run([&]() -> elio::coro::task<void> {
            MultipartReader reader(input, boundary);
            part = co_await reader.next_part();
            error = reader.error();
        }());
        REQUIRE_FALSE(part.has_value());
        REQUIRE(error == ErrorCode::MalformedMultipart);
    }

    SECTION("Body ends inside a part") {
        MemoryInputStream input(multipart_file(boundary, "file", "a.txt", "partial data"), 5);
        elio::run([&]() -> elio::coro::task<void> {
            MultipartReader reader(input, boundary);
            part = co_await reader.next_part();
            char buf[64];
            while ((last_read = co_await reader.read(buf, sizeof(buf))) > 0) {
            }
            error = reader.error();
        }());
        REQUIRE(part.has_value());
        REQUIRE(last_read < 0);
        REQUIRE(error == ErrorCode::UnexpectedEof);
    }

    SECTION("Connection reset while reading") {
        std::string body = multipart_file(boundary, "file", "a.txt", std::string(1000, 'z')) +
                           multipart_end(boundary);
        MemoryInputStream input(body, 64);
        input.fail_after(200);
        elio::run([&]() -> elio::coro::task<void> {
            MultipartReader reader(input, boundary, 64);
            part = co_await reader.next_part();
            char buf[64];
            while ((last_read = co_await reader.read(buf, sizeof(buf))) > 0) {
            }
            error = reader.error();
        }());
        REQUIRE(last_read < 0);
        REQUIRE(error == ErrorCode::ReceiveFailed);
    }

    SECTION("Oversized part headers") {
        std::string body = "--B\r\nContent-Disposition: form-data; name=\"f\"\r\nX-Pad: " +
                           std::string(MultipartReader::MAX_PART_HEADER_BYTES + 10, 'p');
        MemoryInputStream input(body);
        elio::run([&]() -> elio::coro::task<void> {
            MultipartReader reader(input, boundary);
            part = co_await reader.next_part();
            error = reader.error();
        }());
        REQUIRE_FALSE(part.has_value());
        REQUIRE(error == ErrorCode::MalformedMultipart);
    }

    SECTION("Part without a form-data disposition") {
        MemoryInputStream input("--B\r\nContent-Type: text/plain\r\n\r\nx\r\n--B--\r\n");
        elio::run([&]() -> elio::coro::task<void> {
            MultipartReader reader(input, boundary);
            part = co_await reader.next_part();
            error = reader.error();
        }());
        REQUIRE_FALSE(part.has_value());
        REQUIRE(error == ErrorCode::MalformedMultipart);
    }
}
