#ifndef FILESHARE_HTTP_CONNECTION_H
#define FILESHARE_HTTP_CONNECTION_H

#include "fileshare/base/error_code.h"
#include "fileshare/http/message.h"
#include "fileshare/transfer/io_stream.h"
#include <elio/elio.hpp>
#include <cstdint>
#include <string>

namespace fileshare {

struct RequestReadResult {
    ErrorCode error = ErrorCode::Success;
    HttpRequest request;

    bool ok() const { return error == ErrorCode::Success; }
};

class HttpConnection;

// Request body bounded by Content-Length
class BodyReader : public InputStream {
public:
    BodyReader(HttpConnection& connection, uint64_t length)
        : connection_(connection), remaining_(length) {}

    elio::coro::task<ssize_t> read(void* buffer, size_t size) override;

    uint64_t remaining() const { return remaining_; }

    // Reads and discards the rest of the body. False if the peer went away.
    elio::coro::task<bool> drain();

private:
    HttpConnection& connection_;
    uint64_t remaining_;
};

// One HTTP/1.1 exchange over an accepted TCP stream.
// Every response carries "Connection: close".
class HttpConnection : public OutputStream {
public:
    HttpConnection(elio::net::tcp_stream stream, size_t max_header_bytes);

    HttpConnection(const HttpConnection&) = delete;
    HttpConnection& operator=(const HttpConnection&) = delete;

    // Reads up to the blank line ending the head. Bytes after it are kept
    // for the body.
    elio::coro::task<RequestReadResult> read_request();

    // Raw read that serves buffered bytes first
    elio::coro::task<ssize_t> read_some(void* buffer, size_t size);

    // Whole-body response; Content-Length is filled in
    elio::coro::task<bool> send_response(HttpResponse response);

    // Head only, for streamed bodies
    elio::coro::task<bool> send_head(HttpResponse response);

    elio::coro::task<bool> write(const void* data, size_t size) override;
    std::string error_message() const override { return error_message_; }

    elio::coro::task<void> close();

    // "a.b.c.d:port" style remote address, "unknown" when unavailable
    const std::string& peer_address() const { return peer_address_; }

    uint64_t bytes_sent() const { return bytes_sent_; }

private:
    elio::net::tcp_stream stream_;
    size_t max_header_bytes_;
    std::string buffer_;
    size_t buffer_pos_ = 0;
    std::string peer_address_;
    std::string error_message_;
    uint64_t bytes_sent_ = 0;
    bool closed_ = false;
};

} // namespace fileshare

#endif // FILESHARE_HTTP_CONNECTION_H
