#include "fileshare/http/connection.h"
#include "fileshare/base/logger.h"
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>

namespace fileshare {

namespace {

std::string describe_io_error(ssize_t result) {
    if (result == 0) {
        return "connection closed by peer";
    }
    return std::strerror(static_cast<int>(-result));
}

} // anonymous namespace

elio::coro::task<ssize_t> BodyReader::read(void* buffer, size_t size) {
    if (remaining_ == 0 || size == 0) {
        co_return 0;
    }
    size_t want = static_cast<size_t>(std::min<uint64_t>(remaining_, size));
    ssize_t n = co_await connection_.read_some(buffer, want);
    if (n == 0) {
        // Peer closed before Content-Length bytes arrived
        co_return -ECONNRESET;
    }
    if (n > 0) {
        remaining_ -= static_cast<uint64_t>(n);
    }
    co_return n;
}

elio::coro::task<bool> BodyReader::drain() {
    std::array<char, 16384> scratch;
    while (remaining_ > 0) {
        ssize_t n = co_await read(scratch.data(), scratch.size());
        if (n <= 0) {
            co_return false;
        }
    }
    co_return true;
}

HttpConnection::HttpConnection(elio::net::tcp_stream stream, size_t max_header_bytes)
    : stream_(std::move(stream)), max_header_bytes_(max_header_bytes) {
    auto peer = stream_.peer_address();
    peer_address_ = peer ? peer->to_string() : "unknown";
}

elio::coro::task<RequestReadResult> HttpConnection::read_request() {
    RequestReadResult result;
    std::array<char, 8192> chunk;
    size_t search_from = 0;

    while (true) {
        // Empty lines before the request line are ignored
        while (buffer_.size() >= 2 && buffer_.compare(0, 2, "\r\n") == 0) {
            buffer_.erase(0, 2);
            search_from = 0;
        }

        size_t end = buffer_.find("\r\n\r\n", search_from);
        if (end != std::string::npos) {
            if (end > max_header_bytes_) {
                result.error = ErrorCode::HeaderTooLarge;
                co_return result;
            }
            auto parsed = parse_request_head(std::string_view(buffer_).substr(0, end));
            buffer_pos_ = end + 4;
            if (!parsed) {
                result.error = ErrorCode::MalformedRequest;
                co_return result;
            }
            result.request = std::move(*parsed);
            co_return result;
        }

        if (buffer_.size() > max_header_bytes_) {
            result.error = ErrorCode::HeaderTooLarge;
            co_return result;
        }
        search_from = buffer_.size() >= 3 ? buffer_.size() - 3 : 0;

        auto read_result = co_await stream_.read(chunk.data(), chunk.size());
        if (read_result.result <= 0) {
            if (buffer_.empty()) {
                result.error = ErrorCode::ConnectionClosed;
            } else {
                result.error = read_result.result < 0 ? ErrorCode::ReceiveFailed
                                                      : ErrorCode::MalformedRequest;
            }
            co_return result;
        }
        buffer_.append(chunk.data(), static_cast<size_t>(read_result.result));
    }
}

elio::coro::task<ssize_t> HttpConnection::read_some(void* buffer, size_t size) {
    if (size == 0) {
        co_return 0;
    }
    if (buffer_pos_ < buffer_.size()) {
        size_t n = std::min(size, buffer_.size() - buffer_pos_);
        std::memcpy(buffer, buffer_.data() + buffer_pos_, n);
        buffer_pos_ += n;
        if (buffer_pos_ == buffer_.size()) {
            buffer_.clear();
            buffer_pos_ = 0;
        }
        co_return static_cast<ssize_t>(n);
    }

    auto read_result = co_await stream_.read(buffer, size);
    co_return read_result.result;
}

elio::coro::task<bool> HttpConnection::send_response(HttpResponse response) {
    std::string data = serialize_response(std::move(response));
    co_return co_await write(data.data(), data.size());
}

elio::coro::task<bool> HttpConnection::send_head(HttpResponse response) {
    std::string head = serialize_streamed_head(std::move(response));
    co_return co_await write(head.data(), head.size());
}

elio::coro::task<bool> HttpConnection::write(const void* data, size_t size) {
    const auto* bytes = static_cast<const char*>(data);
    size_t written = 0;

    while (written < size) {
        auto write_result = co_await stream_.write(bytes + written, size - written);
        if (write_result.result <= 0) {
            error_message_ = describe_io_error(write_result.result);
            Logger::instance().debug("Write to {} failed: {}", peer_address_, error_message_);
            co_return false;
        }
        written += static_cast<size_t>(write_result.result);
        bytes_sent_ += static_cast<uint64_t>(write_result.result);
    }
    co_return true;
}

elio::coro::task<void> HttpConnection::close() {
    if (closed_) {
        co_return;
    }
    closed_ = true;
    co_await stream_.close();
}

} // namespace fileshare
