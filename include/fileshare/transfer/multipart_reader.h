#ifndef FILESHARE_TRANSFER_MULTIPART_READER_H
#define FILESHARE_TRANSFER_MULTIPART_READER_H

#include "fileshare/base/error_code.h"
#include "fileshare/transfer/io_stream.h"
#include <elio/elio.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace fileshare {

struct MultipartPart {
    std::string name;          // form field name
    std::string filename;      // empty for plain fields
    std::string content_type;

    bool is_file() const { return !filename.empty(); }
};

// boundary parameter of a multipart/form-data Content-Type
std::optional<std::string> extract_boundary(const std::string& content_type);

// Incremental multipart/form-data parser over a request body.
// Part data is handed out as it arrives; at most one chunk plus a
// delimiter's worth of bytes is buffered.
class MultipartReader {
public:
    static constexpr size_t MAX_PART_HEADER_BYTES = 16 * 1024;

    MultipartReader(InputStream& input, std::string boundary, size_t chunk_size = 64 * 1024);

    MultipartReader(const MultipartReader&) = delete;
    MultipartReader& operator=(const MultipartReader&) = delete;

    // Skips what is left of the current part and parses the next part's
    // headers. nullopt at the closing delimiter or on error (see error()).
    elio::coro::task<std::optional<MultipartPart>> next_part();

    // Data of the current part: bytes copied, 0 at the end of the part,
    // -1 on error
    elio::coro::task<ssize_t> read(void* buffer, size_t size);

    // Whole value of a small text field, at most limit bytes
    elio::coro::task<std::optional<std::string>> read_text(size_t limit);

    // Offset into the body of the next byte not yet handed out
    uint64_t body_offset() const;

    // Closing delimiter size: "\r\n--" boundary "--\r\n"
    uint64_t trailer_size() const { return boundary_size_ + 8; }

    ErrorCode error() const { return error_; }
    const std::string& error_message() const { return error_message_; }
    bool done() const { return state_ == State::Done; }

private:
    enum class State {
        Preamble,
        AfterDelimiter,
        Body,
        Done,
        Failed
    };

    elio::coro::task<bool> fill();
    bool parse_part_headers(const std::string& block, MultipartPart& part);
    void set_error(ErrorCode code, const std::string& message);
    size_t unread() const { return buffer_.size() - pos_; }

    InputStream& input_;
    std::string delimiter_;    // "\r\n--" + boundary
    size_t boundary_size_;
    size_t chunk_size_;
    std::string buffer_;
    size_t pos_ = 0;
    int64_t base_offset_ = -2;  // two injected CRLF bytes precede the body
    bool input_eof_ = false;
    State state_ = State::Preamble;
    ErrorCode error_ = ErrorCode::Success;
    std::string error_message_;
};

} // namespace fileshare

#endif // FILESHARE_TRANSFER_MULTIPART_READER_H
