#include "fileshare/transfer/multipart_reader.h"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <string_view>
#include <vector>

namespace fileshare {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

// `type; key=value; key="quoted value"` -> lower-cased keys with values
std::vector<std::pair<std::string, std::string>> parse_parameters(std::string_view header) {
    std::vector<std::pair<std::string, std::string>> params;

    size_t pos = header.find(';');
    while (pos != std::string_view::npos && pos < header.size()) {
        pos++;
        while (pos < header.size() && (header[pos] == ' ' || header[pos] == '\t')) pos++;

        size_t key_end = pos;
        while (key_end < header.size() && header[key_end] != '=' && header[key_end] != ';') key_end++;
        std::string key = to_lower(trim(header.substr(pos, key_end - pos)));

        std::string value;
        pos = key_end;
        if (pos < header.size() && header[pos] == '=') {
            pos++;
            while (pos < header.size() && (header[pos] == ' ' || header[pos] == '\t')) pos++;
            if (pos < header.size() && header[pos] == '"') {
                pos++;
                while (pos < header.size() && header[pos] != '"') {
                    if (header[pos] == '\\' && pos + 1 < header.size()) {
                        pos++;
                    }
                    value += header[pos++];
                }
                if (pos < header.size()) pos++;  // closing quote
                pos = header.find(';', pos);
            } else {
                size_t end = header.find(';', pos);
                value = std::string(trim(header.substr(pos, end == std::string_view::npos ? std::string_view::npos : end - pos)));
                pos = end;
            }
        }

        if (!key.empty()) {
            params.emplace_back(std::move(key), std::move(value));
        }
    }
    return params;
}

} // anonymous namespace

std::optional<std::string> extract_boundary(const std::string& content_type) {
    std::string_view view(content_type);
    size_t semi = view.find(';');
    std::string media_type = to_lower(trim(view.substr(0, semi)));
    if (media_type != "multipart/form-data") {
        return std::nullopt;
    }

    for (auto& [key, value] : parse_parameters(view)) {
        if (key == "boundary") {
            if (value.empty() || value.size() > 200) {
                return std::nullopt;
            }
            return value;
        }
    }
    return std::nullopt;
}

MultipartReader::MultipartReader(InputStream& input, std::string boundary, size_t chunk_size)
    : input_(input),
      delimiter_("\r\n--" + boundary),
      boundary_size_(boundary.size()),
      chunk_size_(chunk_size > 0 ? chunk_size : 64 * 1024),
      buffer_("\r\n") {}  // lets the first delimiter match without a leading CRLF

uint64_t MultipartReader::body_offset() const {
    int64_t offset = base_offset_ + static_cast<int64_t>(pos_);
    return offset > 0 ? static_cast<uint64_t>(offset) : 0;
}

void MultipartReader::set_error(ErrorCode code, const std::string& message) {
    state_ = State::Failed;
    error_ = code;
    error_message_ = message;
}

elio::coro::task<bool> MultipartReader::fill() {
    if (input_eof_) {
        co_return false;
    }
    if (pos_ > 0) {
        base_offset_ += static_cast<int64_t>(pos_);
        buffer_.erase(0, pos_);
        pos_ = 0;
    }

    std::vector<char> chunk(chunk_size_);
    ssize_t n = co_await input_.read(chunk.data(), chunk.size());
    if (n == 0) {
        input_eof_ = true;
        co_return false;
    }
    if (n < 0) {
        set_error(ErrorCode::ReceiveFailed, std::strerror(static_cast<int>(-n)));
        co_return false;
    }
    buffer_.append(chunk.data(), static_cast<size_t>(n));
    co_return true;
}

elio::coro::task<std::optional<MultipartPart>> MultipartReader::next_part() {
    if (state_ == State::Body) {
        std::vector<char> scratch(chunk_size_);
        while (true) {
            ssize_t n = co_await read(scratch.data(), scratch.size());
            if (n < 0) co_return std::nullopt;
            if (n == 0) break;
        }
    }

    if (state_ == State::Preamble) {
        while (true) {
            size_t idx = buffer_.find(delimiter_, pos_);
            if (idx != std::string::npos) {
                pos_ = idx + delimiter_.size();
                state_ = State::AfterDelimiter;
                break;
            }
            // Keep a possible partial delimiter at the tail
            if (buffer_.size() > delimiter_.size()) {
                pos_ = std::max(pos_, buffer_.size() - (delimiter_.size() - 1));
            }
            if (!co_await fill()) {
                if (state_ != State::Failed) {
                    set_error(ErrorCode::MalformedMultipart, "multipart boundary not found");
                }
                co_return std::nullopt;
            }
        }
    }

    if (state_ != State::AfterDelimiter) {
        co_return std::nullopt;
    }

    while (unread() < 2) {
        if (!co_await fill()) {
            if (state_ != State::Failed) {
                set_error(ErrorCode::UnexpectedEof, "multipart body truncated");
            }
            co_return std::nullopt;
        }
    }

    if (buffer_.compare(pos_, 2, "--") == 0) {
        pos_ += 2;
        state_ = State::Done;
        co_return std::nullopt;
    }

    // Transport padding may follow the boundary
    while (true) {
        while (pos_ < buffer_.size() && (buffer_[pos_] == ' ' || buffer_[pos_] == '\t')) pos_++;
        if (unread() >= 2) break;
        if (!co_await fill()) {
            if (state_ != State::Failed) {
                set_error(ErrorCode::UnexpectedEof, "multipart body truncated");
            }
            co_return std::nullopt;
        }
    }
    if (buffer_.compare(pos_, 2, "\r\n") != 0) {
        set_error(ErrorCode::MalformedMultipart, "malformed multipart boundary line");
        co_return std::nullopt;
    }
    pos_ += 2;

    // Header block ends with an empty line; it may itself be empty
    std::string block;
    while (true) {
        if (unread() >= 2 && buffer_.compare(pos_, 2, "\r\n") == 0) {
            pos_ += 2;
            break;
        }
        size_t end = buffer_.find("\r\n\r\n", pos_);
        if (end != std::string::npos) {
            block = buffer_.substr(pos_, end - pos_);
            pos_ = end + 4;
            break;
        }
        if (unread() > MAX_PART_HEADER_BYTES) {
            set_error(ErrorCode::MalformedMultipart, "multipart part headers too large");
            co_return std::nullopt;
        }
        if (!co_await fill()) {
            if (state_ != State::Failed) {
                set_error(ErrorCode::UnexpectedEof, "multipart body truncated");
            }
            co_return std::nullopt;
        }
    }

    MultipartPart part;
    if (!parse_part_headers(block, part)) {
        set_error(ErrorCode::MalformedMultipart, "malformed multipart part headers");
        co_return std::nullopt;
    }

    state_ = State::Body;
    co_return part;
}

elio::coro::task<ssize_t> MultipartReader::read(void* buffer, size_t size) {
    if (state_ != State::Body) {
        co_return state_ == State::Failed ? -1 : 0;
    }
    if (size == 0) {
        co_return 0;
    }

    auto* out = static_cast<char*>(buffer);
    while (true) {
        size_t idx = buffer_.find(delimiter_, pos_);
        if (idx != std::string::npos) {
            size_t available = idx - pos_;
            if (available == 0) {
                pos_ += delimiter_.size();
                state_ = State::AfterDelimiter;
                co_return 0;
            }
            size_t n = std::min(available, size);
            std::memcpy(out, buffer_.data() + pos_, n);
            pos_ += n;
            co_return static_cast<ssize_t>(n);
        }

        size_t hold = delimiter_.size() - 1;
        size_t safe = unread() > hold ? unread() - hold : 0;
        if (safe > 0) {
            size_t n = std::min(safe, size);
            std::memcpy(out, buffer_.data() + pos_, n);
            pos_ += n;
            co_return static_cast<ssize_t>(n);
        }

        if (!co_await fill()) {
            if (state_ != State::Failed) {
                set_error(ErrorCode::UnexpectedEof, "multipart body ended inside a part");
            }
            co_return -1;
        }
    }
}

elio::coro::task<std::optional<std::string>> MultipartReader::read_text(size_t limit) {
    std::string value;
    char chunk[1024];
    while (true) {
        ssize_t n = co_await read(chunk, sizeof(chunk));
        if (n < 0) {
            co_return std::nullopt;
        }
        if (n == 0) {
            co_return value;
        }
        value.append(chunk, static_cast<size_t>(n));
        if (value.size() > limit) {
            set_error(ErrorCode::MalformedMultipart, "multipart field too large");
            co_return std::nullopt;
        }
    }
}

bool MultipartReader::parse_part_headers(const std::string& block, MultipartPart& part) {
    bool has_disposition = false;
    std::string_view view(block);

    size_t pos = 0;
    while (pos < view.size()) {
        size_t end = view.find("\r\n", pos);
        std::string_view line = view.substr(pos, end == std::string_view::npos ? std::string_view::npos : end - pos);
        pos = end == std::string_view::npos ? view.size() : end + 2;
        if (line.empty()) continue;

        size_t colon = line.find(':');
        if (colon == std::string_view::npos) {
            return false;
        }
        std::string name = to_lower(trim(line.substr(0, colon)));
        std::string_view value = trim(line.substr(colon + 1));

        if (name == "content-disposition") {
            size_t semi = value.find(';');
            if (to_lower(trim(value.substr(0, semi))) != "form-data") {
                return false;
            }
            has_disposition = true;
            for (auto& [key, param] : parse_parameters(value)) {
                if (key == "name") {
                    part.name = param;
                } else if (key == "filename") {
                    part.filename = param;
                }
            }
        } else if (name == "content-type") {
            part.content_type = std::string(value);
        }
    }
    return has_disposition;
}

} // namespace fileshare
