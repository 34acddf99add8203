#include "fileshare/transfer/upload_engine.h"
#include "fileshare/base/logger.h"
#include "fileshare/transfer/multipart_reader.h"
#include "fileshare/util/fs_utils.h"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <optional>
#include <system_error>
#include <vector>

namespace fileshare {

namespace {

constexpr size_t MAX_SIZE_FIELD = 32;

std::optional<uint64_t> parse_size_field(const std::string& text) {
    std::string digits;
    for (char c : text) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') continue;
        if (c < '0' || c > '9') return std::nullopt;
        digits += c;
    }
    if (digits.empty() || digits.size() > 19) {
        return std::nullopt;
    }
    return std::stoull(digits);
}

UploadResult bad_request(const std::string& message) {
    UploadResult result;
    result.status = UploadStatus::BadRequest;
    result.message = message;
    return result;
}

} // anonymous namespace

UploadEngine::UploadEngine(std::shared_ptr<TransferSession> session)
    : session_(std::move(session)),
      chunk_size_(session_->config().chunk_size > 0 ? session_->config().chunk_size : 64 * 1024) {}

std::string UploadEngine::sanitize_filename(const std::string& name) {
    size_t slash = name.find_last_of("/\\");
    std::string base = slash == std::string::npos ? name : name.substr(slash + 1);
    if (base.empty() || base == "." || base == "..") {
        return {};
    }
    return base;
}

elio::coro::task<UploadResult> UploadEngine::receive(InputStream& body,
                                                     const std::string& content_type,
                                                     uint64_t content_length,
                                                     const std::string& peer_id) {
    auto boundary = extract_boundary(content_type);
    if (!boundary) {
        co_return bad_request("Failed to get file: request is not multipart/form-data");
    }

    MultipartReader reader(body, *boundary, chunk_size_);
    std::optional<uint64_t> declared_size;
    std::optional<MultipartPart> file_part;

    while (!file_part) {
        auto part = co_await reader.next_part();
        if (!part) {
            if (reader.error() != ErrorCode::Success) {
                co_return bad_request("Failed to get file: " + reader.error_message());
            }
            co_return bad_request("Failed to get file: no file part");
        }

        if (part->name == "file" && part->is_file()) {
            file_part = std::move(part);
        } else if (part->name == "size" && !part->is_file()) {
            auto text = co_await reader.read_text(MAX_SIZE_FIELD);
            if (!text) {
                co_return bad_request("Failed to get file: " + reader.error_message());
            }
            declared_size = parse_size_field(*text);
        }
    }

    std::string filename = sanitize_filename(file_part->filename);
    if (filename.empty()) {
        co_return bad_request("Invalid filename: " + file_part->filename);
    }

    UploadResult result;
    result.filename = filename;
    result.saved_path = session_->target_path() / filename;

    std::error_code ec;
    if (std::filesystem::exists(std::filesystem::symlink_status(result.saved_path, ec))) {
        result.status = UploadStatus::Conflict;
        result.message = "File '" + filename + "' already exists";
        Logger::instance().warning("Upload from {} rejected: {} exists", peer_id,
                                   result.saved_path.string());
        co_return result;
    }

    if (!declared_size) {
        uint64_t overhead = reader.body_offset() + reader.trailer_size();
        declared_size = content_length > overhead ? content_length - overhead : 0;
    }

    uint64_t attempt = session_->begin_transfer(*declared_size);
    session_->add_log("Started upload from " + peer_id + ": " + filename);

    std::ofstream file(result.saved_path, std::ios::binary | std::ios::trunc);
    if (!file) {
        result.status = UploadStatus::Failed;
        result.message = "Failed to create file: " + std::string(std::strerror(errno));
        session_->fail_transfer(attempt, result.message);
        co_return result;
    }

    std::vector<char> buffer(chunk_size_);
    uint64_t received = 0;

    while (true) {
        if (!session_->is_current(attempt)) {
            Logger::instance().debug("Upload from {} superseded after {} bytes", peer_id, received);
            result.status = UploadStatus::Cancelled;
            result.size = received;
            co_return result;
        }

        ssize_t n = co_await reader.read(buffer.data(), buffer.size());
        if (n < 0) {
            result.status = UploadStatus::Failed;
            result.size = received;
            result.message = reader.error_message();
            session_->fail_transfer(attempt, result.message);
            co_return result;
        }
        if (n == 0) {
            break;
        }

        file.write(buffer.data(), n);
        if (!file) {
            result.status = UploadStatus::Failed;
            result.size = received;
            result.message = "write error on " + result.saved_path.string() + ": " +
                             std::strerror(errno);
            session_->fail_transfer(attempt, result.message);
            co_return result;
        }

        received += static_cast<uint64_t>(n);
        session_->report_progress(attempt, received);
    }

    file.close();
    if (!file) {
        result.status = UploadStatus::Failed;
        result.size = received;
        result.message = "failed to finish " + result.saved_path.string();
        session_->fail_transfer(attempt, result.message);
        co_return result;
    }

    result.size = received;
    if (!session_->complete_transfer(attempt)) {
        result.status = UploadStatus::Cancelled;
        co_return result;
    }

    session_->add_log("Upload completed from " + peer_id + ": " + filename +
                      " (" + format_size(received) + ")");
    co_return result;
}

} // namespace fileshare
