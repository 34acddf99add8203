#ifndef FILESHARE_TRANSFER_UPLOAD_ENGINE_H
#define FILESHARE_TRANSFER_UPLOAD_ENGINE_H

#include "fileshare/session/transfer_session.h"
#include "fileshare/transfer/io_stream.h"
#include <elio/elio.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace fileshare {

enum class UploadStatus {
    Completed,
    BadRequest,   // no usable file part or file name
    Conflict,     // destination already exists, nothing written
    Failed,       // I/O error after the transfer started
    Cancelled
};

struct UploadResult {
    UploadStatus status = UploadStatus::Completed;
    std::string filename;
    std::filesystem::path saved_path;
    uint64_t size = 0;
    std::string message;
};

// Receives one multipart/form-data upload into the session's directory
class UploadEngine {
public:
    explicit UploadEngine(std::shared_ptr<TransferSession> session);

    elio::coro::task<UploadResult> receive(InputStream& body,
                                           const std::string& content_type,
                                           uint64_t content_length,
                                           const std::string& peer_id);

    // Last path component of a client-supplied name; empty if unusable
    static std::string sanitize_filename(const std::string& name);

private:
    std::shared_ptr<TransferSession> session_;
    size_t chunk_size_;
};

} // namespace fileshare

#endif // FILESHARE_TRANSFER_UPLOAD_ENGINE_H
