#include "fileshare/base/error_code.h"

namespace fileshare {

namespace {

class FileShareCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "FileShare";
    }

    std::string message(int ev) const override {
        return to_string(static_cast<ErrorCode>(ev));
    }
};

const FileShareCategory& get_category() {
    static FileShareCategory category;
    return category;
}

} // anonymous namespace

std::error_code make_error_code(ErrorCode code) {
    return std::error_code(static_cast<int>(code), get_category());
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::BindFailed: return "Failed to bind listener";
        case ErrorCode::ConnectionClosed: return "Connection closed";
        case ErrorCode::SendFailed: return "Send failed";
        case ErrorCode::ReceiveFailed: return "Receive failed";
        case ErrorCode::ReadFailed: return "Read failed";
        case ErrorCode::WriteFailed: return "Write failed";
        case ErrorCode::ArchiveFailed: return "Archive failed";
        case ErrorCode::UnexpectedEof: return "Unexpected end of stream";
        case ErrorCode::MalformedRequest: return "Malformed request";
        case ErrorCode::HeaderTooLarge: return "Request header too large";
        case ErrorCode::LengthRequired: return "Length required";
        case ErrorCode::MalformedMultipart: return "Malformed multipart body";
        case ErrorCode::PeerBusy: return "Another client is already connected";
        case ErrorCode::ModeMismatch: return "Operation not available in this mode";
        case ErrorCode::InvalidMode: return "Invalid mode";
        default: return "Unknown error";
    }
}

FileShareError::FileShareError(ErrorCode code, const std::string& message)
    : code_(code), message_(to_string(code) + ": " + message) {}

const char* FileShareError::what() const noexcept {
    return message_.c_str();
}

} // namespace fileshare
