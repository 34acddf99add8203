#ifndef FILESHARE_BASE_ERROR_CODE_H
#define FILESHARE_BASE_ERROR_CODE_H

#include <string>
#include <system_error>

namespace fileshare {

// Error code categories
enum class ErrorCode {
    Success = 0,

    // General errors (1000-1999)
    InvalidArgument = 1001,
    NotFound = 1002,
    AlreadyExists = 1003,
    Cancelled = 1004,
    InternalError = 1005,

    // Network errors (2000-2999)
    BindFailed = 2001,
    ConnectionClosed = 2002,
    SendFailed = 2003,
    ReceiveFailed = 2004,

    // Transfer errors (3000-3999)
    ReadFailed = 3001,
    WriteFailed = 3002,
    ArchiveFailed = 3003,
    UnexpectedEof = 3004,

    // HTTP errors (4000-4999)
    MalformedRequest = 4001,
    HeaderTooLarge = 4002,
    LengthRequired = 4003,
    MalformedMultipart = 4004,

    // Session errors (5000-5999)
    PeerBusy = 5001,
    ModeMismatch = 5002,
    InvalidMode = 5003
};

std::error_code make_error_code(ErrorCode code);
std::string to_string(ErrorCode code);

class FileShareError : public std::exception {
public:
    FileShareError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    const char* what() const noexcept override;

private:
    ErrorCode code_;
    std::string message_;
};

} // namespace fileshare

namespace std {
template <>
struct is_error_code_enum<fileshare::ErrorCode> : true_type {};
} // namespace std

#endif // FILESHARE_BASE_ERROR_CODE_H
