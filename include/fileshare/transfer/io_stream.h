#ifndef FILESHARE_TRANSFER_IO_STREAM_H
#define FILESHARE_TRANSFER_IO_STREAM_H

#include <elio/elio.hpp>
#include <cstddef>
#include <string>
#include <sys/types.h>

namespace fileshare {

// Destination of a streamed response body
class OutputStream {
public:
    virtual ~OutputStream() = default;

    // Writes all bytes or returns false
    virtual elio::coro::task<bool> write(const void* data, size_t size) = 0;

    // Description of the last failed write
    virtual std::string error_message() const = 0;
};

// Source of a streamed request body
class InputStream {
public:
    virtual ~InputStream() = default;

    // Bytes read, 0 at end of body, negative errno on failure
    virtual elio::coro::task<ssize_t> read(void* buffer, size_t size) = 0;
};

} // namespace fileshare

#endif // FILESHARE_TRANSFER_IO_STREAM_H
