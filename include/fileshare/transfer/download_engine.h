#ifndef FILESHARE_TRANSFER_DOWNLOAD_ENGINE_H
#define FILESHARE_TRANSFER_DOWNLOAD_ENGINE_H

#include "fileshare/session/transfer_session.h"
#include "fileshare/transfer/io_stream.h"
#include "fileshare/transfer/transfer_outcome.h"
#include "fileshare/transfer/zip_writer.h"
#include <elio/elio.hpp>
#include <memory>
#include <string>

namespace fileshare {

// Streams the session's send target to one admitted peer. Writes the
// complete HTTP response (head and body) to the output stream.
//
// Full downloads drive the session status chunk by chunk and stop at the
// next chunk boundary once their attempt is superseded. Range downloads
// leave the status alone.
class DownloadEngine {
public:
    explicit DownloadEngine(std::shared_ptr<TransferSession> session);

    // Directory -> ZIP, file with a usable Range header -> partial, else full
    elio::coro::task<TransferOutcome> serve(OutputStream& out,
                                            const std::string& peer_id,
                                            const std::string& range_header);

    elio::coro::task<TransferOutcome> send_file(OutputStream& out, const std::string& peer_id);

    // Falls back to send_file when the header is malformed or multi-range
    elio::coro::task<TransferOutcome> send_range(OutputStream& out,
                                                 const std::string& peer_id,
                                                 const std::string& range_header);

    elio::coro::task<TransferOutcome> send_directory(OutputStream& out, const std::string& peer_id);

private:
    std::shared_ptr<TransferSession> session_;
    size_t chunk_size_;
    ZipMethod zip_method_;
    int deflate_level_;
};

} // namespace fileshare

#endif // FILESHARE_TRANSFER_DOWNLOAD_ENGINE_H
