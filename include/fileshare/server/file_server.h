#ifndef FILESHARE_SERVER_FILE_SERVER_H
#define FILESHARE_SERVER_FILE_SERVER_H

#include "fileshare/base/config.h"
#include "fileshare/session/transfer_session.h"
#include <cstdint>
#include <memory>

namespace fileshare {

// HTTP front end of a transfer session.
//
// Routes:
//   GET  /              observer page
//   GET  /api/info      status snapshot
//   GET  /api/events    server-sent status events
//   GET  /api/download  send mode: file, byte range or ZIP of a directory
//   POST /api/upload    recv mode: multipart upload
//   POST /api/cancel    cancel the current transfer
//   GET  /api/log       transfer log
class FileServer {
public:
    FileServer(const ServerConfig& config, std::shared_ptr<TransferSession> session);
    ~FileServer();

    FileServer(const FileServer&) = delete;
    FileServer& operator=(const FileServer&) = delete;

    // Binds the listener and starts serving on a background thread.
    // Returns false if the address could not be bound.
    bool start();

    // Stop the server; safe to call more than once
    void stop();

    bool is_running() const;

    // Actual port, useful when configured with port 0
    uint16_t get_listen_port() const;

    std::shared_ptr<TransferSession> session() const;

    // True once the session reached completed, cancelled or error
    bool transfer_finished() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fileshare

#endif // FILESHARE_SERVER_FILE_SERVER_H
