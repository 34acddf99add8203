#ifndef FILESHARE_SESSION_TRANSFER_SESSION_H
#define FILESHARE_SESSION_TRANSFER_SESSION_H

#include "fileshare/base/config.h"
#include "fileshare/session/admission_gate.h"
#include "fileshare/session/event_broadcaster.h"
#include "fileshare/session/transfer_log.h"
#include "fileshare/session/transfer_status.h"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fileshare {

// Owns the state of the one transfer session a process serves and keeps
// the log, the gate, the status record and the observers in step.
//
// Handlers share the session through std::shared_ptr. Each component has its
// own lock and no method holds two of them at once.
class TransferSession {
public:
    TransferSession(TransferMode mode,
                    std::filesystem::path target,
                    const TransferConfig& config = TransferConfig{});

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    TransferMode mode() const { return mode_; }
    const std::filesystem::path& target_path() const { return target_; }
    const TransferConfig& config() const { return config_; }

    // Timestamp, store, mirror to the process logger and notify observers
    void add_log(const std::string& message);
    std::vector<std::string> log_entries() const { return log_.entries(); }

    // Status record with active_peer taken from the gate
    StatusSnapshot snapshot() const;

    // Publish the current snapshot to every observer
    void broadcast();

    std::shared_ptr<EventChannel> subscribe() { return broadcaster_.subscribe(); }
    void unsubscribe(const std::shared_ptr<EventChannel>& channel) {
        broadcaster_.unsubscribe(channel);
    }
    size_t observer_count() const { return broadcaster_.subscriber_count(); }
    void close_observers() { broadcaster_.close_all(); }

    // Admission
    bool try_admit(const std::string& peer_id);
    // Logs "Client <peer> disconnected" when the peer held the slot
    bool release_peer(const std::string& peer_id);
    std::optional<std::string> active_peer() const { return gate_.holder(); }

    // Attempt lifecycle; each returns false once the attempt was superseded
    uint64_t begin_transfer(uint64_t total_size);
    bool report_progress(uint64_t attempt, uint64_t transferred);
    bool complete_transfer(uint64_t attempt);
    bool fail_transfer(uint64_t attempt, const std::string& message);
    bool is_current(uint64_t attempt) const { return status_.is_current(attempt); }

    // Directory size becomes known on first download
    void set_total_size(uint64_t total_size);

    // Force-releases the slot and moves the status to cancelled
    StatusSnapshot cancel(const std::string& requested_by);

    // True once the status reached completed, cancelled or error
    bool finished() const;

private:
    TransferMode mode_;
    std::filesystem::path target_;
    TransferConfig config_;

    TransferLog log_;
    AdmissionGate gate_;
    TransferStatus status_;
    EventBroadcaster broadcaster_;
};

// Holds the admission slot for one request and gives it back on scope exit
class PeerLease {
public:
    PeerLease(std::shared_ptr<TransferSession> session, std::string peer_id)
        : session_(std::move(session)), peer_id_(std::move(peer_id)) {}

    ~PeerLease() {
        if (session_) {
            session_->release_peer(peer_id_);
        }
    }

    PeerLease(const PeerLease&) = delete;
    PeerLease& operator=(const PeerLease&) = delete;

    const std::string& peer_id() const { return peer_id_; }

private:
    std::shared_ptr<TransferSession> session_;
    std::string peer_id_;
};

} // namespace fileshare

#endif // FILESHARE_SESSION_TRANSFER_SESSION_H
