#ifndef FILESHARE_SESSION_TRANSFER_STATUS_H
#define FILESHARE_SESSION_TRANSFER_STATUS_H

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace fileshare {

enum class TransferMode {
    Send,
    Recv
};

// waiting -> transferring -> {completed | cancelled | error}
enum class TransferPhase {
    Waiting,
    Transferring,
    Completed,
    Cancelled,
    Error
};

std::string to_string(TransferMode mode);
std::string to_string(TransferPhase phase);
std::optional<TransferMode> parse_transfer_mode(const std::string& mode);
bool is_terminal(TransferPhase phase);

// Point-in-time copy of the status record
struct StatusSnapshot {
    TransferMode mode = TransferMode::Send;
    std::string target_name;
    uint64_t total_size = 0;
    uint64_t transferred_bytes = 0;
    double progress_percent = 0.0;
    TransferPhase phase = TransferPhase::Waiting;
    std::string last_error;
    std::string active_peer;  // filled from the admission gate
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point last_updated_at;
    uint64_t attempt = 0;

    // {"mode","path","size","transferred","progress","status","error",
    //  "client_ip","start_time","last_update_time"}
    std::string to_json() const;
};

// The single mutable transfer record of a session.
//
// Every mutation names the attempt it belongs to. begin() and cancel() start
// a new attempt, so a chunk loop that was superseded (by a cancel or by a newer
// transfer) gets std::nullopt back and can no longer change the record.
class TransferStatus {
public:
    TransferStatus(TransferMode mode, std::string target_name, uint64_t total_size = 0);

    TransferStatus(const TransferStatus&) = delete;
    TransferStatus& operator=(const TransferStatus&) = delete;

    // Enter transferring for a new attempt; counters restart at zero
    uint64_t begin(uint64_t total_size);

    // Record the cumulative byte count. Never decreases; raises total_size
    // when the count exceeds it.
    std::optional<StatusSnapshot> advance(uint64_t attempt, uint64_t transferred);

    // Forces progress to 100
    std::optional<StatusSnapshot> complete(uint64_t attempt);

    std::optional<StatusSnapshot> fail(uint64_t attempt, const std::string& message);

    // Always applies; supersedes the running attempt
    StatusSnapshot cancel();

    // Update the known size without starting an attempt (lazy directory size)
    StatusSnapshot set_total_size(uint64_t total_size);

    bool is_current(uint64_t attempt) const;

    StatusSnapshot snapshot() const;

private:
    bool is_live(uint64_t attempt) const;
    void touch();
    void recompute_progress();

    mutable std::mutex mutex_;
    StatusSnapshot state_;
};

} // namespace fileshare

#endif // FILESHARE_SESSION_TRANSFER_STATUS_H
