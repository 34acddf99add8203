#ifndef FILESHARE_SESSION_ADMISSION_GATE_H
#define FILESHARE_SESSION_ADMISSION_GATE_H

#include <mutex>
#include <optional>
#include <string>

namespace fileshare {

// Single-holder slot: at most one peer may transfer at a time.
// Rejection is immediate; nothing is queued.
class AdmissionGate {
public:
    AdmissionGate() = default;
    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    // True if the slot was free or is already held by peer_id
    bool try_acquire(const std::string& peer_id);

    // Clears the slot only when held by peer_id. Returns whether it did.
    bool release(const std::string& peer_id);

    // Clears the slot regardless of holder. Returns the previous holder.
    std::optional<std::string> force_release();

    std::optional<std::string> holder() const;

private:
    mutable std::mutex mutex_;
    std::string holder_;
};

} // namespace fileshare

#endif // FILESHARE_SESSION_ADMISSION_GATE_H
