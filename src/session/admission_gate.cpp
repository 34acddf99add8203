#include "fileshare/session/admission_gate.h"

namespace fileshare {

bool AdmissionGate::try_acquire(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!holder_.empty() && holder_ != peer_id) {
        return false;
    }
    holder_ = peer_id;
    return true;
}

bool AdmissionGate::release(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (holder_.empty() || holder_ != peer_id) {
        return false;
    }
    holder_.clear();
    return true;
}

std::optional<std::string> AdmissionGate::force_release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (holder_.empty()) {
        return std::nullopt;
    }
    std::string previous = std::move(holder_);
    holder_.clear();
    return previous;
}

std::optional<std::string> AdmissionGate::holder() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (holder_.empty()) {
        return std::nullopt;
    }
    return holder_;
}

} // namespace fileshare
