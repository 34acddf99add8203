#include "fileshare/session/transfer_session.h"
#include "fileshare/base/logger.h"
#include "fileshare/util/fs_utils.h"
#include <system_error>

namespace fileshare {

namespace {

uint64_t initial_size(TransferMode mode, const std::filesystem::path& target) {
    if (mode != TransferMode::Send) {
        return 0;
    }
    std::error_code ec;
    if (std::filesystem::is_regular_file(target, ec)) {
        auto size = std::filesystem::file_size(target, ec);
        return ec ? 0 : size;
    }
    return 0;
}

} // anonymous namespace

TransferSession::TransferSession(TransferMode mode,
                                 std::filesystem::path target,
                                 const TransferConfig& config)
    : mode_(mode),
      target_(std::move(target)),
      config_(config),
      log_(config.log_capacity),
      status_(mode, display_name(target_), initial_size(mode, target_)),
      broadcaster_(config.subscriber_buffer) {}

void TransferSession::add_log(const std::string& message) {
    log_.append(message);
    Logger::instance().info(message);
    broadcast();
}

StatusSnapshot TransferSession::snapshot() const {
    StatusSnapshot snap = status_.snapshot();
    snap.active_peer = gate_.holder().value_or("");
    return snap;
}

void TransferSession::broadcast() {
    broadcaster_.publish(snapshot().to_json());
}

bool TransferSession::try_admit(const std::string& peer_id) {
    return gate_.try_acquire(peer_id);
}

bool TransferSession::release_peer(const std::string& peer_id) {
    if (!gate_.release(peer_id)) {
        return false;
    }
    add_log("Client " + peer_id + " disconnected");
    return true;
}

uint64_t TransferSession::begin_transfer(uint64_t total_size) {
    uint64_t attempt = status_.begin(total_size);
    broadcast();
    return attempt;
}

bool TransferSession::report_progress(uint64_t attempt, uint64_t transferred) {
    if (!status_.advance(attempt, transferred)) {
        return false;
    }
    broadcast();
    return true;
}

bool TransferSession::complete_transfer(uint64_t attempt) {
    if (!status_.complete(attempt)) {
        return false;
    }
    broadcast();
    return true;
}

bool TransferSession::fail_transfer(uint64_t attempt, const std::string& message) {
    if (!status_.fail(attempt, message)) {
        return false;
    }
    log_.append("Transfer failed: " + message);
    Logger::instance().error("Transfer failed: {}", message);
    broadcast();
    return true;
}

void TransferSession::set_total_size(uint64_t total_size) {
    status_.set_total_size(total_size);
    broadcast();
}

StatusSnapshot TransferSession::cancel(const std::string& requested_by) {
    auto previous = gate_.force_release();
    if (previous) {
        add_log("Client " + *previous + " disconnected");
    }

    status_.cancel();
    add_log("Transfer cancelled by " + requested_by);
    return snapshot();
}

bool TransferSession::finished() const {
    return is_terminal(status_.snapshot().phase);
}

} // namespace fileshare
