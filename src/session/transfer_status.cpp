#include "fileshare/session/transfer_status.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace fileshare {

namespace {

std::string format_time(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    gmtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

} // anonymous namespace

std::string to_string(TransferMode mode) {
    return mode == TransferMode::Send ? "send" : "recv";
}

std::string to_string(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::Waiting: return "waiting";
        case TransferPhase::Transferring: return "transferring";
        case TransferPhase::Completed: return "completed";
        case TransferPhase::Cancelled: return "cancelled";
        case TransferPhase::Error: return "error";
        default: return "unknown";
    }
}

std::optional<TransferMode> parse_transfer_mode(const std::string& mode) {
    if (mode == "send") return TransferMode::Send;
    if (mode == "recv") return TransferMode::Recv;
    return std::nullopt;
}

bool is_terminal(TransferPhase phase) {
    return phase == TransferPhase::Completed ||
           phase == TransferPhase::Cancelled ||
           phase == TransferPhase::Error;
}

std::string StatusSnapshot::to_json() const {
    json j = {
        {"mode", to_string(mode)},
        {"path", target_name},
        {"size", total_size},
        {"transferred", transferred_bytes},
        {"progress", std::round(progress_percent * 100.0) / 100.0},
        {"status", to_string(phase)},
        {"error", last_error},
        {"client_ip", active_peer},
        {"start_time", format_time(started_at)},
        {"last_update_time", format_time(last_updated_at)}
    };
    return j.dump();
}

TransferStatus::TransferStatus(TransferMode mode, std::string target_name, uint64_t total_size) {
    state_.mode = mode;
    state_.target_name = std::move(target_name);
    state_.total_size = total_size;
    state_.started_at = std::chrono::system_clock::now();
    state_.last_updated_at = state_.started_at;
}

uint64_t TransferStatus::begin(uint64_t total_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.attempt++;
    state_.phase = TransferPhase::Transferring;
    state_.total_size = total_size;
    state_.transferred_bytes = 0;
    state_.progress_percent = 0.0;
    state_.last_error.clear();
    state_.started_at = std::chrono::system_clock::now();
    state_.last_updated_at = state_.started_at;
    return state_.attempt;
}

std::optional<StatusSnapshot> TransferStatus::advance(uint64_t attempt, uint64_t transferred) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_live(attempt)) {
        return std::nullopt;
    }
    if (transferred > state_.transferred_bytes) {
        state_.transferred_bytes = transferred;
    }
    if (state_.transferred_bytes > state_.total_size) {
        state_.total_size = state_.transferred_bytes;
    }
    recompute_progress();
    touch();
    return state_;
}

std::optional<StatusSnapshot> TransferStatus::complete(uint64_t attempt) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_live(attempt)) {
        return std::nullopt;
    }
    state_.phase = TransferPhase::Completed;
    state_.progress_percent = 100.0;
    touch();
    return state_;
}

std::optional<StatusSnapshot> TransferStatus::fail(uint64_t attempt, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_live(attempt)) {
        return std::nullopt;
    }
    state_.phase = TransferPhase::Error;
    state_.last_error = message;
    touch();
    return state_;
}

StatusSnapshot TransferStatus::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.attempt++;
    state_.phase = TransferPhase::Cancelled;
    state_.last_error.clear();
    touch();
    return state_;
}

StatusSnapshot TransferStatus::set_total_size(uint64_t total_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.total_size = std::max(total_size, state_.transferred_bytes);
    recompute_progress();
    touch();
    return state_;
}

bool TransferStatus::is_current(uint64_t attempt) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_live(attempt);
}

StatusSnapshot TransferStatus::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

// Caller holds mutex_
bool TransferStatus::is_live(uint64_t attempt) const {
    return attempt == state_.attempt && state_.phase == TransferPhase::Transferring;
}

void TransferStatus::touch() {
    state_.last_updated_at = std::chrono::system_clock::now();
}

void TransferStatus::recompute_progress() {
    if (state_.total_size > 0) {
        state_.progress_percent = static_cast<double>(state_.transferred_bytes) /
                                  static_cast<double>(state_.total_size) * 100.0;
    } else {
        state_.progress_percent = 0.0;
    }
}

} // namespace fileshare
