#include "fileshare/session/transfer_log.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fileshare {

namespace {

std::string clock_stamp() {
    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S");
    return oss.str();
}

} // anonymous namespace

TransferLog::TransferLog(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

std::string TransferLog::append(const std::string& message) {
    std::string entry = "[" + clock_stamp() + "] " + message;

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(entry);
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
    return entry;
}

std::vector<std::string> TransferLog::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(entries_.begin(), entries_.end());
}

size_t TransferLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace fileshare
