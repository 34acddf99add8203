#ifndef FILESHARE_SESSION_TRANSFER_LOG_H
#define FILESHARE_SESSION_TRANSFER_LOG_H

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace fileshare {

// Bounded FIFO of "[HH:MM:SS] message" lines shown to observers.
// Once capacity is exceeded the oldest entry is dropped.
class TransferLog {
public:
    static constexpr size_t DEFAULT_CAPACITY = 100;

    explicit TransferLog(size_t capacity = DEFAULT_CAPACITY);

    // Returns the stored (timestamped) entry
    std::string append(const std::string& message);

    // Oldest first
    std::vector<std::string> entries() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    mutable std::mutex mutex_;
    std::deque<std::string> entries_;
    size_t capacity_;
};

} // namespace fileshare

#endif // FILESHARE_SESSION_TRANSFER_LOG_H
