#ifndef FILESHARE_SESSION_EVENT_BROADCASTER_H
#define FILESHARE_SESSION_EVENT_BROADCASTER_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace fileshare {

// Bounded queue feeding one observer connection.
// Producers never block: a push onto a full or closed channel is dropped.
class EventChannel {
public:
    explicit EventChannel(size_t capacity);

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    bool try_push(std::string message);
    std::optional<std::string> try_pop();

    void close();
    bool is_closed() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint64_t dropped() const;

private:
    mutable std::mutex mutex_;
    std::deque<std::string> queue_;
    size_t capacity_;
    uint64_t dropped_ = 0;
    bool closed_ = false;
};

// Best-effort fan-out of status snapshots to all live observers.
// Subscribers own their channel; the broadcaster only keeps weak references.
class EventBroadcaster {
public:
    static constexpr size_t DEFAULT_BUFFER = 10;

    explicit EventBroadcaster(size_t buffer_size = DEFAULT_BUFFER);

    EventBroadcaster(const EventBroadcaster&) = delete;
    EventBroadcaster& operator=(const EventBroadcaster&) = delete;

    std::shared_ptr<EventChannel> subscribe();

    // Removes and closes the channel; calling it twice is harmless
    void unsubscribe(const std::shared_ptr<EventChannel>& channel);

    // Returns how many subscribers accepted the message
    size_t publish(const std::string& message);

    // Closes every channel (server shutdown)
    void close_all();

    size_t subscriber_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<EventChannel*, std::weak_ptr<EventChannel>> channels_;
    size_t buffer_size_;
};

} // namespace fileshare

#endif // FILESHARE_SESSION_EVENT_BROADCASTER_H
