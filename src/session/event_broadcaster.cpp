#include "fileshare/session/event_broadcaster.h"
#include <vector>

namespace fileshare {

EventChannel::EventChannel(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

bool EventChannel::try_push(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }
    if (queue_.size() >= capacity_) {
        dropped_++;
        return false;
    }
    queue_.push_back(std::move(message));
    return true;
}

std::optional<std::string> EventChannel::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    std::string message = std::move(queue_.front());
    queue_.pop_front();
    return message;
}

void EventChannel::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool EventChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

uint64_t EventChannel::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

EventBroadcaster::EventBroadcaster(size_t buffer_size)
    : buffer_size_(buffer_size) {}

std::shared_ptr<EventChannel> EventBroadcaster::subscribe() {
    auto channel = std::make_shared<EventChannel>(buffer_size_);
    std::lock_guard<std::mutex> lock(mutex_);
    channels_.emplace(channel.get(), channel);
    return channel;
}

void EventBroadcaster::unsubscribe(const std::shared_ptr<EventChannel>& channel) {
    if (!channel) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channels_.erase(channel.get());
    }
    channel->close();
}

size_t EventBroadcaster::publish(const std::string& message) {
    // Copy the live set so channel locks are never taken under mutex_
    std::vector<std::shared_ptr<EventChannel>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.reserve(channels_.size());
        for (auto it = channels_.begin(); it != channels_.end();) {
            if (auto channel = it->second.lock()) {
                targets.push_back(std::move(channel));
                ++it;
            } else {
                it = channels_.erase(it);
            }
        }
    }

    size_t delivered = 0;
    for (const auto& channel : targets) {
        if (channel->try_push(message)) {
            delivered++;
        }
    }
    return delivered;
}

void EventBroadcaster::close_all() {
    std::vector<std::shared_ptr<EventChannel>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [ptr, weak] : channels_) {
            if (auto channel = weak.lock()) {
                targets.push_back(std::move(channel));
            }
        }
        channels_.clear();
    }
    for (const auto& channel : targets) {
        channel->close();
    }
}

size_t EventBroadcaster::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.size();
}

} // namespace fileshare
