#include "sandbox/event_channel.hpp"

#include <utility>

namespace sandrun::sandbox {

bool EventChannel::push(protocol::RawEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push(std::move(event));
    }
    cv_.notify_one();
    return true;
}

bool EventChannel::try_pop(protocol::RawEvent& event,
                           const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
        return false;
    }
    event = std::move(queue_.front());
    queue_.pop();
    return true;
}

std::vector<protocol::RawEvent> EventChannel::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<protocol::RawEvent> events;
    events.reserve(queue_.size());
    while (!queue_.empty()) {
        events.push_back(std::move(queue_.front()));
        queue_.pop();
    }
    return events;
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

}  // namespace sandrun::sandbox
