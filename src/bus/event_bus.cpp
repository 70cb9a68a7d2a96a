#include "bus/event_bus.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/event_validator.hpp"

namespace sandrun::bus {

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               now.time_since_epoch())
        .count();
}

}  // namespace

EventStream::EventStream(std::shared_ptr<RunChannel> channel)
    : channel_(std::move(channel)) {}

std::optional<protocol::RunEvent> EventStream::next() {
    if (!channel_) {
        return std::nullopt;
    }
    std::unique_lock<std::mutex> lock(channel_->mutex);
    channel_->cv.wait(lock, [this] {
        return cursor_ < channel_->history.size() || !channel_->live ||
               channel_->closed;
    });
    if (cursor_ < channel_->history.size()) {
        return channel_->history[cursor_++];
    }
    return std::nullopt;
}

PollResult EventStream::poll(protocol::RunEvent& event,
                             const std::chrono::milliseconds timeout) {
    if (!channel_) {
        return PollResult::End;
    }
    std::unique_lock<std::mutex> lock(channel_->mutex);
    const bool ready = channel_->cv.wait_for(lock, timeout, [this] {
        return cursor_ < channel_->history.size() || !channel_->live ||
               channel_->closed;
    });
    if (!ready) {
        return PollResult::Timeout;
    }
    if (cursor_ < channel_->history.size()) {
        event = channel_->history[cursor_++];
        return PollResult::Event;
    }
    return PollResult::End;
}

std::vector<protocol::RunEvent> EventStream::collect() {
    std::vector<protocol::RunEvent> events;
    while (auto event = next()) {
        events.push_back(std::move(event.value()));
    }
    return events;
}

std::shared_ptr<RunChannel> EventBus::find(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(run_id);
    if (it == channels_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<RunChannel> EventBus::find_or_create(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& channel = channels_[run_id];
    if (!channel) {
        channel = std::make_shared<RunChannel>();
    }
    return channel;
}

EventStream EventBus::register_run(const std::string& run_id) {
    auto channel = find_or_create(run_id);
    {
        std::lock_guard<std::mutex> lock(channel->mutex);
        if (!channel->closed) {
            channel->live = true;
        }
    }
    return EventStream(channel);
}

bool EventBus::publish(const protocol::RunEvent& event) {
    auto channel = find_or_create(event.run_id);
    {
        std::lock_guard<std::mutex> lock(channel->mutex);
        if (channel->closed) {
            LOG_WARN("EventBus: dropping " + event.kind + " for closed run " +
                     event.run_id);
            return false;
        }
        channel->history.push_back(event);
    }
    channel->cv.notify_all();
    return true;
}

bool EventBus::publish(const std::string& run_id, const std::string& kind,
                       const nlohmann::json& payload) {
    protocol::RunEvent event;
    event.run_id = run_id;
    event.seq = static_cast<std::int64_t>(history_size(run_id)) + 1;
    event.ts_unix_ms = now_unix_ms();
    event.kind = kind;
    event.payload = payload;
    return publish(event);
}

bool EventBus::close(const std::string& run_id) {
    auto channel = find(run_id);
    if (!channel) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(channel->mutex);
        if (channel->closed) {
            return false;
        }
        channel->closed = true;
        channel->live = false;
    }
    channel->cv.notify_all();
    LOG_DEBUG("EventBus: closed channel for " + run_id);
    return true;
}

EventStream EventBus::stream(const std::string& run_id) const {
    return EventStream(find(run_id));
}

bool EventBus::is_closed(const std::string& run_id) const {
    auto channel = find(run_id);
    if (!channel) {
        return false;
    }
    std::lock_guard<std::mutex> lock(channel->mutex);
    return channel->closed;
}

std::size_t EventBus::history_size(const std::string& run_id) const {
    auto channel = find(run_id);
    if (!channel) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(channel->mutex);
    return channel->history.size();
}

std::string format_sse(const protocol::RunEvent& event) {
    return "event: " + event.kind + "\ndata: " + protocol::dump_line(event.payload) + "\n\n";
}

}  // namespace sandrun::bus
