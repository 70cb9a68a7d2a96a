#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <vector>
#include "protocol/event_contract.hpp"

namespace sandrun::sandbox {

// Single-producer queue the sandbox writes raw events into and the
// orchestrator drains. Once closed, pushes are dropped.
class EventChannel {
public:
    bool push(protocol::RawEvent event);
    bool try_pop(protocol::RawEvent& event, std::chrono::milliseconds timeout);
    std::vector<protocol::RawEvent> drain();
    void close();
    bool is_closed() const;
    std::size_t size() const;

private:
    std::queue<protocol::RawEvent> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

}  // namespace sandrun::sandbox
