#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/event_contract.hpp"

namespace sandrun::bus {

// Per-run history plus live state. Shared between the bus and its streams.
struct RunChannel {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<protocol::RunEvent> history;
    bool live = false;    // a registered channel exists
    bool closed = false;
};

enum class PollResult {
    Event,
    Timeout,
    End
};

// One subscriber's cursor into a run's history. Yields the full history in
// order, then live events until the run closes.
class EventStream {
public:
    EventStream() = default;
    explicit EventStream(std::shared_ptr<RunChannel> channel);

    // Blocks until the next event or end of stream.
    std::optional<protocol::RunEvent> next();

    PollResult poll(protocol::RunEvent& event, std::chrono::milliseconds timeout);

    // Reads until end of stream.
    std::vector<protocol::RunEvent> collect();

    std::size_t position() const { return cursor_; }

private:
    std::shared_ptr<RunChannel> channel_;
    std::size_t cursor_ = 0;
};

class EventBus {
public:
    // Ensures a live channel and history exist for `run_id`. Idempotent; a
    // closed channel stays closed.
    EventStream register_run(const std::string& run_id);

    // Appends to history and wakes subscribers. Returns false when the run
    // is already closed.
    bool publish(const protocol::RunEvent& event);
    bool publish(const std::string& run_id, const std::string& kind,
                 const nlohmann::json& payload);

    // Signals end of stream. Returns false when already closed or unknown.
    bool close(const std::string& run_id);

    // Unknown run ids yield an empty stream.
    EventStream stream(const std::string& run_id) const;

    bool is_closed(const std::string& run_id) const;
    std::size_t history_size(const std::string& run_id) const;

private:
    std::shared_ptr<RunChannel> find(const std::string& run_id) const;
    std::shared_ptr<RunChannel> find_or_create(const std::string& run_id);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<RunChannel>> channels_;
};

// Server-Sent Events frame for one event: "event: <kind>\ndata: <json>\n\n".
std::string format_sse(const protocol::RunEvent& event);

}  // namespace sandrun::bus
