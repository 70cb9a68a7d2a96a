#pragma once

#include <string>
#include <vector>
#include "core/errors/run_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/run_contract.hpp"

namespace sandrun::storage {

// Durable run records, the append-only event log and metric series.
class RunStore {
public:
    virtual ~RunStore() = default;

    virtual core::errors::Result<protocol::RunRecord> insert_run(
        const protocol::RunRecord& record) = 0;

    // Fails with `invalid_state_transition` when the update would move the
    // status backwards or out of a terminal state.
    virtual core::errors::Result<protocol::RunRecord> update_run(
        const std::string& run_id, const protocol::RunUpdate& update) = 0;

    virtual core::errors::Result<protocol::RunRecord> get_run(
        const std::string& run_id) const = 0;

    virtual core::errors::Result<core::errors::Ok> append_event(
        const protocol::RunEvent& event) = 0;

    virtual core::errors::Result<core::errors::Ok> append_series_point(
        const protocol::SeriesPoint& point) = 0;

    virtual core::errors::Result<std::vector<protocol::RunEvent>> list_events(
        const std::string& run_id) const = 0;

    virtual core::errors::Result<std::vector<protocol::SeriesPoint>> list_series(
        const std::string& run_id) const = 0;
};

}  // namespace sandrun::storage
