#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include "storage/run_store.hpp"

namespace sandrun::storage {

// JSON files under <root>/runs/<run_id>/: run.json holds the record,
// events.jsonl and series.jsonl are append-only.
class FileRunStore : public RunStore {
public:
    explicit FileRunStore(std::filesystem::path root);

    core::errors::Result<protocol::RunRecord> insert_run(
        const protocol::RunRecord& record) override;
    core::errors::Result<protocol::RunRecord> update_run(
        const std::string& run_id, const protocol::RunUpdate& update) override;
    core::errors::Result<protocol::RunRecord> get_run(
        const std::string& run_id) const override;
    core::errors::Result<core::errors::Ok> append_event(
        const protocol::RunEvent& event) override;
    core::errors::Result<core::errors::Ok> append_series_point(
        const protocol::SeriesPoint& point) override;
    core::errors::Result<std::vector<protocol::RunEvent>> list_events(
        const std::string& run_id) const override;
    core::errors::Result<std::vector<protocol::SeriesPoint>> list_series(
        const std::string& run_id) const override;

private:
    core::errors::Result<std::filesystem::path> run_dir(
        const std::string& run_id) const;
    core::errors::Result<protocol::RunRecord> load_locked(
        const std::string& run_id) const;

    std::filesystem::path root_;
    mutable std::mutex mutex_;
};

}  // namespace sandrun::storage
