#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "protocol/run_contract.hpp"

namespace sandrun::session {

struct GovernedText {
    std::string text;
    bool truncated = false;
};

// Cuts `text` to at most `max_bytes` bytes including the truncation marker.
// An incomplete UTF-8 sequence at the cut is dropped.
GovernedText truncate_if_needed(const std::string& text, std::size_t max_bytes);

class ArtifactGovernor {
public:
    ArtifactGovernor(std::size_t max_logs_bytes, std::size_t max_events_bytes);

    // Applies the caps to `logs` and `events` in place; `metrics` is never
    // touched. Returns one warning line per truncated artifact.
    std::vector<std::string> apply(protocol::RunArtifacts& artifacts) const;

private:
    std::size_t max_logs_bytes_;
    std::size_t max_events_bytes_;
};

}  // namespace sandrun::session
