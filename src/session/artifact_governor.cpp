#include "session/artifact_governor.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace sandrun::session {

namespace {

// Length of the UTF-8 sequence introduced by `lead`, 0 for a continuation
// byte.
std::size_t sequence_length(const unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

// Largest prefix length <= `length` that does not end inside a multi-byte
// sequence.
std::size_t utf8_safe_prefix(const std::string& text, std::size_t length) {
    if (length >= text.size()) {
        return text.size();
    }
    std::size_t back = 0;
    while (back < 4 && back < length) {
        const auto byte = static_cast<unsigned char>(text[length - 1 - back]);
        const std::size_t needed = sequence_length(byte);
        if (needed == 0) {
            ++back;
            continue;
        }
        // Lead byte found: keep the sequence only if it is complete.
        return needed <= back + 1 ? length : length - 1 - back;
    }
    return length;
}

std::string governor_warning(const char* label, const std::size_t max_bytes) {
    return std::string(label) + " exceeded " + std::to_string(max_bytes) +
           " bytes and was truncated";
}

}  // namespace

GovernedText truncate_if_needed(const std::string& text, const std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return GovernedText{text, false};
    }

    const std::string marker(protocol::kTruncationMarker);
    if (max_bytes <= marker.size()) {
        return GovernedText{marker.substr(0, max_bytes), true};
    }

    const std::size_t keep = utf8_safe_prefix(text, max_bytes - marker.size());
    return GovernedText{text.substr(0, keep) + marker, true};
}

ArtifactGovernor::ArtifactGovernor(const std::size_t max_logs_bytes,
                                   const std::size_t max_events_bytes)
    : max_logs_bytes_(max_logs_bytes), max_events_bytes_(max_events_bytes) {}

std::vector<std::string> ArtifactGovernor::apply(protocol::RunArtifacts& artifacts) const {
    std::vector<std::string> warnings;

    auto logs = truncate_if_needed(artifacts.logs, max_logs_bytes_);
    if (logs.truncated) {
        warnings.push_back(governor_warning(protocol::kArtifactLogs, max_logs_bytes_));
        artifacts.logs = std::move(logs.text);
    }

    auto events = truncate_if_needed(artifacts.events, max_events_bytes_);
    if (events.truncated) {
        warnings.push_back(governor_warning(protocol::kArtifactEvents, max_events_bytes_));
        artifacts.events = std::move(events.text);
    }

    for (const auto& warning : warnings) {
        LOG_WARN("ArtifactGovernor: " + warning);
    }
    return warnings;
}

}  // namespace sandrun::session
