#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/run_errors.hpp"
#include "protocol/event_contract.hpp"

namespace sandrun::protocol {

// Parses `payload` into the typed alternative for `kind`. Unknown kinds
// become a PassthroughEvent. Fails with `invalid_event_payload` when a
// recognized kind is missing a required field or has a field of the wrong
// type or range.
core::errors::Result<EventPayload> parse_event(const std::string& kind,
                                               const nlohmann::json& payload);

// Normalized payload: declared fields only, absent optionals omitted.
nlohmann::json to_payload(const EventPayload& event);

std::string kind_of(const EventPayload& event);

// parse_event + to_payload in one step.
core::errors::Result<nlohmann::json> validate_event(const std::string& kind,
                                                    const nlohmann::json& payload);

RawEvent make_raw(const EventPayload& event);

// Copy of `text` with every byte that does not start a well-formed UTF-8
// sequence replaced by U+FFFD.
std::string to_valid_utf8(const std::string& text);

// Single-line JSON; invalid UTF-8 in strings is replaced instead of thrown.
std::string dump_line(const nlohmann::json& value);

}  // namespace sandrun::protocol
