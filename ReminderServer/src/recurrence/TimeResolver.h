#pragma once

#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>
#include "../model/EventRecord.h"

namespace recurrence {

class InvalidTimezone : public std::runtime_error {
public:
    explicit InvalidTimezone(const std::string& name) : std::runtime_error("invalid timezone: " + name) {}
};

class InvalidRecurrence : public std::runtime_error {
public:
    explicit InvalidRecurrence(const std::string& why) : std::runtime_error("invalid recurrence: " + why) {}
};

// Next fire instant for (local, timezone, rec) strictly after `after`.
//
// A local time inside a spring-forward gap resolves to the transition instant (the first valid
// wall-clock time after the gap); a local time inside a fall-back overlap resolves to the earlier of
// the two instants. A dated single-shot resolves to its own instant even when that is not after
// `after`; callers decide whether a past instant is acceptable.
//
// Throws InvalidTimezone or InvalidRecurrence.
time_t resolve(const model::LocalTime& local, const std::string& timezone, const model::Recurrence& rec, time_t after);

// Maps the short aliases (PT, ET, ...) to IANA names; other names pass through.
std::string canonical_timezone(const std::string& name);
bool is_valid_timezone(const std::string& name);

// Local calendar date of instant t in the zone. Throws InvalidTimezone.
model::LocalDate local_date_at(time_t t, const std::string& timezone);

std::string format_iso_z(time_t t);
std::optional<time_t> parse_iso_z(const std::string& s);

}
