#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <variant>

namespace model {

struct LocalDate {
    int year = 1970;
    int month = 1;
    int day = 1;
};

// Wall-clock time as entered by the user, optionally pinned to a calendar date.
struct LocalTime {
    int hour = 0;
    int minute = 0;
    int second = 0;
    std::optional<LocalDate> date;
};

struct Once {};
struct Daily {};
struct Weekly { uint8_t days = 0; };          // bit 0 = Monday .. bit 6 = Sunday
struct Custom { int64_t interval_sec = 0; };

using Recurrence = std::variant<Once, Daily, Weekly, Custom>;

enum class EventState { Active, Cancelled, Completed };

struct EventRecord {
    uint64_t id = 0;
    std::string owner_context;
    LocalTime local_time;
    std::string timezone;
    Recurrence recurrence;
    time_t next_fire_utc = 0;
    std::string payload;
    uint64_t version = 0;
    EventState state = EventState::Active;

    time_t created_utc = 0;
    time_t updated_utc = 0;
    time_t last_fired_utc = 0;
    uint32_t fire_count = 0;
};

bool is_recurring(const Recurrence& r);
std::string recurrence_name(const Recurrence& r);
std::string state_name(EventState s);
std::optional<EventState> parse_state(const std::string& s);

bool is_valid_date(const LocalDate& d);
// "HH:MM" or "HH:MM:SS", date "YYYY-MM-DD" or empty
std::optional<LocalTime> parse_local_time(const std::string& hms, const std::string& ymd);
std::optional<LocalDate> parse_date(const std::string& ymd);
std::string format_time_of_day(const LocalTime& t);
std::string format_date(const LocalDate& d);

// "mon,wed,fri" -> bit set; nullopt on an unknown day name
std::optional<uint8_t> parse_weekdays(const std::string& csv);
std::string format_weekdays(uint8_t days);

// kind is one of none|once|daily|weekly|custom; nullopt when unknown
std::optional<Recurrence> make_recurrence(const std::string& kind, uint8_t weekdays, int64_t interval_sec);

std::string to_json(const EventRecord& r);
// nullopt when the body is not a well-formed record
std::optional<EventRecord> from_json(const std::string& js);

}
