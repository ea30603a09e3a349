#include "TimeResolver.h"
#include <absl/time/civil_time.h>
#include <absl/time/time.h>
#include <algorithm>
#include <ctime>
#include <string>
#include <unordered_map>

namespace recurrence {

namespace {

// a weekly day-set needs at most 7 days past the start plus the look-back day
constexpr int kMaxScanDays = 16;
// keeps anchor + steps * interval far from int64 overflow for any valid date
constexpr int64_t kMaxCustomIntervalSec = 100LL * 366 * 24 * 3600;

absl::TimeZone load_zone(const std::string& name) {
    absl::TimeZone tz;
    if (name.empty() || !absl::LoadTimeZone(canonical_timezone(name), &tz)) throw InvalidTimezone(name);
    return tz;
}

absl::Time resolve_civil(const absl::CivilSecond& cs, const absl::TimeZone& tz) {
    const absl::TimeZone::TimeInfo ti = tz.At(cs);
    switch (ti.kind) {
        case absl::TimeZone::TimeInfo::SKIPPED:
            return ti.trans;
        case absl::TimeZone::TimeInfo::REPEATED:
        case absl::TimeZone::TimeInfo::UNIQUE:
            break;
    }
    return ti.pre;
}

absl::CivilSecond at_day(const absl::CivilDay& day, const model::LocalTime& local) {
    return absl::CivilSecond(day.year(), day.month(), day.day(), local.hour, local.minute, local.second);
}

absl::CivilDay to_civil_day(const model::LocalDate& d) {
    return absl::CivilDay(d.year, d.month, d.day);
}

bool weekday_in(uint8_t days, const absl::CivilDay& day) {
    int w = static_cast<int>(absl::GetWeekday(day));
    return (days & (1u << w)) != 0;
}

// First occurrence of local's time of day strictly after `after`, on or after `from` and on a
// day accepted by the mask (0x7f = every day).
time_t next_on_days(const model::LocalTime& local, const absl::TimeZone& tz, uint8_t days, time_t after) {
    absl::CivilDay start = absl::CivilDay(tz.At(absl::FromTimeT(after)).cs) - 1;
    if (local.date) start = std::max(start, to_civil_day(*local.date));
    for (int i = 0; i < kMaxScanDays; ++i) {
        absl::CivilDay day = start + i;
        if (!weekday_in(days, day)) continue;
        time_t t = absl::ToTimeT(resolve_civil(at_day(day, local), tz));
        if (t > after) return t;
    }
    throw InvalidRecurrence("no occurrence found");
}

}

std::string canonical_timezone(const std::string& name) {
    static const std::unordered_map<std::string, std::string> aliases = {
        {"ET", "America/New_York"}, {"EST", "America/New_York"}, {"EDT", "America/New_York"},
        {"CT", "America/Chicago"}, {"CST", "America/Chicago"}, {"CDT", "America/Chicago"},
        {"MT", "America/Denver"}, {"MST", "America/Denver"}, {"MDT", "America/Denver"},
        {"PT", "America/Los_Angeles"}, {"PST", "America/Los_Angeles"}, {"PDT", "America/Los_Angeles"},
        {"Z", "UTC"}, {"GMT", "UTC"},
    };
    auto it = aliases.find(name);
    return it == aliases.end() ? name : it->second;
}

bool is_valid_timezone(const std::string& name) {
    absl::TimeZone tz;
    return !name.empty() && absl::LoadTimeZone(canonical_timezone(name), &tz);
}

model::LocalDate local_date_at(time_t t, const std::string& timezone) {
    absl::TimeZone tz = load_zone(timezone);
    absl::CivilSecond cs = tz.At(absl::FromTimeT(t)).cs;
    return model::LocalDate{int(cs.year()), cs.month(), cs.day()};
}

time_t resolve(const model::LocalTime& local, const std::string& timezone, const model::Recurrence& rec, time_t after) {
    absl::TimeZone tz = load_zone(timezone);

    if (std::holds_alternative<model::Once>(rec)) {
        if (local.date) return absl::ToTimeT(resolve_civil(at_day(to_civil_day(*local.date), local), tz));
        return next_on_days(local, tz, 0x7f, after);
    }
    if (std::holds_alternative<model::Daily>(rec)) {
        return next_on_days(local, tz, 0x7f, after);
    }
    if (auto w = std::get_if<model::Weekly>(&rec)) {
        if (w->days == 0 || w->days > 0x7f) throw InvalidRecurrence("weekly day-set is empty");
        return next_on_days(local, tz, w->days, after);
    }
    const auto& c = std::get<model::Custom>(rec);
    if (c.interval_sec <= 0) throw InvalidRecurrence("custom interval must be positive");
    if (c.interval_sec > kMaxCustomIntervalSec) throw InvalidRecurrence("custom interval longer than 100 years");
    time_t anchor;
    if (local.date) anchor = absl::ToTimeT(resolve_civil(at_day(to_civil_day(*local.date), local), tz));
    else anchor = next_on_days(local, tz, 0x7f, after);
    if (anchor > after) return anchor;
    int64_t steps = (int64_t(after) - int64_t(anchor)) / c.interval_sec + 1;
    return time_t(int64_t(anchor) + steps * c.interval_sec);
}

std::optional<time_t> parse_iso_z(const std::string& s) {
    if (s.size() != 20 || s[4] != '-' || s[7] != '-' || s[10] != 'T' || s[13] != ':' || s[16] != ':' || s[19] != 'Z') return std::nullopt;
    std::tm tm{};
    try {
        tm.tm_year = std::stoi(s.substr(0,4)) - 1900;
        tm.tm_mon  = std::stoi(s.substr(5,2)) - 1;
        tm.tm_mday = std::stoi(s.substr(8,2));
        tm.tm_hour = std::stoi(s.substr(11,2));
        tm.tm_min  = std::stoi(s.substr(14,2));
        tm.tm_sec  = std::stoi(s.substr(17,2));
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
    return timegm(&tm);
}

std::string format_iso_z(time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

}
