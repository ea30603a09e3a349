#include "EventRecord.h"
#include "../net/MiniJson.h"
#include <cctype>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace model {

static const char* kDayNames[7] = {"mon", "tue", "wed", "thu", "fri", "sat", "sun"};

bool is_recurring(const Recurrence& r) {
    return !std::holds_alternative<Once>(r);
}

std::string recurrence_name(const Recurrence& r) {
    if (std::holds_alternative<Daily>(r)) return "daily";
    if (std::holds_alternative<Weekly>(r)) return "weekly";
    if (std::holds_alternative<Custom>(r)) return "custom";
    return "none";
}

std::string state_name(EventState s) {
    switch (s) {
        case EventState::Active: return "active";
        case EventState::Cancelled: return "cancelled";
        case EventState::Completed: return "completed";
    }
    return "active";
}

std::optional<EventState> parse_state(const std::string& s) {
    if (s == "active") return EventState::Active;
    if (s == "cancelled") return EventState::Cancelled;
    if (s == "completed") return EventState::Completed;
    return std::nullopt;
}

static int days_in_month(int y, int m) {
    static const int dm[12] = {31,28,31,30,31,30,31,31,30,31,30,31};
    if (m == 2 && ((y % 4 == 0 && y % 100 != 0) || y % 400 == 0)) return 29;
    return dm[m - 1];
}

bool is_valid_date(const LocalDate& d) {
    if (d.year < 1970 || d.year > 9999) return false;
    if (d.month < 1 || d.month > 12) return false;
    return d.day >= 1 && d.day <= days_in_month(d.year, d.month);
}

static bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) if (!isdigit((unsigned char)c)) return false;
    return true;
}

std::optional<LocalDate> parse_date(const std::string& ymd) {
    if (ymd.size() != 10 || ymd[4] != '-' || ymd[7] != '-') return std::nullopt;
    std::string y = ymd.substr(0, 4), m = ymd.substr(5, 2), d = ymd.substr(8, 2);
    if (!all_digits(y) || !all_digits(m) || !all_digits(d)) return std::nullopt;
    LocalDate out{std::stoi(y), std::stoi(m), std::stoi(d)};
    if (!is_valid_date(out)) return std::nullopt;
    return out;
}

std::optional<LocalTime> parse_local_time(const std::string& hms, const std::string& ymd) {
    LocalTime t;
    std::string hh, mm, ss = "00";
    if (hms.size() == 5 && hms[2] == ':') {
        hh = hms.substr(0, 2); mm = hms.substr(3, 2);
    } else if (hms.size() == 8 && hms[2] == ':' && hms[5] == ':') {
        hh = hms.substr(0, 2); mm = hms.substr(3, 2); ss = hms.substr(6, 2);
    } else {
        return std::nullopt;
    }
    if (!all_digits(hh) || !all_digits(mm) || !all_digits(ss)) return std::nullopt;
    t.hour = std::stoi(hh); t.minute = std::stoi(mm); t.second = std::stoi(ss);
    if (t.hour > 23 || t.minute > 59 || t.second > 59) return std::nullopt;
    if (!ymd.empty()) {
        auto d = parse_date(ymd);
        if (!d) return std::nullopt;
        t.date = *d;
    }
    return t;
}

std::string format_time_of_day(const LocalTime& t) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", t.hour, t.minute, t.second);
    return std::string(buf);
}

std::string format_date(const LocalDate& d) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
    return std::string(buf);
}

std::optional<uint8_t> parse_weekdays(const std::string& csv) {
    uint8_t days = 0;
    std::stringstream in(csv);
    std::string tok;
    while (std::getline(in, tok, ',')) {
        std::string t;
        for (char c : tok) if (!isspace((unsigned char)c)) t.push_back((char)tolower((unsigned char)c));
        if (t.empty()) continue;
        bool found = false;
        for (int i = 0; i < 7; ++i) {
            // accept "mon" and "monday"
            if (t.compare(0, 3, kDayNames[i]) == 0) { days |= uint8_t(1u << i); found = true; break; }
        }
        if (!found) return std::nullopt;
    }
    return days;
}

std::string format_weekdays(uint8_t days) {
    std::string out;
    for (int i = 0; i < 7; ++i) {
        if (days & (1u << i)) {
            if (!out.empty()) out += ",";
            out += kDayNames[i];
        }
    }
    return out;
}

std::optional<Recurrence> make_recurrence(const std::string& kind, uint8_t weekdays, int64_t interval_sec) {
    if (kind.empty() || kind == "none" || kind == "once") return Recurrence{Once{}};
    if (kind == "daily") return Recurrence{Daily{}};
    if (kind == "weekly") return Recurrence{Weekly{weekdays}};
    if (kind == "custom") return Recurrence{Custom{interval_sec}};
    return std::nullopt;
}

std::string to_json(const EventRecord& r) {
    std::ostringstream ss;
    ss << '{';
    ss << "\"id\":" << r.id;
    ss << ",\"owner_context\":" << json_quote(r.owner_context);
    ss << ",\"time\":" << json_quote(format_time_of_day(r.local_time));
    ss << ",\"date\":";
    if (r.local_time.date) ss << json_quote(format_date(*r.local_time.date)); else ss << "null";
    ss << ",\"timezone\":" << json_quote(r.timezone);
    ss << ",\"recurrence\":" << json_quote(recurrence_name(r.recurrence));
    int weekdays = 0;
    int64_t interval = 0;
    if (auto w = std::get_if<Weekly>(&r.recurrence)) weekdays = w->days;
    if (auto c = std::get_if<Custom>(&r.recurrence)) interval = c->interval_sec;
    ss << ",\"weekdays\":" << weekdays;
    ss << ",\"interval_sec\":" << interval;
    ss << ",\"next_fire_utc\":" << int64_t(r.next_fire_utc);
    ss << ",\"payload\":" << json_quote(r.payload);
    ss << ",\"version\":" << r.version;
    ss << ",\"state\":" << json_quote(state_name(r.state));
    ss << ",\"created_utc\":" << int64_t(r.created_utc);
    ss << ",\"updated_utc\":" << int64_t(r.updated_utc);
    ss << ",\"last_fired_utc\":" << int64_t(r.last_fired_utc);
    ss << ",\"fire_count\":" << r.fire_count;
    ss << '}';
    return ss.str();
}

std::optional<EventRecord> from_json(const std::string& js) {
    EventRecord r;
    try {
        auto id = json_extract_int_present(js, "id");
        if (!id.first || id.second <= 0) return std::nullopt;
        r.id = uint64_t(id.second);

        auto owner = json_extract_string_present(js, "owner_context");
        if (!owner.first) return std::nullopt;
        r.owner_context = owner.second;

        auto date = json_extract_string_opt_present(js, "date");
        auto lt = parse_local_time(json_extract_string(js, "time"), date.second.value_or(std::string()));
        if (!lt) return std::nullopt;
        r.local_time = *lt;

        r.timezone = json_extract_string(js, "timezone");
        if (r.timezone.empty()) return std::nullopt;

        int64_t weekdays = json_extract_int_opt(js, "weekdays").value_or(0);
        if (weekdays < 0 || weekdays > 0x7f) return std::nullopt;
        auto rec = make_recurrence(json_extract_string(js, "recurrence"), uint8_t(weekdays),
                                   json_extract_int_opt(js, "interval_sec").value_or(0));
        if (!rec) return std::nullopt;
        r.recurrence = *rec;

        auto next = json_extract_int_present(js, "next_fire_utc");
        if (!next.first) return std::nullopt;
        r.next_fire_utc = time_t(next.second);

        r.payload = json_extract_string(js, "payload");

        auto version = json_extract_int_present(js, "version");
        if (!version.first || version.second <= 0) return std::nullopt;
        r.version = uint64_t(version.second);

        auto st = parse_state(json_extract_string(js, "state"));
        if (!st) return std::nullopt;
        r.state = *st;

        r.created_utc = time_t(json_extract_int_opt(js, "created_utc").value_or(0));
        r.updated_utc = time_t(json_extract_int_opt(js, "updated_utc").value_or(0));
        r.last_fired_utc = time_t(json_extract_int_opt(js, "last_fired_utc").value_or(0));
        r.fire_count = uint32_t(json_extract_int_opt(js, "fire_count").value_or(0));
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
    return r;
}

}
