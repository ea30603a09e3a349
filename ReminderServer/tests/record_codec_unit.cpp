#include <iostream>
#include <string>
#include "model/EventRecord.h"
#include "store/FileStore.h"

static model::EventRecord sample() {
    model::EventRecord r;
    r.id = 42;
    r.owner_context = "chat:1001";
    r.local_time = model::LocalTime{7, 45, 0, model::LocalDate{2030, 3, 5}};
    r.timezone = "Europe/Berlin";
    r.recurrence = model::Weekly{0x15};
    r.next_fire_utc = 1898930700;
    r.payload = "stand-up \"daily\"\nbring coffee";
    r.version = 3;
    r.created_utc = 1898900000;
    r.updated_utc = 1898910000;
    r.fire_count = 2;
    return r;
}

int main() {
    // field parsing
    if (model::parse_local_time("24:00", "")) { std::cerr << "hour 24 accepted\n"; return 1; }
    if (model::parse_local_time("9:5", "")) { std::cerr << "short fields accepted\n"; return 1; }
    if (!model::parse_local_time("09:05", "")) { std::cerr << "HH:MM rejected\n"; return 1; }
    if (model::parse_local_time("09:05", "2030-02-30")) { std::cerr << "Feb 30 accepted\n"; return 1; }
    if (!model::parse_date("2028-02-29")) { std::cerr << "leap day rejected\n"; return 1; }
    if (model::parse_weekdays("mon,funday")) { std::cerr << "unknown day accepted\n"; return 1; }
    if (model::format_weekdays(0x41) != "mon,sun") { std::cerr << "format_weekdays\n"; return 1; }
    if (model::make_recurrence("hourly", 0, 0)) { std::cerr << "unknown recurrence kind accepted\n"; return 1; }

    const auto rec = sample();
    const std::string enc = store::FileStore::encode_record(rec);
    auto back = store::FileStore::decode_record(42, enc);
    if (back.payload != rec.payload || back.timezone != rec.timezone || back.version != 3 || back.fire_count != 2) {
        std::cerr << "decoded record differs\n"; return 1;
    }
    auto w = std::get_if<model::Weekly>(&back.recurrence);
    if (!w || w->days != 0x15) { std::cerr << "weekly day-set lost\n"; return 1; }
    if (!back.local_time.date || back.local_time.date->day != 5 || back.local_time.minute != 45) { std::cerr << "local time lost\n"; return 1; }

    // any flipped byte in the body fails the checksum
    {
        std::string bad = enc;
        bad[bad.find("chat:1001")] = 'C';
        bool threw = false;
        try { store::FileStore::decode_record(42, bad); } catch (const store::CorruptRecord& e) { threw = e.id() == 42; }
        if (!threw) { std::cerr << "tampered record accepted\n"; return 1; }
    }
    // truncated write
    {
        bool threw = false;
        try { store::FileStore::decode_record(42, enc.substr(0, enc.size() / 2)); } catch (const store::CorruptRecord&) { threw = true; }
        if (!threw) { std::cerr << "truncated record accepted\n"; return 1; }
    }
    // file renamed to another id
    {
        bool threw = false;
        try { store::FileStore::decode_record(43, enc); } catch (const store::CorruptRecord&) { threw = true; }
        if (!threw) { std::cerr << "id mismatch accepted\n"; return 1; }
    }

    if (model::from_json("{\"id\":1}")) { std::cerr << "partial record accepted\n"; return 1; }
    auto undated = rec;
    undated.local_time.date.reset();
    undated.recurrence = model::Daily{};
    auto u = model::from_json(model::to_json(undated));
    if (!u || u->local_time.date || !std::holds_alternative<model::Daily>(u->recurrence)) { std::cerr << "undated daily\n"; return 1; }

    std::cout << "record_codec_unit ok\n";
    return 0;
}
