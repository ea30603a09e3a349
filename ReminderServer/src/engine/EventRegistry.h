#pragma once

#include <algorithm>
#include <cstdint>
#include <ctime>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../model/EventRecord.h"
#include "Clock.h"
#include "FireQueue.h"

namespace store { class PersistentStore; }

namespace engine {

enum class Status { Ok, NotFound, ValidationError, InvalidTimezone, InvalidRecurrence, VersionConflict };

std::string status_name(Status s);

struct MutationResult {
    Status status = Status::Ok;
    std::string message;
    std::optional<model::EventRecord> record;

    bool ok() const { return status == Status::Ok; }
};

struct EventSpec {
    std::string owner_context;
    model::LocalTime local_time;
    std::string timezone;            // empty: registry default
    model::Recurrence recurrence;
    std::string payload;
};

// Fields left empty are kept. `date` holding an empty inner optional clears the date.
struct EventPatch {
    std::optional<model::LocalTime> time_of_day;     // only hour/minute/second are used
    std::optional<std::optional<model::LocalDate>> date;
    std::optional<std::string> timezone;
    std::optional<model::Recurrence> recurrence;
    std::optional<std::string> payload;
    uint64_t expected_version = 0;                    // 0: apply to whatever is current

    bool changes_schedule() const { return time_of_day || date || timezone || recurrence; }
};

// In-memory view of every record, backed by the store. Every mutation is durably written before the
// cache and the fire queue change; writes to the same record are linearized by version with
// compare-and-swap against the store.
class EventRegistry {
public:
    // alert_lead_sec: how long before each occurrence its notification is due
    EventRegistry(store::PersistentStore& store, FireQueue& queue, const Clock& clock, std::string default_timezone = "UTC",
                  int64_t alert_lead_sec = 0);

    // StoreError from the store propagates out of every mutating call
    MutationResult create(const EventSpec& spec);
    MutationResult modify(uint64_t id, const EventPatch& patch);
    MutationResult cancel(uint64_t id);

    std::optional<model::EventRecord> get(uint64_t id) const;
    // active records ordered by next fire
    std::vector<model::EventRecord> snapshot() const;
    std::vector<model::EventRecord> list(const std::string& owner_context, bool include_inactive = false) const;
    size_t size() const;

    // Recovery: take records as loaded from the store; active ones are queued.
    void install(const std::vector<model::EventRecord>& records);
    // Re-queue an active record at its current next fire; false when gone or inactive.
    bool requeue(uint64_t id);

    // After a delivery of the occurrence at `occurrence_utc`: single-shots complete, recurring events
    // advance. An occurrence already older than the grace window is skipped to the next future one.
    // Edits that kept the occurrence (payload only) do not stop the fire from being recorded;
    // VersionConflict when the record no longer points at that occurrence.
    MutationResult record_fire(uint64_t id, time_t occurrence_utc, int64_t grace_sec);
    // Skip an occurrence missed beyond the grace window without firing it.
    MutationResult skip_missed(uint64_t id);

    // Delete Cancelled/Completed records whose last update is older than retention_sec.
    int collect_garbage(int64_t retention_sec);

    void set_change_listener(std::function<void()> fn);

    // instant the record's next notification is due, next_fire_utc less the alert lead
    time_t notify_at(const model::EventRecord& rec) const { return rec.next_fire_utc - alert_lead_sec_; }
    // instant the grace window counts from: an edit made inside the lead moves it up to the edit,
    // never past the occurrence itself
    time_t due_at(const model::EventRecord& rec) const {
        return std::min(std::max(notify_at(rec), rec.updated_utc), rec.next_fire_utc);
    }
    int64_t alert_lead_sec() const { return alert_lead_sec_; }

private:
    using Transform = std::function<MutationResult(model::EventRecord&)>;

    // read-modify-CAS loop; `fn` edits a copy of the current record and returns a non-Ok status to abort
    MutationResult mutate(uint64_t id, uint64_t expected_version, const Transform& fn);
    MutationResult resolve_schedule(model::EventRecord& rec, bool reject_past) const;
    bool refresh_from_store(uint64_t id);
    void apply(const model::EventRecord& rec);
    void notify_changed();

    store::PersistentStore& store_;
    FireQueue& queue_;
    const Clock& clock_;
    std::string default_timezone_;
    int64_t alert_lead_sec_;

    mutable std::mutex mu_;
    std::map<uint64_t, model::EventRecord> records_;
    std::function<void()> listener_;
};

}
