#include "EventRegistry.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"
#include "../recurrence/TimeResolver.h"
#include "../store/PersistentStore.h"

#include <algorithm>

namespace engine {

namespace {

constexpr int kMaxCasAttempts = 64;

MutationResult fail(Status s, std::string message) {
    MutationResult r;
    r.status = s;
    r.message = std::move(message);
    return r;
}

MutationResult ok_result() { return MutationResult{}; }

}

std::string status_name(Status s) {
    switch (s) {
        case Status::Ok: return "ok";
        case Status::NotFound: return "not_found";
        case Status::ValidationError: return "validation_error";
        case Status::InvalidTimezone: return "invalid_timezone";
        case Status::InvalidRecurrence: return "invalid_recurrence";
        case Status::VersionConflict: return "version_conflict";
    }
    return "unknown";
}

EventRegistry::EventRegistry(store::PersistentStore& store, FireQueue& queue, const Clock& clock, std::string default_timezone,
                             int64_t alert_lead_sec)
    : store_(store), queue_(queue), clock_(clock), default_timezone_(std::move(default_timezone)),
      alert_lead_sec_(alert_lead_sec) {}

void EventRegistry::set_change_listener(std::function<void()> fn) {
    std::lock_guard<std::mutex> lk(mu_);
    listener_ = std::move(fn);
}

void EventRegistry::notify_changed() {
    std::function<void()> fn;
    {
        std::lock_guard<std::mutex> lk(mu_);
        fn = listener_;
    }
    if (fn) fn();
}

MutationResult EventRegistry::resolve_schedule(model::EventRecord& rec, bool reject_past) const {
    const time_t now = clock_.now();
    try {
        rec.timezone = recurrence::canonical_timezone(rec.timezone);
        if (std::holds_alternative<model::Custom>(rec.recurrence) && !rec.local_time.date) {
            // the interval counts from the first occurrence on the creation day
            rec.local_time.date = recurrence::local_date_at(now, rec.timezone);
        }
        time_t next = recurrence::resolve(rec.local_time, rec.timezone, rec.recurrence, now);
        if (reject_past && next <= now) return fail(Status::ValidationError, "time is in the past");
        rec.next_fire_utc = next;
    } catch (const recurrence::InvalidTimezone& e) {
        return fail(Status::InvalidTimezone, e.what());
    } catch (const recurrence::InvalidRecurrence& e) {
        return fail(Status::InvalidRecurrence, e.what());
    }
    return ok_result();
}

void EventRegistry::apply(const model::EventRecord& rec) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = records_.find(rec.id);
    if (it != records_.end() && it->second.version >= rec.version) return;
    records_[rec.id] = rec;
    if (rec.state == model::EventState::Active) queue_.push(notify_at(rec), rec.id, rec.version);
    else queue_.remove(rec.id);
}

bool EventRegistry::refresh_from_store(uint64_t id) {
    auto rec = store_.get(id);
    if (!rec) {
        std::lock_guard<std::mutex> lk(mu_);
        records_.erase(id);
        queue_.remove(id);
        return false;
    }
    apply(*rec);
    return true;
}

MutationResult EventRegistry::mutate(uint64_t id, uint64_t expected_version, const Transform& fn) {
    for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
        model::EventRecord current;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = records_.find(id);
            if (it == records_.end()) return fail(Status::NotFound, "event not found");
            current = it->second;
        }
        if (expected_version != 0 && current.version != expected_version) {
            return fail(Status::VersionConflict, "event is at version " + std::to_string(current.version));
        }

        model::EventRecord next = current;
        MutationResult r = fn(next);
        if (!r.ok()) return r;
        next.id = id;
        next.version = current.version + 1;
        next.updated_utc = clock_.now();

        if (store_.put(id, next, current.version) == store::PutResult::Ok) {
            apply(next);
            notify_changed();
            r.record = next;
            return r;
        }
        observability::Metrics::instance().inc_event("version_conflicts");
        observability::log_debug("registry.version_conflict", {{"id", int64_t(id)}, {"version", int64_t(current.version)}, {"attempt", int64_t(attempt)}});
        if (!refresh_from_store(id)) return fail(Status::NotFound, "event not found");
    }
    return fail(Status::VersionConflict, "too many concurrent updates");
}

MutationResult EventRegistry::create(const EventSpec& spec) {
    if (spec.owner_context.empty()) return fail(Status::ValidationError, "owner_context is required");
    if (spec.payload.empty()) return fail(Status::ValidationError, "payload is required");

    model::EventRecord rec;
    rec.owner_context = spec.owner_context;
    rec.local_time = spec.local_time;
    rec.timezone = spec.timezone.empty() ? default_timezone_ : spec.timezone;
    rec.recurrence = spec.recurrence;
    rec.payload = spec.payload;
    auto r = resolve_schedule(rec, true);
    if (!r.ok()) return r;

    rec.version = 1;
    rec.state = model::EventState::Active;
    rec.created_utc = rec.updated_utc = clock_.now();
    for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
        rec.id = store_.next_id();
        if (store_.put(rec.id, rec, 0) == store::PutResult::Ok) {
            apply(rec);
            observability::log_info("registry.created", {
                {"id", int64_t(rec.id)}, {"owner_context", rec.owner_context},
                {"recurrence", model::recurrence_name(rec.recurrence)}, {"timezone", rec.timezone},
                {"next_fire_utc", recurrence::format_iso_z(rec.next_fire_utc)}});
            notify_changed();
            r.record = rec;
            return r;
        }
        observability::log_warn("registry.id_taken", {{"id", int64_t(rec.id)}});
    }
    return fail(Status::VersionConflict, "could not allocate an id");
}

MutationResult EventRegistry::modify(uint64_t id, const EventPatch& patch) {
    if (patch.payload && patch.payload->empty()) return fail(Status::ValidationError, "payload must not be empty");
    auto r = mutate(id, patch.expected_version, [&](model::EventRecord& rec) {
        if (rec.state != model::EventState::Active) return fail(Status::NotFound, "event is not active");
        if (patch.time_of_day) {
            rec.local_time.hour = patch.time_of_day->hour;
            rec.local_time.minute = patch.time_of_day->minute;
            rec.local_time.second = patch.time_of_day->second;
        }
        if (patch.date) rec.local_time.date = *patch.date;
        if (patch.timezone) rec.timezone = patch.timezone->empty() ? default_timezone_ : *patch.timezone;
        if (patch.recurrence) rec.recurrence = *patch.recurrence;
        if (patch.payload) rec.payload = *patch.payload;
        if (!patch.changes_schedule()) return ok_result();
        return resolve_schedule(rec, true);
    });
    if (r.ok()) {
        observability::log_info("registry.modified", {{"id", int64_t(id)}, {"version", int64_t(r.record->version)},
                                                      {"next_fire_utc", recurrence::format_iso_z(r.record->next_fire_utc)}});
    }
    return r;
}

MutationResult EventRegistry::cancel(uint64_t id) {
    auto r = mutate(id, 0, [](model::EventRecord& rec) {
        if (rec.state != model::EventState::Active) return fail(Status::NotFound, "event is not active");
        rec.state = model::EventState::Cancelled;
        return ok_result();
    });
    if (r.ok()) observability::log_info("registry.cancelled", {{"id", int64_t(id)}, {"version", int64_t(r.record->version)}});
    return r;
}

MutationResult EventRegistry::record_fire(uint64_t id, time_t occurrence_utc, int64_t grace_sec) {
    const time_t now = clock_.now();
    bool skipped = false;
    auto r = mutate(id, 0, [&](model::EventRecord& rec) {
        skipped = false;
        if (rec.state != model::EventState::Active) return fail(Status::NotFound, "event is not active");
        if (rec.next_fire_utc != occurrence_utc) return fail(Status::VersionConflict, "occurrence was rescheduled");
        rec.last_fired_utc = now;
        rec.fire_count += 1;
        if (!model::is_recurring(rec.recurrence)) {
            rec.state = model::EventState::Completed;
            return ok_result();
        }
        try {
            time_t next = recurrence::resolve(rec.local_time, rec.timezone, rec.recurrence, rec.next_fire_utc);
            if (next - alert_lead_sec_ < now - grace_sec) {
                next = recurrence::resolve(rec.local_time, rec.timezone, rec.recurrence, now);
                skipped = true;
            }
            rec.next_fire_utc = next;
        } catch (const recurrence::InvalidTimezone& e) {
            observability::log_error("registry.advance_failed", {{"id", int64_t(id)}, {"err", std::string(e.what())}});
            rec.state = model::EventState::Completed;
        } catch (const recurrence::InvalidRecurrence& e) {
            observability::log_error("registry.advance_failed", {{"id", int64_t(id)}, {"err", std::string(e.what())}});
            rec.state = model::EventState::Completed;
        }
        return ok_result();
    });
    if (r.ok() && skipped) {
        observability::Metrics::instance().inc_event("missed_skipped");
        observability::log_warn("registry.behind_schedule_skipped", {{"id", int64_t(id)},
                                                                     {"next_fire_utc", recurrence::format_iso_z(r.record->next_fire_utc)}});
    }
    return r;
}

MutationResult EventRegistry::skip_missed(uint64_t id) {
    const time_t now = clock_.now();
    return mutate(id, 0, [&](model::EventRecord& rec) {
        if (rec.state != model::EventState::Active) return fail(Status::NotFound, "event is not active");
        if (!model::is_recurring(rec.recurrence)) {
            rec.state = model::EventState::Completed;
            return ok_result();
        }
        try {
            rec.next_fire_utc = recurrence::resolve(rec.local_time, rec.timezone, rec.recurrence, now);
        } catch (const recurrence::InvalidTimezone& e) {
            observability::log_error("registry.advance_failed", {{"id", int64_t(id)}, {"err", std::string(e.what())}});
            rec.state = model::EventState::Completed;
        } catch (const recurrence::InvalidRecurrence& e) {
            observability::log_error("registry.advance_failed", {{"id", int64_t(id)}, {"err", std::string(e.what())}});
            rec.state = model::EventState::Completed;
        }
        return ok_result();
    });
}

std::optional<model::EventRecord> EventRegistry::get(uint64_t id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

std::vector<model::EventRecord> EventRegistry::snapshot() const {
    std::vector<model::EventRecord> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& kv : records_) {
            if (kv.second.state == model::EventState::Active) out.push_back(kv.second);
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const model::EventRecord& a, const model::EventRecord& b) {
        return a.next_fire_utc < b.next_fire_utc;
    });
    return out;
}

std::vector<model::EventRecord> EventRegistry::list(const std::string& owner_context, bool include_inactive) const {
    std::vector<model::EventRecord> out;
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : records_) {
        if (kv.second.owner_context != owner_context) continue;
        if (!include_inactive && kv.second.state != model::EventState::Active) continue;
        out.push_back(kv.second);
    }
    return out;
}

size_t EventRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return records_.size();
}

void EventRegistry::install(const std::vector<model::EventRecord>& records) {
    for (const auto& rec : records) apply(rec);
}

bool EventRegistry::requeue(uint64_t id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = records_.find(id);
    if (it == records_.end() || it->second.state != model::EventState::Active) {
        queue_.remove(id);
        return false;
    }
    queue_.push(notify_at(it->second), id, it->second.version);
    return true;
}

int EventRegistry::collect_garbage(int64_t retention_sec) {
    const time_t now = clock_.now();
    std::vector<uint64_t> expired;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& kv : records_) {
            const auto& rec = kv.second;
            if (rec.state != model::EventState::Active && rec.updated_utc + retention_sec <= now) expired.push_back(kv.first);
        }
    }
    int removed = 0;
    for (uint64_t id : expired) {
        store_.remove(id);
        std::lock_guard<std::mutex> lk(mu_);
        auto it = records_.find(id);
        if (it != records_.end() && it->second.state != model::EventState::Active) records_.erase(it);
        ++removed;
    }
    if (removed > 0) {
        observability::Metrics::instance().inc_event("gc_removed", uint64_t(removed));
        observability::log_info("registry.gc", {{"removed", int64_t(removed)}});
    }
    return removed;
}

}
