#include "RecoveryManager.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"
#include "../recurrence/TimeResolver.h"
#include "../store/PersistentStore.h"

namespace engine {

RecoveryManager::RecoveryManager(store::PersistentStore& store, EventRegistry& registry, const Clock& clock,
                                 int64_t grace_sec, int64_t retention_sec)
    : store_(store), registry_(registry), clock_(clock), grace_sec_(grace_sec), retention_sec_(retention_sec) {}

RecoveryReport RecoveryManager::run() {
    auto& metrics = observability::Metrics::instance();
    RecoveryReport report;
    const time_t now = clock_.now();

    auto scan = store_.scan();
    report.loaded = int(scan.records.size());
    report.corrupt = scan.corrupt;
    if (scan.corrupt > 0) metrics.inc_event("corrupt_skipped", uint64_t(scan.corrupt));
    registry_.install(scan.records);

    for (const auto& rec : scan.records) {
        if (rec.state != model::EventState::Active) continue;
        const time_t due_at = registry_.due_at(rec);
        if (due_at > now) continue;
        const int64_t overdue = int64_t(now) - int64_t(due_at);
        if (overdue <= grace_sec_) {
            // stays queued at its past instant: fires once on the first pass, then advances
            ++report.due_now;
            metrics.inc_event("recovered_due");
            observability::log_info("recovery.due_now", {{"id", int64_t(rec.id)}, {"overdue_sec", overdue}});
            continue;
        }
        auto r = registry_.skip_missed(rec.id);
        if (!r.ok()) {
            observability::log_warn("recovery.skip_failed", {{"id", int64_t(rec.id)}, {"status", status_name(r.status)}});
            continue;
        }
        metrics.inc_event("missed_skipped");
        if (r.record->state == model::EventState::Completed) {
            ++report.completed_missed;
            observability::log_warn("recovery.missed_completed", {{"id", int64_t(rec.id)}, {"overdue_sec", overdue}});
        } else {
            ++report.skipped_missed;
            observability::log_warn("recovery.missed_skipped", {{"id", int64_t(rec.id)}, {"overdue_sec", overdue},
                                                                {"next_fire_utc", recurrence::format_iso_z(r.record->next_fire_utc)}});
        }
    }

    report.garbage_collected = registry_.collect_garbage(retention_sec_);

    observability::log_info("recovery.done", {
        {"loaded", int64_t(report.loaded)}, {"due_now", int64_t(report.due_now)},
        {"skipped_missed", int64_t(report.skipped_missed)}, {"completed_missed", int64_t(report.completed_missed)},
        {"corrupt", int64_t(report.corrupt)}, {"garbage_collected", int64_t(report.garbage_collected)}});
    return report;
}

}
