#include "SchedulerLoop.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"
#include "../recurrence/TimeResolver.h"
#include "../store/PersistentStore.h"

#include <algorithm>

namespace engine {

std::string loop_state_name(LoopState s) {
    switch (s) {
        case LoopState::Idle: return "idle";
        case LoopState::Waiting: return "waiting";
        case LoopState::Firing: return "firing";
        case LoopState::Draining: return "draining";
        case LoopState::Stopped: return "stopped";
    }
    return "unknown";
}

SchedulerLoop::SchedulerLoop(boost::asio::io_context& ioc, EventRegistry& registry, FireQueue& queue,
                             notify::NotificationSink& sink, const Clock& clock, SchedulerOptions opts)
    : ioc_(ioc), timer_(ioc), gc_timer_(ioc), registry_(registry), queue_(queue), sink_(sink), clock_(clock), opts_(opts) {}

void SchedulerLoop::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;
    auto self = shared_from_this();
    boost::asio::post(ioc_, [self]{
        observability::log_info("scheduler.started", {{"queued", int64_t(self->queue_.size())}, {"grace_sec", self->opts_.grace_sec}});
        // anything already due (recovered catch-up) fires right away
        self->on_wake();
        self->schedule_gc();
    });
}

void SchedulerLoop::stop() {
    {
        std::lock_guard<std::mutex> lk(wait_mu_);
        if (stopping_.exchange(true)) return;
    }
    wait_cv_.notify_all();
    auto self = shared_from_this();
    boost::asio::post(ioc_, [self]{
        self->state_ = LoopState::Draining;
        boost::system::error_code ec;
        self->timer_.cancel(ec);
        self->gc_timer_.cancel(ec);
        self->state_ = LoopState::Stopped;
        observability::log_info("scheduler.stopped", {{"queued", int64_t(self->queue_.size())}});
    });
}

void SchedulerLoop::notify_changed() {
    if (stopping_ || !running_) return;
    auto self = shared_from_this();
    boost::asio::post(ioc_, [self]{
        if (self->stopping_) return;
        self->schedule_next();
    });
}

void SchedulerLoop::schedule_next() {
    if (stopping_) return;
    observability::Metrics::instance().set_queue_depth(int64_t(queue_.size()));
    std::chrono::seconds delay = opts_.max_sleep;
    auto next = queue_.peek_min();
    if (next) {
        int64_t until = int64_t(next->fire_at) - int64_t(clock_.now());
        delay = std::chrono::seconds(std::clamp<int64_t>(until, 0, opts_.max_sleep.count()));
        state_ = LoopState::Waiting;
        observability::log_debug("scheduler.waiting", {{"id", int64_t(next->id)}, {"fire_at", recurrence::format_iso_z(next->fire_at)}, {"delay_sec", int64_t(delay.count())}});
    } else {
        state_ = LoopState::Idle;
    }
    // re-arming cancels the previous wait
    timer_.expires_after(delay);
    auto self = shared_from_this();
    timer_.async_wait([self](const boost::system::error_code& ec){
        if (ec) return;
        self->on_wake();
    });
}

void SchedulerLoop::on_wake() {
    if (stopping_) return;
    try {
        fire_due();
    } catch (const store::StoreError& e) {
        fail("fire", e);
        return;
    }
    schedule_next();
}

void SchedulerLoop::fail(const std::string& where, const std::exception& e) {
    observability::log_error("scheduler.store_error", {{"where", where}, {"err", std::string(e.what())}});
    failed_ = true;
    stop();
    if (fatal_handler_) fatal_handler_();
}

void SchedulerLoop::schedule_gc() {
    if (stopping_) return;
    gc_timer_.expires_after(opts_.gc_interval);
    auto self = shared_from_this();
    gc_timer_.async_wait([self](const boost::system::error_code& ec){
        if (ec) return;
        self->run_gc();
        self->schedule_gc();
    });
}

void SchedulerLoop::run_gc() {
    if (stopping_) return;
    try {
        registry_.collect_garbage(opts_.retention_sec);
    } catch (const store::StoreError& e) {
        fail("gc", e);
    }
}

int SchedulerLoop::fire_due() {
    state_ = LoopState::Firing;
    auto& metrics = observability::Metrics::instance();
    int delivered = 0;
    auto due = queue_.pop_due(clock_.now());
    for (const auto& entry : due) {
        if (stopping_) {
            // no fire on shutdown; the record is untouched and recovery picks it up
            registry_.requeue(entry.id);
            continue;
        }
        auto rec = registry_.get(entry.id);
        if (!rec || rec->state != model::EventState::Active) {
            observability::log_debug("scheduler.skip_inactive", {{"id", int64_t(entry.id)}});
            continue;
        }
        if (rec->version != entry.version) {
            metrics.inc_event("stale_skipped");
            observability::log_info("scheduler.stale_entry", {{"id", int64_t(entry.id)}, {"queued_version", int64_t(entry.version)}, {"version", int64_t(rec->version)}});
            registry_.requeue(entry.id);
            continue;
        }

        // missed beyond the grace window (suspend, long stall): skip instead of firing late
        const int64_t overdue = int64_t(clock_.now()) - int64_t(registry_.due_at(*rec));
        if (overdue > opts_.grace_sec) {
            auto r = registry_.skip_missed(entry.id);
            if (r.ok()) {
                metrics.inc_event("missed_skipped");
                observability::log_warn("scheduler.missed_skipped", {
                    {"id", int64_t(entry.id)}, {"overdue_sec", overdue}, {"state", model::state_name(r.record->state)},
                    {"next_fire_utc", recurrence::format_iso_z(r.record->next_fire_utc)}});
            } else {
                observability::log_info("scheduler.skip_superseded", {{"id", int64_t(entry.id)}, {"status", status_name(r.status)}});
            }
            continue;
        }

        notify::Notification n;
        n.event_id = rec->id;
        n.owner_context = rec->owner_context;
        n.payload = rec->payload;
        n.scheduled_utc = rec->next_fire_utc;
        n.lead_sec = registry_.alert_lead_sec();
        n.occurrence = rec->fire_count + 1;

        Delivery d = deliver_with_retry(n);
        if (d == Delivery::Abandoned) {
            registry_.requeue(entry.id);
            continue;
        }
        if (d == Delivery::Delivered) {
            ++delivered;
            metrics.inc_event("fired");
        }
        auto r = registry_.record_fire(entry.id, n.scheduled_utc, opts_.grace_sec);
        if (r.ok()) {
            observability::log_info("scheduler.fired", {
                {"id", int64_t(entry.id)}, {"occurrence", int64_t(n.occurrence)},
                {"delivered", std::string(d == Delivery::Delivered ? "true" : "false")},
                {"state", model::state_name(r.record->state)},
                {"next_fire_utc", recurrence::format_iso_z(r.record->next_fire_utc)}});
        } else {
            // rescheduled or cancelled while the notification was in flight; the newer schedule stands
            observability::log_info("scheduler.fire_superseded", {{"id", int64_t(entry.id)}, {"status", status_name(r.status)}});
        }
    }
    observability::Metrics::instance().set_queue_depth(int64_t(queue_.size()));
    state_ = stopping_ ? LoopState::Draining : LoopState::Idle;
    return delivered;
}

SchedulerLoop::Delivery SchedulerLoop::deliver_with_retry(const notify::Notification& n) {
    auto& metrics = observability::Metrics::instance();
    std::chrono::milliseconds backoff = opts_.backoff;
    for (int attempt = 1; attempt <= opts_.max_attempts; ++attempt) {
        try {
            sink_.deliver(n, opts_.delivery_timeout);
            return Delivery::Delivered;
        } catch (const std::exception& e) {
            observability::log_warn("scheduler.delivery_failed", {{"id", int64_t(n.event_id)}, {"attempt", int64_t(attempt)}, {"err", std::string(e.what())}});
        }
        if (attempt == opts_.max_attempts) break;
        metrics.inc_event("delivery_retried");
        if (!wait_backoff(backoff)) return Delivery::Abandoned;
        backoff = std::min(backoff * 2, opts_.backoff_max);
    }
    metrics.inc_event("delivery_failed");
    observability::log_error("scheduler.delivery_gave_up", {{"id", int64_t(n.event_id)}, {"attempts", int64_t(opts_.max_attempts)}});
    return Delivery::GaveUp;
}

bool SchedulerLoop::wait_backoff(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lk(wait_mu_);
    return !wait_cv_.wait_for(lk, d, [this]{ return stopping_.load(); });
}

}
