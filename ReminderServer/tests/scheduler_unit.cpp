#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "engine/EventRegistry.h"
#include "engine/FireQueue.h"
#include "engine/SchedulerLoop.h"
#include "observability/Metrics.h"
#include "store/FileStore.h"
#include "test_util.h"

using namespace engine;

namespace {

class RecordingSink : public notify::NotificationSink {
public:
    void deliver(const notify::Notification& n, std::chrono::milliseconds) override {
        if (during_delivery) during_delivery(n);
        std::lock_guard<std::mutex> lk(w.mu);
        ++calls;
        if (fail_always || calls <= fail_first) throw notify::DeliveryError("endpoint down");
        got.push_back(n);
        ++w.done;
        w.cv.notify_all();
    }
    size_t delivered() {
        std::lock_guard<std::mutex> lk(w.mu);
        return got.size();
    }
    bool wait_for(size_t n, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(w.mu);
        return w.cv.wait_for(lk, timeout, [&]{ return got.size() >= n; });
    }

    // runs on the firing thread before the notification is accepted
    std::function<void(const notify::Notification&)> during_delivery;
    Waiter w;
    std::vector<notify::Notification> got;
    int calls = 0;
    int fail_first = 0;
    bool fail_always = false;
};

EventSpec spec_at(int h, int m, model::Recurrence rec, std::optional<model::LocalDate> date = std::nullopt) {
    EventSpec s;
    s.owner_context = "chat:5";
    s.local_time = model::LocalTime{h, m, 0, date};
    s.timezone = "UTC";
    s.recurrence = rec;
    s.payload = "drink water";
    return s;
}

SchedulerOptions fast_options() {
    SchedulerOptions o;
    o.backoff = std::chrono::milliseconds(1);
    o.backoff_max = std::chrono::milliseconds(4);
    o.max_sleep = std::chrono::seconds(1);
    return o;
}

uint64_t counter(const std::string& name) { return observability::Metrics::instance().event_count(name); }

}

#define CHECK(cond, msg) do { if (!(cond)) { std::cerr << msg << "\n"; return 1; } } while (0)

int main() {
    const model::LocalDate today{2030, 3, 5};

    // direct firing passes
    {
        TempDir tmp("scheduler");
        auto st = store::FileStore::open(tmp.path);
        FireQueue queue;
        ManualClock clock(kBaseTime);
        EventRegistry reg(*st, queue, clock);
        RecordingSink sink;
        boost::asio::io_context ioc;
        auto loop = std::make_shared<SchedulerLoop>(ioc, reg, queue, sink, clock, fast_options());

        auto daily = reg.create(spec_at(12, 30, model::Daily{}));
        CHECK(daily.ok(), "create daily");
        const uint64_t id = daily.record->id;

        CHECK(loop->fire_due() == 0 && sink.delivered() == 0, "fired early");
        clock.set(kBaseTime + 1800);
        CHECK(loop->fire_due() == 1, "due event not fired");
        CHECK(sink.got[0].event_id == id && sink.got[0].occurrence == 1 && sink.got[0].scheduled_utc == kBaseTime + 1800, "notification fields");
        auto after = reg.get(id);
        CHECK(after->next_fire_utc == kBaseTime + 1800 + 86400 && after->fire_count == 1, "daily not advanced");
        CHECK(queue.find(id)->version == after->version, "queue not at new version");
        CHECK(loop->fire_due() == 0, "fired twice");

        // an entry left over from an older version is dropped and re-queued at the current one
        auto once = reg.create(spec_at(13, 0, model::Once{}, today));
        CHECK(once.ok(), "create once");
        EventPatch p;
        p.payload = std::string("updated text");
        CHECK(reg.modify(once.record->id, p).ok(), "modify once");
        queue.push(once.record->next_fire_utc, once.record->id, 1);
        clock.set(kBaseTime + 3600);
        uint64_t stale_before = counter("stale_skipped");
        CHECK(loop->fire_due() == 0, "stale entry fired");
        CHECK(counter("stale_skipped") == stale_before + 1, "stale_skipped not counted");
        CHECK(loop->fire_due() == 1 && sink.got.back().payload == "updated text", "requeued entry did not fire with the new payload");
        CHECK(reg.get(once.record->id)->state == model::EventState::Completed, "once not completed");

        // cancellation before the fire wins even if an entry lingers
        auto doomed = reg.create(spec_at(14, 0, model::Once{}, today));
        CHECK(doomed.ok(), "create doomed");
        CHECK(reg.cancel(doomed.record->id).ok(), "cancel");
        queue.push(doomed.record->next_fire_utc, doomed.record->id, doomed.record->version);
        clock.set(kBaseTime + 2 * 3600);
        size_t before = sink.delivered();
        loop->fire_due();
        CHECK(sink.delivered() == before, "cancelled event fired");

        // transient failures are retried
        auto flaky = reg.create(spec_at(15, 0, model::Once{}, today));
        CHECK(flaky.ok(), "create flaky");
        {
            std::lock_guard<std::mutex> lk(sink.w.mu);
            sink.fail_first = sink.calls + 2;
        }
        uint64_t retried_before = counter("delivery_retried");
        clock.set(kBaseTime + 3 * 3600);
        CHECK(loop->fire_due() == 1, "flaky delivery not retried to success");
        CHECK(counter("delivery_retried") == retried_before + 2, "retries not counted");

        // permanent failure gives up after max_attempts and still advances the record
        auto lost = reg.create(spec_at(16, 0, model::Once{}, today));
        CHECK(lost.ok(), "create lost");
        sink.fail_always = true;
        uint64_t failed_before = counter("delivery_failed");
        int calls_before = sink.calls;
        clock.set(kBaseTime + 4 * 3600);
        CHECK(loop->fire_due() == 0, "failed delivery reported as delivered");
        CHECK(sink.calls - calls_before == 3, "attempts: " << sink.calls - calls_before);
        CHECK(counter("delivery_failed") == failed_before + 1, "delivery_failed not counted");
        CHECK(reg.get(lost.record->id)->state == model::EventState::Completed, "given-up once left active");
    }

    // a payload edit that lands while the notification is in flight neither blocks the fire
    // record nor causes a second delivery of the same occurrence
    {
        TempDir tmp("scheduler-edit");
        auto st = store::FileStore::open(tmp.path);
        FireQueue queue;
        ManualClock clock(kBaseTime);
        EventRegistry reg(*st, queue, clock);
        RecordingSink sink;
        boost::asio::io_context ioc;
        auto loop = std::make_shared<SchedulerLoop>(ioc, reg, queue, sink, clock, fast_options());

        auto daily = reg.create(spec_at(12, 30, model::Daily{}));
        CHECK(daily.ok(), "create daily");
        const uint64_t id = daily.record->id;
        bool edited = false;
        bool edit_ok = false;
        sink.during_delivery = [&](const notify::Notification&) {
            if (edited) return;
            edited = true;
            EventPatch p;
            p.payload = std::string("drink more water");
            edit_ok = reg.modify(id, p).ok();
        };

        clock.set(kBaseTime + 1800);
        CHECK(loop->fire_due() == 1, "edited event not fired");
        CHECK(edited && edit_ok, "payload edit during delivery failed");
        CHECK(loop->fire_due() == 0, "occurrence delivered twice after a payload edit");
        CHECK(sink.calls == 1, "sink calls: " << sink.calls);
        auto rec = reg.get(id);
        CHECK(rec->fire_count == 1 && rec->payload == "drink more water", "fire not recorded: count " << rec->fire_count);
        CHECK(rec->next_fire_utc == kBaseTime + 1800 + 86400, "daily not advanced after the edit");
        CHECK(queue.find(id) && queue.find(id)->version == rec->version, "queue not at the latest version");
    }

    // woken long after the grace window: the missed single-shot completes without a delivery
    {
        TempDir tmp("scheduler-overdue");
        auto st = store::FileStore::open(tmp.path);
        FireQueue queue;
        ManualClock clock(kBaseTime);
        EventRegistry reg(*st, queue, clock);
        RecordingSink sink;
        boost::asio::io_context ioc;
        auto loop = std::make_shared<SchedulerLoop>(ioc, reg, queue, sink, clock, fast_options());

        auto once = reg.create(spec_at(13, 0, model::Once{}, today));
        CHECK(once.ok(), "create once");
        auto daily = reg.create(spec_at(13, 0, model::Daily{}));
        CHECK(daily.ok(), "create daily");
        uint64_t missed_before = counter("missed_skipped");
        clock.set(kBaseTime + 10 * 86400);
        CHECK(loop->fire_due() == 0, "overdue events delivered");
        CHECK(sink.calls == 0, "sink called for overdue events");
        CHECK(counter("missed_skipped") == missed_before + 2, "missed_skipped not counted");
        auto o = reg.get(once.record->id);
        CHECK(o->state == model::EventState::Completed && o->fire_count == 0, "overdue once not completed");
        auto d = reg.get(daily.record->id);
        CHECK(d->state == model::EventState::Active && d->next_fire_utc == clock.now() + 3600, "overdue daily not moved ahead");
        CHECK(queue.find(daily.record->id)->fire_at == d->next_fire_utc, "overdue daily not re-queued");

        // inside the grace window it still fires late
        clock.set(d->next_fire_utc + 200);
        CHECK(loop->fire_due() == 1, "fire within grace skipped");
    }

    // with an alert lead the notification goes out early and carries the occurrence instant
    {
        TempDir tmp("scheduler-lead");
        auto st = store::FileStore::open(tmp.path);
        FireQueue queue;
        ManualClock clock(kBaseTime);
        EventRegistry reg(*st, queue, clock, "UTC", 600);
        RecordingSink sink;
        boost::asio::io_context ioc;
        auto loop = std::make_shared<SchedulerLoop>(ioc, reg, queue, sink, clock, fast_options());

        auto r = reg.create(spec_at(13, 0, model::Daily{}));
        CHECK(r.ok(), "create");
        CHECK(r.record->next_fire_utc == kBaseTime + 3600, "stored instant moved by the lead");
        CHECK(queue.find(r.record->id)->fire_at == kBaseTime + 3000, "queued at " << queue.find(r.record->id)->fire_at);

        clock.set(kBaseTime + 3000 - 60);
        CHECK(loop->fire_due() == 0, "fired before the lead");
        clock.set(kBaseTime + 3000);
        CHECK(loop->fire_due() == 1, "not fired at the lead");
        CHECK(sink.got[0].scheduled_utc == kBaseTime + 3600 && sink.got[0].lead_sec == 600, "lead fields");
        auto rec = reg.get(r.record->id);
        CHECK(rec->next_fire_utc == kBaseTime + 3600 + 86400, "not advanced past the occurrence");
        CHECK(queue.find(r.record->id)->fire_at == rec->next_fire_utc - 600, "next entry ignores the lead");

        // created inside its lead window (later than lead minus grace): goes out at once, not skipped
        clock.set(kBaseTime + 3540);
        auto late = reg.create(spec_at(13, 1, model::Once{}, today));
        CHECK(late.ok(), "create inside the lead");
        CHECK(loop->fire_due() == 1, "event created inside its lead was not delivered");
        CHECK(sink.got.back().event_id == late.record->id && sink.got.back().scheduled_utc == kBaseTime + 3660, "late-created notification");
        CHECK(reg.get(late.record->id)->state == model::EventState::Completed, "late-created once not completed");
    }

    // stop() interrupts a backoff wait; the event stays pending for the next start
    {
        TempDir tmp("scheduler-stop");
        auto st = store::FileStore::open(tmp.path);
        FireQueue queue;
        ManualClock clock(kBaseTime);
        EventRegistry reg(*st, queue, clock);
        RecordingSink sink;
        sink.fail_always = true;
        boost::asio::io_context ioc;
        SchedulerOptions o = fast_options();
        o.backoff = std::chrono::seconds(30);
        o.backoff_max = std::chrono::seconds(30);
        auto loop = std::make_shared<SchedulerLoop>(ioc, reg, queue, sink, clock, o);

        auto r = reg.create(spec_at(12, 10, model::Once{}, today));
        CHECK(r.ok(), "create");
        clock.set(kBaseTime + 600);
        auto t0 = std::chrono::steady_clock::now();
        std::thread firing([&]{ loop->fire_due(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        loop->stop();
        firing.join();
        auto took = std::chrono::steady_clock::now() - t0;
        CHECK(took < std::chrono::seconds(5), "stop did not interrupt the backoff");
        CHECK(loop->stopping(), "not stopping");
        auto rec = reg.get(r.record->id);
        CHECK(rec->state == model::EventState::Active && rec->fire_count == 0, "abandoned fire changed the record");
        CHECK(queue.contains(r.record->id), "abandoned entry not re-queued");
    }

    // timer-driven: a registry change wakes the loop, which fires on its own thread
    {
        TempDir tmp("scheduler-loop");
        auto st = store::FileStore::open(tmp.path);
        FireQueue queue;
        ManualClock clock(kBaseTime);
        EventRegistry reg(*st, queue, clock);
        RecordingSink sink;
        boost::asio::io_context ioc;
        auto work = boost::asio::make_work_guard(ioc);
        auto loop = std::make_shared<SchedulerLoop>(ioc, reg, queue, sink, clock, fast_options());
        reg.set_change_listener([loop]{ loop->notify_changed(); });
        loop->start();
        std::thread runner([&]{ ioc.run(); });

        auto r = reg.create(spec_at(12, 0, model::Once{}, model::LocalDate{2030, 3, 5}));
        CHECK(r.status == Status::ValidationError, "instant equal to now accepted");
        r = reg.create(spec_at(12, 1, model::Once{}, today));
        CHECK(r.ok(), "create timed");
        clock.set(kBaseTime + 60);
        loop->notify_changed();
        bool fired = sink.wait_for(1, std::chrono::seconds(5));
        loop->stop();
        work.reset();
        runner.join();
        reg.set_change_listener(nullptr);
        CHECK(fired, "loop did not fire the due event");
        CHECK(loop->state() == LoopState::Stopped, "state after stop: " << loop_state_name(loop->state()));
    }

    std::cout << "scheduler_unit ok\n";
    return 0;
}
