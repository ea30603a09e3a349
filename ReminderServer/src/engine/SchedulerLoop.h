#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <boost/asio.hpp>

#include "Clock.h"
#include "EventRegistry.h"
#include "FireQueue.h"
#include "../notify/NotificationSink.h"

namespace engine {

struct SchedulerOptions {
    int64_t grace_sec = 300;
    int max_attempts = 3;
    std::chrono::milliseconds backoff{500};
    std::chrono::milliseconds backoff_max{10000};
    std::chrono::milliseconds delivery_timeout{5000};
    int64_t retention_sec = 7 * 24 * 3600;
    std::chrono::seconds gc_interval{3600};
    std::chrono::seconds max_sleep{60};
};

enum class LoopState { Idle, Waiting, Firing, Draining, Stopped };

std::string loop_state_name(LoopState s);

// Single coordinating task. Sleeps on a timer until the earliest queued fire (never longer than
// max_sleep, so wall-clock jumps are noticed), fires everything due, and re-arms. Every registry
// change re-arms the timer. Runs entirely on the given io_context.
class SchedulerLoop : public std::enable_shared_from_this<SchedulerLoop> {
public:
    SchedulerLoop(boost::asio::io_context& ioc, EventRegistry& registry, FireQueue& queue,
                  notify::NotificationSink& sink, const Clock& clock, SchedulerOptions opts = {});

    void start();
    // Draining: the delivery in progress finishes, nothing further fires. Thread-safe.
    void stop();
    // The earliest deadline may have moved. Thread-safe.
    void notify_changed();

    // One firing pass over everything due now; returns the number of notifications handed to the
    // sink successfully. Throws store::StoreError.
    int fire_due();

    LoopState state() const { return state_.load(); }
    bool failed() const { return failed_.load(); }
    bool stopping() const { return stopping_.load(); }
    // invoked on the loop thread when a store error stopped the loop
    void set_fatal_handler(std::function<void()> fn) { fatal_handler_ = std::move(fn); }

private:
    enum class Delivery { Delivered, GaveUp, Abandoned };

    void schedule_next();
    void on_wake();
    void schedule_gc();
    void run_gc();
    void fail(const std::string& where, const std::exception& e);
    Delivery deliver_with_retry(const notify::Notification& n);
    // false when stop() interrupted the wait
    bool wait_backoff(std::chrono::milliseconds d);

    boost::asio::io_context& ioc_;
    boost::asio::steady_timer timer_;
    boost::asio::steady_timer gc_timer_;
    EventRegistry& registry_;
    FireQueue& queue_;
    notify::NotificationSink& sink_;
    const Clock& clock_;
    SchedulerOptions opts_;

    std::atomic<LoopState> state_{LoopState::Idle};
    std::atomic_bool running_{false};
    std::atomic_bool stopping_{false};
    std::atomic_bool failed_{false};
    std::function<void()> fatal_handler_;

    std::mutex wait_mu_;
    std::condition_variable wait_cv_;
};

}
