#include <boost/asio.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include "config/Config.h"
#include "engine/Clock.h"
#include "engine/EventRegistry.h"
#include "engine/FireQueue.h"
#include "engine/RecoveryManager.h"
#include "engine/SchedulerLoop.h"
#include "net/EventsApi.h"
#include "net/HttpServer.h"
#include "net/Router.h"
#include "notify/LogSink.h"
#include "notify/WebhookSink.h"
#include "observability/Logging.h"
#include "store/FileStore.h"
#include "store/PgStore.h"

using config::Config;
using observability::log_error;
using observability::log_info;
using observability::log_warn;

namespace {

std::unique_ptr<store::PersistentStore> open_store(const Config& cfg) {
    if (cfg.store_backend == Config::StoreBackend::POSTGRES) {
        return store::PgStore::open(cfg.database_url, cfg.store_lock_key);
    }
    return store::FileStore::open(cfg.store_dir);
}

engine::SchedulerOptions scheduler_options(const Config& cfg) {
    engine::SchedulerOptions o;
    o.grace_sec = cfg.grace_window_sec;
    o.max_attempts = cfg.delivery_max_attempts;
    o.backoff = std::chrono::milliseconds(cfg.delivery_backoff_ms);
    o.backoff_max = std::chrono::milliseconds(cfg.delivery_backoff_max_ms);
    o.delivery_timeout = std::chrono::milliseconds(cfg.delivery_timeout_ms);
    o.retention_sec = cfg.retention_sec;
    o.gc_interval = std::chrono::seconds(cfg.gc_interval_sec);
    o.max_sleep = std::chrono::seconds(cfg.max_sleep_sec);
    return o;
}

}

int main(int argc, char** argv) {
    Config cfg;
    try {
        cfg = Config::from_env(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "config error: " << e.what() << std::endl;
        return 2;
    }
    observability::set_log_level(config::log_level_number(cfg.log_level));

    std::unique_ptr<store::PersistentStore> store;
    try {
        store = open_store(cfg);
    } catch (const store::AlreadyRunning& e) {
        log_error("store.already_running", {{"err", std::string(e.what())}});
        return 3;
    } catch (const store::StoreError& e) {
        log_error("store.open_failed", {{"err", std::string(e.what())}});
        return 2;
    }

    std::unique_ptr<notify::NotificationSink> sink;
    try {
        if (!cfg.webhook_url.empty()) sink = std::make_unique<notify::WebhookSink>(cfg.webhook_url);
        else sink = std::make_unique<notify::LogSink>();
    } catch (const std::invalid_argument& e) {
        log_error("config.bad_webhook_url", {{"err", std::string(e.what())}});
        return 2;
    }

    try {
        engine::SystemClock clock;
        engine::FireQueue queue;
        engine::EventRegistry registry(*store, queue, clock, cfg.default_timezone, cfg.alert_lead_sec);

        engine::RecoveryManager recovery(*store, registry, clock, cfg.grace_window_sec, cfg.retention_sec);
        recovery.run();

        boost::asio::io_context io;
        boost::asio::io_context sched_io;
        auto sched_work = boost::asio::make_work_guard(sched_io);
        std::shared_ptr<engine::SchedulerLoop> scheduler;
        std::thread sched_thread;
        std::optional<HttpServer> server;

        // filled in below, before the HTTP loop runs
        Router router;
        EventsApi api(registry, queue, [&scheduler]{
            return scheduler ? engine::loop_state_name(scheduler->state()) : std::string("disabled");
        });
        api.install(router, cfg.metrics_enabled);

        // bind before the scheduler thread exists so a busy port fails cleanly
        if (cfg.http_enabled) {
            server.emplace(io, cfg.port, router, cfg.metrics_enabled, cfg.access_log);
            log_info("server_start", {{"port", int64_t(server->port())}});
            server->run();
        }

        if (!cfg.scheduler_disabled) {
            scheduler = std::make_shared<engine::SchedulerLoop>(sched_io, registry, queue, *sink, clock, scheduler_options(cfg));
            std::weak_ptr<engine::SchedulerLoop> weak = scheduler;
            registry.set_change_listener([weak]{
                if (auto s = weak.lock()) s->notify_changed();
            });
            scheduler->set_fatal_handler([&io]{ io.stop(); });
            scheduler->start();
            sched_thread = std::thread([&sched_io]{ sched_io.run(); });
        } else {
            log_warn("scheduler.disabled");
        }

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            log_info("shutdown.signal", {{"signal", int64_t(sig)}});
            if (server) server->stop();
            io.stop();
        });

        io.run();

        if (scheduler) scheduler->stop();
        sched_work.reset();
        if (sched_thread.joinable()) sched_thread.join();

        if (scheduler && scheduler->failed()) {
            log_error("shutdown.store_failure");
            return 1;
        }
        log_info("shutdown.done", {{"queued", int64_t(queue.size())}});
    } catch (const store::StoreError& e) {
        log_error("store.fatal", {{"err", std::string(e.what())}});
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "server error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
