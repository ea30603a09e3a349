#pragma once

#include <cstdint>
#include <string>

namespace config {

struct Config {
    enum class LogLevel { DEBUG, INFO, WARN, ERROR };
    enum class StoreBackend { FILE, POSTGRES };

    uint16_t port = 8080;
    bool http_enabled = true;
    LogLevel log_level = LogLevel::INFO;
    bool metrics_enabled = true;
    bool access_log = true;

    StoreBackend store_backend = StoreBackend::FILE;
    std::string store_dir = "./data";
    std::string database_url;
    int64_t store_lock_key = 5924639;

    // catch-up and delivery policy
    int64_t grace_window_sec = 300;
    int delivery_max_attempts = 3;
    int delivery_backoff_ms = 500;
    int delivery_backoff_max_ms = 10000;
    int delivery_timeout_ms = 5000;
    int64_t retention_sec = 7 * 24 * 3600;
    int gc_interval_sec = 3600;
    int max_sleep_sec = 60;
    int64_t alert_lead_sec = 0;

    std::string webhook_url;
    std::string default_timezone = "UTC";
    bool scheduler_disabled = false;

    static Config from_env(int argc, char** argv);
};

int log_level_number(Config::LogLevel level);

}
