#include "Config.h"
#include <cstdlib>
#include <string>
#include <algorithm>
#include <stdexcept>

namespace config {

static std::string getenv_or(const char* name, const char* def) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string(def);
}

static Config::LogLevel parse_level(const std::string& s) {
    std::string u = s;
    std::transform(u.begin(), u.end(), u.begin(), ::toupper);
    if (u == "DEBUG") return Config::LogLevel::DEBUG;
    if (u == "WARN") return Config::LogLevel::WARN;
    if (u == "ERROR") return Config::LogLevel::ERROR;
    return Config::LogLevel::INFO;
}

static Config::StoreBackend parse_backend(const std::string& s) {
    std::string l = s;
    std::transform(l.begin(), l.end(), l.begin(), ::tolower);
    if (l == "postgres" || l == "pg") return Config::StoreBackend::POSTGRES;
    return Config::StoreBackend::FILE;
}

// malformed values keep the default
static void read_int(const char* name, int& out) {
    auto v = getenv_or(name, "");
    if (v.empty()) return;
    try { out = std::stoi(v); } catch (const std::exception&) {}
}

static void read_int64(const char* name, int64_t& out) {
    auto v = getenv_or(name, "");
    if (v.empty()) return;
    try { out = std::stoll(v); } catch (const std::exception&) {}
}

int log_level_number(Config::LogLevel level) {
    switch (level) {
        case Config::LogLevel::DEBUG: return 1;
        case Config::LogLevel::INFO: return 2;
        case Config::LogLevel::WARN: return 3;
        case Config::LogLevel::ERROR: return 4;
    }
    return 2;
}

Config Config::from_env(int argc, char** argv) {
    Config c;
    auto lp = getenv_or("PORT", "8080");
    try {
        int p = std::stoi(lp);
        if (p >= 0 && p <= 65535) c.port = static_cast<uint16_t>(p);
    } catch (const std::exception&) {}
    c.http_enabled = getenv_or("HTTP_ENABLED", "1") != "0";
    c.log_level = parse_level(getenv_or("LOG_LEVEL", "INFO"));
    c.metrics_enabled = getenv_or("METRICS_ENABLED", "1") != "0";
    c.access_log = getenv_or("ACCESS_LOG", "1") != "0";

    c.store_backend = parse_backend(getenv_or("STORE_BACKEND", "file"));
    c.store_dir = getenv_or("STORE_DIR", "./data");
    c.database_url = getenv_or("DATABASE_URL", "");
    read_int64("STORE_LOCK_KEY", c.store_lock_key);

    read_int64("GRACE_WINDOW_SEC", c.grace_window_sec);
    read_int("DELIVERY_MAX_ATTEMPTS", c.delivery_max_attempts);
    read_int("DELIVERY_BACKOFF_MS", c.delivery_backoff_ms);
    read_int("DELIVERY_BACKOFF_MAX_MS", c.delivery_backoff_max_ms);
    read_int("DELIVERY_TIMEOUT_MS", c.delivery_timeout_ms);
    read_int64("RETENTION_SEC", c.retention_sec);
    read_int("GC_INTERVAL_SEC", c.gc_interval_sec);
    read_int("MAX_SLEEP_SEC", c.max_sleep_sec);
    read_int64("ALERT_LEAD_SEC", c.alert_lead_sec);

    c.webhook_url = getenv_or("WEBHOOK_URL", "");
    c.default_timezone = getenv_or("DEFAULT_TIMEZONE", "UTC");
    if (c.default_timezone.empty()) c.default_timezone = "UTC";
    c.scheduler_disabled = getenv_or("DISABLE_EVENT_SCHEDULER", "0") == "1";

    // command line wins over environment
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--port" && i+1 < argc) {
            try {
                int p = std::stoi(argv[i+1]);
                if (p >= 0 && p <= 65535) c.port = static_cast<uint16_t>(p);
            } catch (const std::exception&) {}
            ++i;
        } else if (a == "--store-dir" && i+1 < argc) {
            c.store_dir = argv[i+1];
            ++i;
        }
    }

    c.grace_window_sec = std::clamp<int64_t>(c.grace_window_sec, 0, 7 * 24 * 3600);
    c.delivery_max_attempts = std::clamp(c.delivery_max_attempts, 1, 20);
    c.delivery_backoff_ms = std::clamp(c.delivery_backoff_ms, 0, 60000);
    c.delivery_backoff_max_ms = std::clamp(c.delivery_backoff_max_ms, c.delivery_backoff_ms, 600000);
    c.delivery_timeout_ms = std::clamp(c.delivery_timeout_ms, 100, 120000);
    c.retention_sec = std::clamp<int64_t>(c.retention_sec, 0, 366LL * 24 * 3600);
    c.gc_interval_sec = std::clamp(c.gc_interval_sec, 1, 24 * 3600);
    c.max_sleep_sec = std::clamp(c.max_sleep_sec, 1, 3600);
    c.alert_lead_sec = std::clamp<int64_t>(c.alert_lead_sec, 0, 7 * 24 * 3600);
    return c;
}

}
