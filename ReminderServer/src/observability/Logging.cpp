#include "Logging.h"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace observability {

static std::atomic<int> g_level{2};
static std::mutex g_out_mu;

void set_log_level(int level) {
    if (level < 1) level = 1;
    if (level > 4) level = 4;
    g_level = level;
}

bool log_enabled(int level) { return level >= g_level; }

static int64_t now_ms() {
    using namespace std::chrono;
    return static_cast<int64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static void put_escaped(std::ostringstream& ss, const std::string& s) {
    ss << '"';
    for (char c : s) {
        switch (c) {
            case '"': ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    ss << buf;
                } else {
                    ss << c;
                }
        }
    }
    ss << '"';
}

namespace {

struct PutValue {
    std::ostringstream& ss;
    void operator()(const std::string& v) const { put_escaped(ss, v); }
    void operator()(int64_t v) const { ss << v; }
    void operator()(double v) const { ss << std::fixed << std::setprecision(3) << v; }
};

}

static void emit(int level, const char* name, const std::string& msg, const Fields& fields) {
    if (!log_enabled(level)) return;
    std::ostringstream ss;
    ss << "{\"ts\":" << now_ms() << ",\"level\":\"" << name << "\",\"msg\":";
    put_escaped(ss, msg);
    for (const auto& f : fields) {
        ss << ',';
        put_escaped(ss, f.first);
        ss << ':';
        std::visit(PutValue{ss}, f.second);
    }
    ss << "}\n";
    std::lock_guard<std::mutex> lk(g_out_mu);
    std::cout << ss.str() << std::flush;
}

void log_debug(const std::string& msg, const Fields& fields) { emit(1, "DEBUG", msg, fields); }
void log_info(const std::string& msg, const Fields& fields) { emit(2, "INFO", msg, fields); }
void log_warn(const std::string& msg, const Fields& fields) { emit(3, "WARN", msg, fields); }
void log_error(const std::string& msg, const Fields& fields) { emit(4, "ERROR", msg, fields); }

}
