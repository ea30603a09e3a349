#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include "observability/Logging.h"

using namespace observability;

// Redirects stdout into a file for its lifetime; take() restores stdout and returns what was written.
class StdoutCapture {
public:
    explicit StdoutCapture(const std::string& path) : path_(path) {
        std::fflush(stdout);
        saved_ = dup(fileno(stdout));
        ok_ = saved_ != -1 && std::freopen(path_.c_str(), "w+", stdout) != nullptr;
    }
    ~StdoutCapture() { restore(); }

    bool ok() const { return ok_; }

    std::string take() {
        restore();
        std::ifstream in(path_);
        std::string out((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        std::remove(path_.c_str());
        return out;
    }

private:
    void restore() {
        if (saved_ == -1) return;
        std::cout.flush();
        std::fflush(stdout);
        dup2(saved_, fileno(stdout));
        close(saved_);
        saved_ = -1;
    }

    std::string path_;
    int saved_ = -1;
    bool ok_ = false;
};

static std::vector<std::string> lines_of(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream in(s);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) out.push_back(line);
    }
    return out;
}

int main() {
    set_log_level(2);

    {
        StdoutCapture cap("/tmp/logging_unit_levels.txt");
        if (!cap.ok()) { std::cerr << "stdout capture failed\n"; return 1; }
        log_debug("scheduler.waiting");
        log_info("registry.created", {{"id", int64_t(1)}});
        log_warn("recovery.missed_skipped");
        log_error("scheduler.store_error");
        auto lines = lines_of(cap.take());
        if (lines.size() != 3) { std::cerr << "expected 3 lines at INFO, got " << lines.size() << "\n"; return 1; }
        const char* levels[] = {"INFO", "WARN", "ERROR"};
        for (size_t i = 0; i < lines.size(); ++i) {
            const auto& l = lines[i];
            if (l.rfind("{\"ts\":", 0) != 0 || l.back() != '}') { std::cerr << "not a json record: " << l << "\n"; return 1; }
            if (l.find(std::string("\"level\":\"") + levels[i] + "\"") == std::string::npos) { std::cerr << "level order: " << l << "\n"; return 1; }
        }
        if (lines[0].find("\"msg\":\"registry.created\",\"id\":1}") == std::string::npos) { std::cerr << "info record: " << lines[0] << "\n"; return 1; }
    }

    {
        StdoutCapture cap("/tmp/logging_unit_fields.txt");
        if (!cap.ok()) { std::cerr << "stdout capture failed\n"; return 1; }
        set_log_level(3);
        log_info("filtered-out");
        log_warn("scheduler.delivery_failed", {{"id", int64_t(42)}, {"err", std::string("quote \" and\nnewline\x01")}, {"attempt", int64_t(2)}, {"latency_ms", 1.5}});
        set_log_level(2);
        auto out = cap.take();
        if (out.find("filtered-out") != std::string::npos) { std::cerr << "INFO line passed a WARN filter\n"; return 1; }
        if (out.find("\"err\":\"quote \\\" and\\nnewline\\u0001\"") == std::string::npos) { std::cerr << "string field not escaped: " << out << "\n"; return 1; }
        if (out.find("\"latency_ms\":1.500") == std::string::npos) { std::cerr << "double field format: " << out << "\n"; return 1; }
        // keys come out sorted
        if (out.find("\"attempt\":2,\"err\":") == std::string::npos || out.find("\"id\":42,\"latency_ms\"") == std::string::npos) {
            std::cerr << "field order: " << out << "\n"; return 1;
        }
    }

    set_log_level(0);
    if (!log_enabled(1)) { std::cerr << "level below DEBUG not clamped\n"; return 1; }
    set_log_level(9);
    if (log_enabled(3) || !log_enabled(4)) { std::cerr << "level above ERROR not clamped\n"; return 1; }
    set_log_level(2);

    {
        StdoutCapture cap("/tmp/logging_unit_threads.txt");
        if (!cap.ok()) { std::cerr << "stdout capture failed\n"; return 1; }
        const int threads = 4;
        const int iters = 500;
        std::vector<std::thread> th;
        for (int t = 0; t < threads; ++t) {
            th.emplace_back([t]{
                for (int i = 0; i < iters; ++i) log_info("scheduler.fired", {{"thread", int64_t(t)}, {"n", int64_t(i)}});
            });
        }
        for (auto& t : th) t.join();
        auto lines = lines_of(cap.take());
        if (lines.size() != size_t(threads * iters)) { std::cerr << "expected " << threads * iters << " lines, got " << lines.size() << "\n"; return 1; }
        for (const auto& l : lines) {
            if (l.rfind("{\"ts\":", 0) != 0 || l.back() != '}' || l.find("{\"ts\":", 1) != std::string::npos) {
                std::cerr << "interleaved record: " << l << "\n"; return 1;
            }
        }
    }

    std::cout << "logging_unit ok\n";
    return 0;
}
