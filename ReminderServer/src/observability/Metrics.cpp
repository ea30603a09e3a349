#include "Metrics.h"

namespace observability {

static const std::vector<double>& latency_buckets() {
    static const std::vector<double> buckets = {1,2,5,10,20,50,100,200,500,1000,2000,5000};
    return buckets;
}

Metrics& Metrics::instance() {
    static Metrics m;
    return m;
}

Metrics::Metrics() {}

void Metrics::inc(const std::string& path, const std::string& method, int code) {
    MetricsKey k{path, method, code};
    std::lock_guard lock(mu_);
    auto it = map_.find(k);
    if (it == map_.end()) map_.emplace(k, 1);
    else it->second += 1;
}

void Metrics::observe_latency(const std::string& path, const std::string& method, double latency_ms) {
    const auto& buckets = latency_buckets();
    MetricsKey k{path, method, 0};
    std::lock_guard lock(mu_);
    auto it = hist_.find(k);
    if (it == hist_.end()) {
        HistData h;
        h.buckets.assign(buckets.size(), 0);
        it = hist_.emplace(k, std::move(h)).first;
    }
    auto& h = it->second;
    h.count += 1;
    h.sum += latency_ms;
    for (size_t i = 0; i < buckets.size(); ++i) { if (latency_ms <= buckets[i]) { h.buckets[i] += 1; } }
}

void Metrics::inc_event(const std::string& name, uint64_t by) {
    std::lock_guard lock(mu_);
    events_[name] += by;
}

uint64_t Metrics::event_count(const std::string& name) const {
    std::lock_guard lock(mu_);
    auto it = events_.find(name);
    return it == events_.end() ? 0 : it->second;
}

void Metrics::set_queue_depth(int64_t depth) {
    std::lock_guard lock(mu_);
    queue_depth_ = depth;
}

std::string Metrics::scrape() const {
    std::ostringstream ss;
    std::lock_guard lock(mu_);
    ss << "# HELP http_requests_total Total HTTP requests\n";
    ss << "# TYPE http_requests_total counter\n";
    for (const auto& p : map_) {
        ss << "http_requests_total{path=\"" << p.first.path << "\",method=\"" << p.first.method << "\",code=\"" << p.first.code << "\"} " << p.second << "\n";
    }
    ss << "# HELP http_request_duration_ms Histogram of request durations\n";
    ss << "# TYPE http_request_duration_ms histogram\n";
    const auto& buckets = latency_buckets();
    for (const auto& p : hist_) {
        const auto& k = p.first;
        const auto& h = p.second;
        for (size_t i = 0; i < buckets.size(); ++i) {
            ss << "http_request_duration_ms_bucket{path=\"" << k.path << "\",method=\"" << k.method << "\",le=\"" << buckets[i] << "\"} " << h.buckets[i] << "\n";
        }
        ss << "http_request_duration_ms_bucket{path=\"" << k.path << "\",method=\"" << k.method << "\",le=\"+Inf\"} " << h.count << "\n";
        ss << "http_request_duration_ms_sum{path=\"" << k.path << "\",method=\"" << k.method << "\"} " << h.sum << "\n";
        ss << "http_request_duration_ms_count{path=\"" << k.path << "\",method=\"" << k.method << "\"} " << h.count << "\n";
    }
    ss << "# HELP reminder_events_total Scheduling engine events\n";
    ss << "# TYPE reminder_events_total counter\n";
    for (const auto& p : events_) {
        ss << "reminder_events_total{name=\"" << p.first << "\"} " << p.second << "\n";
    }
    ss << "# HELP reminder_queue_depth Pending entries in the fire queue\n";
    ss << "# TYPE reminder_queue_depth gauge\n";
    ss << "reminder_queue_depth " << queue_depth_ << "\n";
    return ss.str();
}

}
