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
    map_[k] += 1;
}

void Metrics::observe_latency(const std::string& path, const std::string& method, double latency_ms) {
    const auto& buckets = latency_buckets();
    MetricsKey k{path, method, 0};
    std::lock_guard lock(mu_);
    auto& h = hist_[k];
    if (h.buckets.empty()) h.buckets.assign(buckets.size(), 0);
    h.count += 1;
    h.sum += latency_ms;
    for (size_t i = 0; i < buckets.size(); ++i) { if (latency_ms <= buckets[i]) { h.buckets[i] += 1; } }
}

void Metrics::add_occurrences_expanded(uint64_t n) {
    std::lock_guard lock(mu_);
    occurrences_expanded_ += n;
}

void Metrics::add_conflicts_detected(uint64_t n) {
    std::lock_guard lock(mu_);
    conflicts_detected_ += n;
}

void Metrics::inc_scheduling_error(const std::string& code) {
    std::lock_guard lock(mu_);
    scheduling_errors_[code] += 1;
}

std::string Metrics::scrape() const {
    const auto& buckets = latency_buckets();
    std::ostringstream ss;
    std::lock_guard lock(mu_);
    ss << "# HELP http_requests_total Total HTTP requests\n";
    ss << "# TYPE http_requests_total counter\n";
    for (const auto& p : map_) {
        ss << "http_requests_total{path=\"" << p.first.path << "\",method=\"" << p.first.method << "\",code=\"" << p.first.code << "\"} " << p.second << "\n";
    }
    ss << "# HELP http_request_duration_ms Histogram of request durations\n";
    ss << "# TYPE http_request_duration_ms histogram\n";
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
    ss << "# HELP occurrences_expanded_total Occurrences produced by the pattern expander\n";
    ss << "# TYPE occurrences_expanded_total counter\n";
    ss << "occurrences_expanded_total " << occurrences_expanded_ << "\n";
    ss << "# HELP conflicts_detected_total Double-booking conflicts reported\n";
    ss << "# TYPE conflicts_detected_total counter\n";
    ss << "conflicts_detected_total " << conflicts_detected_ << "\n";
    ss << "# HELP scheduling_errors_total Rejected scheduling operations\n";
    ss << "# TYPE scheduling_errors_total counter\n";
    for (const auto& p : scheduling_errors_) {
        ss << "scheduling_errors_total{code=\"" << p.first << "\"} " << p.second << "\n";
    }
    return ss.str();
}

}
