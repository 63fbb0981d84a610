#include "Metrics.h"
#include <sstream>
#include <boost/functional/hash.hpp>

namespace observability {

namespace {

const std::vector<double>& latency_buckets() {
    static const std::vector<double> b = {1, 2, 5, 10, 20, 50, 100, 200, 500, 1000, 2000, 5000};
    return b;
}

std::string route_labels(const RouteKey& k) {
    return "path=\"" + k.route + "\",method=\"" + k.method + "\"";
}

}

size_t RouteKeyHash::operator()(const RouteKey& k) const noexcept {
    size_t seed = 0;
    boost::hash_combine(seed, k.route);
    boost::hash_combine(seed, k.method);
    boost::hash_combine(seed, k.status);
    return seed;
}

Metrics& Metrics::instance() {
    static Metrics m;
    return m;
}

void Metrics::inc(const std::string& route, const std::string& method, int status) {
    std::lock_guard<std::mutex> lock(mu_);
    ++requests_[RouteKey{route, method, status}];
}

void Metrics::observe_latency(const std::string& route, const std::string& method, double latency_ms) {
    const auto& bounds = latency_buckets();
    std::lock_guard<std::mutex> lock(mu_);
    auto& h = latency_[RouteKey{route, method, 0}];
    if (h.buckets.empty()) h.buckets.assign(bounds.size(), 0);
    ++h.count;
    h.sum += latency_ms;
    for (size_t i = 0; i < bounds.size(); ++i) {
        if (latency_ms <= bounds[i]) ++h.buckets[i];
    }
}

void Metrics::inc_operation(const std::string& operation, const std::string& outcome) {
    std::lock_guard<std::mutex> lock(mu_);
    ++operations_[{operation, outcome}];
}

uint64_t Metrics::operation_count(const std::string& operation, const std::string& outcome) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = operations_.find({operation, outcome});
    return it == operations_.end() ? 0 : it->second;
}

std::string Metrics::scrape() const {
    const auto& bounds = latency_buckets();
    std::ostringstream ss;
    std::lock_guard<std::mutex> lock(mu_);

    ss << "# HELP http_requests_total Total HTTP requests\n"
       << "# TYPE http_requests_total counter\n";
    for (const auto& p : requests_) {
        ss << "http_requests_total{" << route_labels(p.first) << ",code=\"" << p.first.status << "\"} " << p.second << "\n";
    }

    ss << "# HELP http_request_duration_ms Histogram of request durations\n"
       << "# TYPE http_request_duration_ms histogram\n";
    for (const auto& p : latency_) {
        const std::string labels = route_labels(p.first);
        const Histogram& h = p.second;
        for (size_t i = 0; i < bounds.size(); ++i) {
            ss << "http_request_duration_ms_bucket{" << labels << ",le=\"" << bounds[i] << "\"} " << h.buckets[i] << "\n";
        }
        ss << "http_request_duration_ms_bucket{" << labels << ",le=\"+Inf\"} " << h.count << "\n"
           << "http_request_duration_ms_sum{" << labels << "} " << h.sum << "\n"
           << "http_request_duration_ms_count{" << labels << "} " << h.count << "\n";
    }

    ss << "# HELP scheduling_operations_total Scheduling operations by outcome\n"
       << "# TYPE scheduling_operations_total counter\n";
    for (const auto& p : operations_) {
        ss << "scheduling_operations_total{operation=\"" << p.first.first << "\",outcome=\"" << p.first.second << "\"} " << p.second << "\n";
    }
    return ss.str();
}

}
