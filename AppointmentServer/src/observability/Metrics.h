#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace observability {

// One counter series: route pattern, method and status (0 for latency series).
struct RouteKey {
    std::string route;
    std::string method;
    int status = 0;

    bool operator==(const RouteKey& o) const noexcept {
        return status == o.status && route == o.route && method == o.method;
    }
};

struct RouteKeyHash {
    size_t operator()(const RouteKey& k) const noexcept;
};

// Process-wide Prometheus text exposition.
class Metrics {
public:
    static Metrics& instance();

    // route is the matched pattern, never the raw target
    void inc(const std::string& route, const std::string& method, int status);
    void observe_latency(const std::string& route, const std::string& method, double latency_ms);

    // outcome is "ok" or an error kind
    void inc_operation(const std::string& operation, const std::string& outcome);
    uint64_t operation_count(const std::string& operation, const std::string& outcome) const;

    std::string scrape() const;

private:
    Metrics() = default;

    struct Histogram {
        std::vector<uint64_t> buckets;
        double sum = 0.0;
        uint64_t count = 0;
    };

    std::unordered_map<RouteKey, uint64_t, RouteKeyHash> requests_;
    std::unordered_map<RouteKey, Histogram, RouteKeyHash> latency_;
    std::map<std::pair<std::string, std::string>, uint64_t> operations_;
    mutable std::mutex mu_;
};

}
