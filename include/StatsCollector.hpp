// === include/StatsCollector.hpp ===
#pragma once
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

struct TierStats {
    uint64_t hits{0};
    uint64_t misses{0};
    double   hit_rate{0.0};   // hits / (hits + misses), 0 when idle
};

struct StatsSnapshot {
    uint64_t total_requests{0};
    double   hit_rate{0.0};         // (volatile hits + durable hits) / total_requests, in [0,1]
    double   avg_latency_ms{0.0};
    double   cost_savings{0.0};
    TierStats volatile_tier;
    TierStats durable_tier;
    uint64_t writes{0};
    std::map<std::string, double> cost_savings_by_class;

    // Flat record, field set stable across calls.
    nlohmann::json to_json() const;
};

// Hit/miss/write accounting shared by every caller of one engine instance.
// Integer counters are atomics; the latency mean and cost sums are guarded by
// a mutex so concurrent samples are never lost.
class StatsCollector {
public:
    explicit StatsCollector(double hit_rate_floor = 0.5, uint64_t warn_interval = 100);

    void record_volatile_hit(const std::string& cache_class, double unit_cost, double latency_ms);
    void record_durable_hit(const std::string& cache_class, double unit_cost, double latency_ms);
    // A full miss counts against both tiers.
    void record_miss(double latency_ms);
    void record_write();

    StatsSnapshot get_stats() const;
    double hit_rate() const;
    void log_performance_report() const;
    void reset();

    double hit_rate_floor() const { return hit_rate_floor_; }
    uint64_t low_hit_rate_warnings() const { return low_rate_warnings_.load(std::memory_order_relaxed); }

private:
    void record_latency(double latency_ms);
    void add_savings(const std::string& cache_class, double unit_cost);
    void maybe_warn_low_hit_rate();

    std::atomic<uint64_t> volatile_hits_{0};
    std::atomic<uint64_t> volatile_misses_{0};
    std::atomic<uint64_t> durable_hits_{0};
    std::atomic<uint64_t> durable_misses_{0};
    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> low_rate_warnings_{0};

    mutable std::mutex mu_;
    uint64_t latency_samples_{0};
    double   avg_latency_ms_{0.0};
    double   cost_savings_{0.0};
    std::map<std::string, double> savings_by_class_;

    const double   hit_rate_floor_;
    const uint64_t warn_interval_;
};
