// === src/StatsCollector/StatsCollector.cpp ===
#include "StatsCollector.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

static double ratio(uint64_t num, uint64_t den) {
    if (den == 0) return 0.0;
    return std::min(1.0, static_cast<double>(num) / static_cast<double>(den));
}

nlohmann::json StatsSnapshot::to_json() const {
    nlohmann::json j;
    j["total_requests"]         = total_requests;
    j["hit_rate"]               = hit_rate;
    j["avg_latency_ms"]         = avg_latency_ms;
    j["cost_savings"]           = cost_savings;
    j["volatile_hits"]          = volatile_tier.hits;
    j["volatile_misses"]        = volatile_tier.misses;
    j["volatile_hit_rate"]      = volatile_tier.hit_rate;
    j["durable_hits"]           = durable_tier.hits;
    j["durable_misses"]         = durable_tier.misses;
    j["durable_hit_rate"]       = durable_tier.hit_rate;
    j["writes"]                 = writes;
    j["cost_savings_by_class"]  = cost_savings_by_class;
    return j;
}


StatsCollector::StatsCollector(double hit_rate_floor, uint64_t warn_interval)
    : hit_rate_floor_(std::min(1.0, std::max(0.0, hit_rate_floor))),
      warn_interval_(warn_interval ? warn_interval : 1) {}


// total_requests is bumped before the hit counter so that a concurrent
// snapshot (which reads hits first) never sees hits > total.
void StatsCollector::record_volatile_hit(const std::string& cache_class, double unit_cost, double latency_ms) {
    total_requests_.fetch_add(1);
    volatile_hits_.fetch_add(1);
    record_latency(latency_ms);
    add_savings(cache_class, unit_cost);
    maybe_warn_low_hit_rate();
}

void StatsCollector::record_durable_hit(const std::string& cache_class, double unit_cost, double latency_ms) {
    total_requests_.fetch_add(1);
    volatile_misses_.fetch_add(1);
    durable_hits_.fetch_add(1);
    record_latency(latency_ms);
    add_savings(cache_class, unit_cost);
    maybe_warn_low_hit_rate();
}

void StatsCollector::record_miss(double latency_ms) {
    total_requests_.fetch_add(1);
    volatile_misses_.fetch_add(1);
    durable_misses_.fetch_add(1);
    record_latency(latency_ms);
    maybe_warn_low_hit_rate();
}

void StatsCollector::record_write() {
    writes_.fetch_add(1, std::memory_order_relaxed);
}


// Desc: incremental mean, avg += (sample - avg) / n
// In: double latency_ms
// Out: void
void StatsCollector::record_latency(double latency_ms) {
    std::lock_guard<std::mutex> lk(mu_);
    ++latency_samples_;
    avg_latency_ms_ += (latency_ms - avg_latency_ms_) / static_cast<double>(latency_samples_);
}

void StatsCollector::add_savings(const std::string& cache_class, double unit_cost) {
    std::lock_guard<std::mutex> lk(mu_);
    cost_savings_ += unit_cost;
    savings_by_class_[cache_class] += unit_cost;
}

double StatsCollector::hit_rate() const {
    const uint64_t hits = volatile_hits_.load() + durable_hits_.load();
    return ratio(hits, total_requests_.load());
}

// Advisory only: checked every warn_interval_ requests, never changes control flow.
void StatsCollector::maybe_warn_low_hit_rate() {
    const uint64_t total = total_requests_.load(std::memory_order_relaxed);
    if (total == 0 || total % warn_interval_ != 0) return;
    const double rate = hit_rate();
    if (rate < hit_rate_floor_) {
        low_rate_warnings_.fetch_add(1, std::memory_order_relaxed);
        std::ostringstream os;
        os << std::fixed << std::setprecision(1)
           << "low cache hit rate " << rate * 100.0 << "% over " << total
           << " requests (floor " << hit_rate_floor_ * 100.0 << "%)";
        log_warn("StatsCollector", os.str());
    }
}


StatsSnapshot StatsCollector::get_stats() const {
    StatsSnapshot s;
    // hits before totals, see record_volatile_hit
    s.volatile_tier.hits   = volatile_hits_.load();
    s.durable_tier.hits    = durable_hits_.load();
    s.volatile_tier.misses = volatile_misses_.load();
    s.durable_tier.misses  = durable_misses_.load();
    s.writes               = writes_.load();
    s.total_requests       = total_requests_.load();

    s.hit_rate = ratio(s.volatile_tier.hits + s.durable_tier.hits, s.total_requests);
    s.volatile_tier.hit_rate = ratio(s.volatile_tier.hits, s.volatile_tier.hits + s.volatile_tier.misses);
    s.durable_tier.hit_rate  = ratio(s.durable_tier.hits, s.durable_tier.hits + s.durable_tier.misses);

    std::lock_guard<std::mutex> lk(mu_);
    s.avg_latency_ms = avg_latency_ms_;
    s.cost_savings = cost_savings_;
    s.cost_savings_by_class = savings_by_class_;
    return s;
}

void StatsCollector::log_performance_report() const {
    const StatsSnapshot s = get_stats();
    std::ostringstream os;
    os << std::fixed << std::setprecision(2)
       << "cache performance report\n"
       << "  total requests : " << s.total_requests << "\n"
       << "  hit rate       : " << s.hit_rate * 100.0 << "%\n"
       << "  avg latency    : " << s.avg_latency_ms << " ms\n"
       << "  cost savings   : $" << s.cost_savings << "\n"
       << "  volatile       : hits=" << s.volatile_tier.hits << " misses=" << s.volatile_tier.misses
       << " (" << s.volatile_tier.hit_rate * 100.0 << "%)\n"
       << "  durable        : hits=" << s.durable_tier.hits << " misses=" << s.durable_tier.misses
       << " (" << s.durable_tier.hit_rate * 100.0 << "%)\n"
       << "  writes         : " << s.writes;
    for (const auto& kv : s.cost_savings_by_class) {
        os << "\n  saved[" << kv.first << "] : $" << kv.second;
    }
    log_info("StatsCollector", os.str());
}

void StatsCollector::reset() {
    volatile_hits_ = 0;
    volatile_misses_ = 0;
    durable_hits_ = 0;
    durable_misses_ = 0;
    writes_ = 0;
    total_requests_ = 0;
    low_rate_warnings_ = 0;
    std::lock_guard<std::mutex> lk(mu_);
    latency_samples_ = 0;
    avg_latency_ms_ = 0.0;
    cost_savings_ = 0.0;
    savings_by_class_.clear();
}
