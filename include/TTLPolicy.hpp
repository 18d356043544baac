// === include/TTLPolicy.hpp ===
#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct TTLRule {
    uint64_t volatile_seconds{0};
    uint64_t durable_seconds{0};
    bool     durable_eligible{false};
    double   estimated_unit_cost{0.01};
};

// Per data-class TTL table. The volatile tier additionally clamps every TTL to
// a hard ceiling because it is sized for hot data.
class TTLPolicy {
public:
    static constexpr uint64_t kMinute = 60;
    static constexpr uint64_t kHour   = 60 * kMinute;
    static constexpr uint64_t kDay    = 24 * kHour;
    static constexpr uint64_t kDefaultVolatileCeiling = 6 * kHour;

    explicit TTLPolicy(uint64_t volatile_ceiling_seconds = kDefaultVolatileCeiling);

    static TTLPolicy defaults(uint64_t volatile_ceiling_seconds = kDefaultVolatileCeiling);

    // Replace or add a row. Returns false (and leaves the table untouched)
    // when durable_seconds < volatile_seconds or either TTL is zero.
    bool set_rule(const std::string& cache_class, const TTLRule& rule, std::string* err = nullptr);

    // Row for cache_class, or the fallback row for unknown classes.
    const TTLRule& rule_for(const std::string& cache_class) const;
    bool has_rule(const std::string& cache_class) const;

    uint64_t volatile_ttl(const std::string& cache_class) const;
    uint64_t durable_ttl(const std::string& cache_class) const;
    bool     is_durable_eligible(const std::string& cache_class) const;
    double   unit_cost(const std::string& cache_class) const;

    // min(requested ?? policy.volatile, ceiling)
    uint64_t effective_volatile_ttl(const std::string& cache_class,
                                    const uint64_t* requested = nullptr) const;
    // requested ?? policy.durable
    uint64_t effective_durable_ttl(const std::string& cache_class,
                                   const uint64_t* requested = nullptr) const;

    uint64_t volatile_ceiling() const { return volatile_ceiling_; }
    void set_volatile_ceiling(uint64_t seconds) { volatile_ceiling_ = seconds ? seconds : 1; }

    const TTLRule& fallback() const { return fallback_; }
    std::vector<std::string> classes() const;

private:
    std::map<std::string, TTLRule> rules_;
    TTLRule fallback_;
    uint64_t volatile_ceiling_;
};
