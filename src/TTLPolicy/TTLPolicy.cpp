// === src/TTLPolicy/TTLPolicy.cpp ===
#include "TTLPolicy.hpp"
#include <algorithm>

TTLPolicy::TTLPolicy(uint64_t volatile_ceiling_seconds)
    : fallback_{kHour, kHour, false, 0.01},
      volatile_ceiling_(volatile_ceiling_seconds ? volatile_ceiling_seconds : 1) {}


// Desc: build the production table
// In: uint64_t volatile_ceiling_seconds
// Out: TTLPolicy
TTLPolicy TTLPolicy::defaults(uint64_t volatile_ceiling_seconds) {
    TTLPolicy p(volatile_ceiling_seconds);

    // volatile row = min(durable, 6h); the ceiling still applies at write time
    auto row = [](uint64_t durable, bool eligible, double cost) {
        return TTLRule{std::min<uint64_t>(durable, 6 * kHour), durable, eligible, cost};
    };

    // search state that changes daily
    p.rules_["discovery"]             = row(24 * kHour, true,  0.01);
    p.rules_["marketplace_discovery"] = row(2 * kHour,  true,  0.01);
    // verified records are stable
    p.rules_["address"]               = row(30 * kDay,  true,  0.05);
    p.rules_["details"]               = row(30 * kDay,  true,  0.01);

    p.rules_["zillow_search"]         = row(24 * kHour, false, 0.02);
    p.rules_["zillow_images"]         = row(7 * kDay,   false, 0.01);
    p.rules_["corelogic"]             = row(24 * kHour, false, 0.50);
    p.rules_["property_basic"]        = row(24 * kHour, false, 0.01);
    p.rules_["property_detailed"]     = row(24 * kHour, false, 0.01);
    p.rules_["property_intelligence"] = row(7 * kDay,   false, 2.00);

    // user scoped, short lived
    p.rules_["user_search_history"]   = row(2 * kHour,  false, 0.01);
    p.rules_["user_preferences"]      = row(24 * kHour, false, 0.01);
    p.rules_["api_tokens"]            = row(50 * kMinute, false, 0.01);
    p.rules_["rate_limits"]           = row(2 * kHour,  false, 0.01);
    return p;
}

bool TTLPolicy::set_rule(const std::string& cache_class, const TTLRule& rule, std::string* err) {
    if (cache_class.empty()) {
        if (err) *err = "empty cache class";
        return false;
    }
    if (rule.volatile_seconds == 0 || rule.durable_seconds == 0) {
        if (err) *err = "ttl must be > 0 for class '" + cache_class + "'";
        return false;
    }
    if (rule.durable_seconds < rule.volatile_seconds) {
        if (err) *err = "durable ttl shorter than volatile ttl for class '" + cache_class + "'";
        return false;
    }
    if (rule.estimated_unit_cost < 0.0) {
        if (err) *err = "negative unit cost for class '" + cache_class + "'";
        return false;
    }
    rules_[cache_class] = rule;
    return true;
}

const TTLRule& TTLPolicy::rule_for(const std::string& cache_class) const {
    auto it = rules_.find(cache_class);
    return it == rules_.end() ? fallback_ : it->second;
}

bool TTLPolicy::has_rule(const std::string& cache_class) const {
    return rules_.count(cache_class) != 0;
}

uint64_t TTLPolicy::volatile_ttl(const std::string& cache_class) const { return rule_for(cache_class).volatile_seconds; }
uint64_t TTLPolicy::durable_ttl(const std::string& cache_class) const  { return rule_for(cache_class).durable_seconds; }
bool TTLPolicy::is_durable_eligible(const std::string& cache_class) const { return rule_for(cache_class).durable_eligible; }
double TTLPolicy::unit_cost(const std::string& cache_class) const { return rule_for(cache_class).estimated_unit_cost; }

uint64_t TTLPolicy::effective_volatile_ttl(const std::string& cache_class, const uint64_t* requested) const {
    const uint64_t base = (requested && *requested) ? *requested : volatile_ttl(cache_class);
    return std::min(base, volatile_ceiling_);
}

uint64_t TTLPolicy::effective_durable_ttl(const std::string& cache_class, const uint64_t* requested) const {
    return (requested && *requested) ? *requested : durable_ttl(cache_class);
}

std::vector<std::string> TTLPolicy::classes() const {
    std::vector<std::string> out;
    out.reserve(rules_.size());
    for (const auto& kv : rules_) out.push_back(kv.first);
    return out;
}
