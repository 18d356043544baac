// === src/TierManager/TierManager.cpp ===
#include "TierManager.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <exception>
#include <utility>

using nlohmann::json;

namespace {
    const char* kTag = "TierManager";

    // Desc: parse a volatile value; checks layout and that it belongs to these params
    // In: const std::string& bytes, const json& normalized_params, json& data, double& cost
    // Out: int (1 = ok, 0 = different params, -1 = corrupted)
    int decode_volatile(const std::string& bytes, const json& normalized_params,
                        json& data, double& cost) {
        json env = json::parse(bytes, nullptr, false);
        if (env.is_discarded() || !env.is_object()) return -1;
        auto d = env.find("data");
        auto p = env.find("params");
        if (d == env.end() || p == env.end()) return -1;
        if (*p != normalized_params) return 0;
        auto c = env.find("cost");
        cost = (c != env.end() && c->is_number()) ? c->get<double>() : 0.0;
        data = *d;
        return 1;
    }

    // Erases the in-flight slot on every exit path of the leader.
    struct InflightSlot {
        std::mutex& mu;
        std::unordered_map<std::string, std::shared_future<json>>& map;
        std::string key;
        ~InflightSlot() {
            std::lock_guard<std::mutex> lk(mu);
            map.erase(key);
        }
    };
}


TierManager::TierManager(VolatileTier& volatile_tier,
                         DurableTier& durable_tier,
                         const TTLPolicy& policy,
                         StatsCollector& stats,
                         const KeyNormalizer& normalizer,
                         TierManagerOptions options,
                         PromotionQueue* promotions)
    : volatile_(volatile_tier),
      durable_(durable_tier),
      policy_(policy),
      stats_(stats),
      normalizer_(normalizer),
      opts_(std::move(options)),
      promotions_(promotions) {}


GeneratedKey TierManager::make_key(const std::string& type, const json& params,
                                   const KeyOptions& options) const {
    if (options.prefix.empty() && !opts_.key_prefix.empty()) {
        KeyOptions o = options;
        o.prefix = opts_.key_prefix;
        return normalizer_.generate_key(type, params, o);
    }
    return normalizer_.generate_key(type, params, options);
}

std::string TierManager::encode_volatile(const json& normalized_params, const json& payload,
                                         double unit_cost, const json& metadata) {
    json env = json::object();
    env["params"] = normalized_params;
    env["data"]   = payload;
    env["cost"]   = unit_cost;
    env["meta"]   = metadata.is_object() ? metadata : json::object();
    return env.dump();
}


// Desc: tiered lookup: volatile, then durable (+promotion), then miss
// In: const std::string& type, const json& params, const GetOptions& options
// Out: GetResult
GetResult TierManager::get(const std::string& type, const json& params, const GetOptions& options) {
    const auto t0 = SteadyClock::now();
    GeneratedKey gk = make_key(type, params, options.key);

    GetResult r;
    r.key = gk.key;

    // 1) volatile
    std::string bytes, err;
    TierStatus vs = TierStatus::Fault;
    try {
        vs = volatile_.get(gk.key, bytes, &err);
    } catch (const std::exception& e) {
        err = e.what();
        vs = TierStatus::Fault;
    }
    if (vs == TierStatus::Fault) {
        log_warn(kTag, "volatile read fault for " + gk.key + ": " + err);
    } else if (vs == TierStatus::Hit) {
        json data;
        double cost = 0.0;
        const int dec = decode_volatile(bytes, gk.normalized_params, data, cost);
        if (dec == 1) {
            r.data = std::move(data);
            r.source = CacheSource::Volatile;
            r.cached = true;
            r.latency_ms = elapsed_ms(t0);
            stats_.record_volatile_hit(type, cost, r.latency_ms);
            return r;
        }
        if (dec < 0) {
            log_warn(kTag, "corrupted volatile entry removed: " + gk.key);
            drop_volatile(gk.key);
        }
    }

    // 2) durable
    DurableRecord rec;
    err.clear();
    TierStatus ds = TierStatus::Fault;
    try {
        ds = durable_.find_by_params(gk.key, gk.normalized_params, rec, &err);
    } catch (const std::exception& e) {
        err = e.what();
        ds = TierStatus::Fault;
    }
    if (ds == TierStatus::Fault) {
        log_warn(kTag, "durable read fault for " + gk.key + ": " + err);
    } else if (ds == TierStatus::Hit) {
        r.warmed = promote(rec, true);
        r.data = std::move(rec.payload);
        r.source = CacheSource::Durable;
        r.cached = true;
        r.latency_ms = elapsed_ms(t0);
        stats_.record_durable_hit(type, rec.unit_cost, r.latency_ms);
        return r;
    }

    // 3) miss
    r.latency_ms = elapsed_ms(t0);
    stats_.record_miss(r.latency_ms);
    return r;
}


// Desc: copy a durable record into the volatile tier (queued when async)
// In: const DurableRecord& rec, bool allow_async
// Out: bool (true if written or queued)
bool TierManager::promote(const DurableRecord& rec, bool allow_async) {
    const int64_t remaining_ms = rec.expires_at_ms - now_epoch_ms();
    const uint64_t remaining_s = remaining_ms > 0 ? static_cast<uint64_t>(remaining_ms / 1000) : 0;
    const uint64_t ttl = std::min(policy_.effective_volatile_ttl(rec.cache_class), remaining_s);
    if (ttl == 0) return false;

    std::string bytes = encode_volatile(rec.normalized_params, rec.payload, rec.unit_cost, rec.metadata);
    const std::string key = rec.key;

    if (allow_async && opts_.async_promotion && promotions_) {
        const bool queued = promotions_->enqueue([this, key, bytes, ttl]{
            write_volatile(key, bytes, ttl);
        });
        if (queued) return true;
    }
    return write_volatile(key, bytes, ttl);
}

bool TierManager::write_volatile(const std::string& key, const std::string& bytes, uint64_t ttl_seconds) {
    std::string err;
    bool ok = false;
    try {
        ok = volatile_.set(key, bytes, ttl_seconds, &err);
    } catch (const std::exception& e) {
        err = e.what();
        ok = false;
    }
    if (!ok) log_warn(kTag, "volatile write failed for " + key + ": " + err);
    return ok;
}

void TierManager::drop_volatile(const std::string& key) {
    std::string err;
    bool ok = false;
    try {
        ok = volatile_.del(key, &err);
    } catch (const std::exception& e) {
        err = e.what();
    }
    if (!ok) log_warn(kTag, "volatile delete failed for " + key + ": " + err);
}


// Throws NormalizationError for a zero TTL or a negative cost.
static void validate_set_options(const SetOptions& options) {
    if (options.ttl_seconds && *options.ttl_seconds == 0) {
        throw NormalizationError("ttl_seconds must be > 0");
    }
    if (options.estimated_cost && *options.estimated_cost < 0.0) {
        throw NormalizationError("estimated_cost must be >= 0");
    }
}


// Desc: write payload to volatile (always) and durable (eligible class or high priority)
// In: const std::string& type, const json& params, const json& payload, const SetOptions& options
// Out: SetResult
SetResult TierManager::set(const std::string& type, const json& params, const json& payload,
                           const SetOptions& options) {
    const auto t0 = SteadyClock::now();
    GeneratedKey gk = make_key(type, params, options.key);

    validate_set_options(options);

    const TTLRule& rule = policy_.rule_for(type);
    const uint64_t* requested = options.ttl_seconds ? &*options.ttl_seconds : nullptr;
    const double cost = options.estimated_cost.value_or(rule.estimated_unit_cost);
    const std::string payload_text = payload.dump();

    // caller fields first, engine fields win
    json meta = options.metadata.is_object() ? options.metadata : json::object();
    meta["cache_class"]    = type;
    meta["priority"]       = to_string(options.priority);
    meta["estimated_cost"] = cost;
    meta["payload_size"]   = payload_text.size();
    meta["written_at"]     = now_epoch_ms();

    SetResult r;
    r.key = gk.key;
    r.volatile_ttl = policy_.effective_volatile_ttl(type, requested);
    r.durable_ttl  = policy_.effective_durable_ttl(type, requested);

    r.stored_volatile = write_volatile(gk.key,
                                       encode_volatile(gk.normalized_params, payload, cost, meta),
                                       r.volatile_ttl);

    if (rule.durable_eligible || options.priority == Priority::High) {
        DurableWrite w;
        w.key = gk.key;
        w.cache_class = type;
        w.normalized_params = gk.normalized_params;
        w.payload = payload;
        w.ttl_seconds = r.durable_ttl;
        w.unit_cost = cost;
        w.metadata = meta;

        std::string err;
        try {
            r.stored_durable = durable_.upsert(w, nullptr, &err);
        } catch (const std::exception& e) {
            err = e.what();
            r.stored_durable = false;
        }
        if (!r.stored_durable) log_warn(kTag, "durable write failed for " + gk.key + ": " + err);
    }

    stats_.record_write();
    r.latency_ms = elapsed_ms(t0);
    return r;
}


// Desc: read-through with one upstream fetch per key in flight
// In: const std::string& type, const json& params, const FetchFunction& fetch, const SetOptions& options
// Out: GetResult (throws UpstreamFetchError on fetch failure)
GetResult TierManager::get_or_fetch(const std::string& type, const json& params,
                                    const FetchFunction& fetch, const SetOptions& options) {
    const auto t0 = SteadyClock::now();
    validate_set_options(options);
    GetOptions gopts;
    gopts.key = options.key;
    GetResult r = get(type, params, gopts);
    if (r.cached) return r;

    std::shared_future<json> flight;
    std::promise<json> prom;
    bool leader = false;
    {
        std::lock_guard<std::mutex> lk(inflight_mu_);
        auto it = inflight_.find(r.key);
        if (it != inflight_.end()) {
            flight = it->second;
        } else {
            flight = prom.get_future().share();
            inflight_.emplace(r.key, flight);
            leader = true;
        }
    }

    if (!leader) {
        r.data = flight.get();
        r.source = CacheSource::Upstream;
        r.latency_ms = elapsed_ms(t0);
        return r;
    }

    InflightSlot slot{inflight_mu_, inflight_, r.key};
    json data;
    try {
        if (!fetch) throw UpstreamFetchError("no fetch function for " + type);
        data = fetch(params);
    } catch (const UpstreamFetchError&) {
        prom.set_exception(std::current_exception());
        throw;
    } catch (const std::exception& e) {
        auto ex = std::make_exception_ptr(UpstreamFetchError(std::string("fetch failed: ") + e.what()));
        prom.set_exception(ex);
        std::rethrow_exception(ex);
    } catch (...) {
        auto ex = std::make_exception_ptr(UpstreamFetchError("fetch failed: unknown error"));
        prom.set_exception(ex);
        std::rethrow_exception(ex);
    }

    // waiters must see the leader's failure, never a broken promise
    try {
        set(type, params, data, options);
    } catch (...) {
        prom.set_exception(std::current_exception());
        throw;
    }
    prom.set_value(data);

    r.data = std::move(data);
    r.source = CacheSource::Upstream;
    r.latency_ms = elapsed_ms(t0);
    return r;
}

void TierManager::wait_for_promotions() {
    if (promotions_) promotions_->wait_idle();
}
