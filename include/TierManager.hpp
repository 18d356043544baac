// === include/TierManager.hpp ===
#pragma once
#include "CacheTypes.hpp"
#include "DurableTier.hpp"
#include "KeyNormalizer.hpp"
#include "PromotionQueue.hpp"
#include "StatsCollector.hpp"
#include "TTLPolicy.hpp"
#include "VolatileTier.hpp"

#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

// Upstream collaborator: params in, fresh payload out. Throws on failure.
using FetchFunction = std::function<nlohmann::json(const nlohmann::json&)>;

struct TierManagerOptions {
    bool async_promotion{true};
    // Used when KeyOptions::prefix is empty.
    std::string key_prefix;
};

// Get/set across the volatile and durable tiers.
//
// Reads try volatile, then durable (with promotion back into volatile), then
// report a miss. Tier faults never escape: reads degrade to a miss and writes
// are logged and skipped. NormalizationError is the only exception get()/set()
// let through.
class TierManager {
public:
    TierManager(VolatileTier& volatile_tier,
                DurableTier& durable_tier,
                const TTLPolicy& policy,
                StatsCollector& stats,
                const KeyNormalizer& normalizer,
                TierManagerOptions options = {},
                PromotionQueue* promotions = nullptr);

    GetResult get(const std::string& type, const nlohmann::json& params,
                  const GetOptions& options = {});

    SetResult set(const std::string& type, const nlohmann::json& params,
                  const nlohmann::json& payload, const SetOptions& options = {});

    // Read-through with single-flight: concurrent misses on one key share a
    // single fetch. Fetch failures reach every waiter as UpstreamFetchError
    // and are not cached. Invalid options throw NormalizationError before
    // any fetch.
    GetResult get_or_fetch(const std::string& type, const nlohmann::json& params,
                           const FetchFunction& fetch, const SetOptions& options = {});

    void wait_for_promotions();

    // Key for (type, params) with the default prefix applied.
    GeneratedKey make_key(const std::string& type, const nlohmann::json& params,
                          const KeyOptions& options = {}) const;

    VolatileTier&        volatile_tier() { return volatile_; }
    DurableTier&         durable_tier()  { return durable_; }
    const TTLPolicy&     policy() const  { return policy_; }
    StatsCollector&      stats()         { return stats_; }
    const KeyNormalizer& normalizer() const { return normalizer_; }

    // Volatile value layout: {"params", "data", "cost", "meta"}.
    static std::string encode_volatile(const nlohmann::json& normalized_params,
                                       const nlohmann::json& payload,
                                       double unit_cost,
                                       const nlohmann::json& metadata);

    // Copy a durable record into the volatile tier with
    // ttl = min(policy, ceiling, remaining durable lifetime).
    // Returns false if nothing was written.
    bool promote(const DurableRecord& rec, bool allow_async);

private:
    bool write_volatile(const std::string& key, const std::string& bytes, uint64_t ttl_seconds);
    void drop_volatile(const std::string& key);

    VolatileTier&        volatile_;
    DurableTier&         durable_;
    const TTLPolicy&     policy_;
    StatsCollector&      stats_;
    const KeyNormalizer& normalizer_;
    TierManagerOptions   opts_;
    PromotionQueue*      promotions_;

    std::mutex inflight_mu_;
    std::unordered_map<std::string, std::shared_future<nlohmann::json>> inflight_;
};
