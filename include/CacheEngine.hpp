// === include/CacheEngine.hpp ===
#pragma once
#include "CacheWarmer.hpp"
#include "ConfigManager.hpp"
#include "InvalidationManager.hpp"
#include "KeyNormalizer.hpp"
#include "MemoryVolatileTier.hpp"
#include "PromotionQueue.hpp"
#include "SqliteDurableTier.hpp"
#include "StatsCollector.hpp"
#include "TTLPolicy.hpp"
#include "TierManager.hpp"
#include "requirements.hpp"

#include <memory>
#include <string>
#include <vector>

// One cache instance wired from a loaded configuration: in-process volatile
// tier, SQLite durable tier, promotion workers, warmer and invalidation.
class CacheEngine {
public:
    // Takes ownership of startup.db. Throws std::invalid_argument if startup
    // did not succeed.
    explicit CacheEngine(StartupResult& startup);
    ~CacheEngine();
    CacheEngine(const CacheEngine&) = delete;
    CacheEngine& operator=(const CacheEngine&) = delete;

    // Engine on a private in-memory SQLite database. Throws std::runtime_error
    // if the database cannot be opened.
    static std::unique_ptr<CacheEngine> in_memory(const ConfigManager& config = ConfigManager());

    GetResult get(const std::string& type, const nlohmann::json& params,
                  const GetOptions& options = {}) {
        return manager_.get(type, params, options);
    }
    SetResult set(const std::string& type, const nlohmann::json& params,
                  const nlohmann::json& payload, const SetOptions& options = {}) {
        return manager_.set(type, params, payload, options);
    }
    GetResult get_or_fetch(const std::string& type, const nlohmann::json& params,
                           const FetchFunction& fetch, const SetOptions& options = {}) {
        return manager_.get_or_fetch(type, params, fetch, options);
    }

    WarmReport warm(const std::string& type, const std::vector<nlohmann::json>& params_list,
                    const FetchFunction& fetch) {
        return warmer_.warm(type, params_list, fetch);
    }
    WarmReport warm(const std::string& type, const std::vector<nlohmann::json>& params_list,
                    const FetchFunction& fetch, const WarmOptions& options) {
        return warmer_.warm(type, params_list, fetch, options);
    }
    size_t preload_hot(size_t limit) { return warmer_.preload_hot(limit); }

    InvalidationResult invalidate(const std::string& pattern, const InvalidationOptions& options = {}) {
        return invalidator_.invalidate(pattern, options);
    }
    bool invalidate_key(const std::string& type, const nlohmann::json& params,
                        const KeyOptions& options = {}) {
        return invalidator_.invalidate_key(type, params, options);
    }
    size_t purge_expired() { return invalidator_.purge_expired(); }

    StatsSnapshot get_stats() const { return stats_.get_stats(); }
    void wait_for_promotions() { manager_.wait_for_promotions(); }

    // Drain promotions and stop the workers. Called by the destructor.
    void shutdown();

    const ConfigManager& config() const { return config_; }
    const TTLPolicy& policy() const { return policy_; }
    StatsCollector& stats() { return stats_; }
    TierManager& manager() { return manager_; }
    MemoryVolatileTier& volatile_tier() { return volatile_; }
    SqliteDurableTier& durable_tier() { return durable_; }

private:
    CacheEngine(const ConfigManager& config, SqliteHandle db);
    void start();

    ConfigManager       config_;
    SqliteHandle        db_;
    KeyNormalizer       normalizer_;
    TTLPolicy           policy_;
    StatsCollector      stats_;
    MemoryVolatileTier  volatile_;
    SqliteDurableTier   durable_;
    PromotionQueue      promotions_;
    TierManager         manager_;
    CacheWarmer         warmer_;
    InvalidationManager invalidator_;
};
