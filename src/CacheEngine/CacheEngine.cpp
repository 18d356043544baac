// === src/CacheEngine/CacheEngine.cpp ===
#include "CacheEngine.hpp"
#include "Logger.hpp"

#include <stdexcept>
#include <utility>

namespace {
    SqliteDurableTier::Options durable_options(const ConfigManager& cfg) {
        SqliteDurableTier::Options o;
        o.timeout_ms = cfg.durable_timeout_ms();
        o.max_bytes = cfg.durable_capacity_bytes();
        return o;
    }

    TierManagerOptions manager_options(const ConfigManager& cfg) {
        TierManagerOptions o;
        o.async_promotion = cfg.promotion_async();
        o.key_prefix = cfg.key_prefix();
        return o;
    }

    WarmOptions warm_options(const ConfigManager& cfg) {
        WarmOptions o;
        o.batch_size = cfg.warmer_batch_size();
        o.batch_delay = std::chrono::milliseconds(cfg.warmer_batch_delay_ms());
        o.max_concurrency = cfg.warmer_max_concurrency();
        return o;
    }

    SqliteHandle take_db(StartupResult& startup) {
        if (!startup.ok || !startup.db) {
            throw std::invalid_argument("startup failed: " +
                                        (startup.error.empty() ? std::string("no database") : startup.error));
        }
        return std::move(startup.db);
    }
}


CacheEngine::CacheEngine(StartupResult& startup)
    : CacheEngine(startup.config, take_db(startup)) {}

CacheEngine::CacheEngine(const ConfigManager& config, SqliteHandle db)
    : config_(config),
      db_(std::move(db)),
      normalizer_(config_.key_hash_width()),
      policy_(config_.ttl_policy()),
      stats_(config_.hit_rate_floor(), config_.hit_rate_warn_interval()),
      volatile_(config_.volatile_capacity_bytes()),
      durable_(db_.get(), durable_options(config_)),
      promotions_(),
      manager_(volatile_, durable_, policy_, stats_, normalizer_, manager_options(config_), &promotions_),
      warmer_(manager_, warm_options(config_)),
      invalidator_(manager_) {
    start();
}

CacheEngine::~CacheEngine() {
    shutdown();
}


// Desc: start promotion workers, optional hot preload
// In: (none)
// Out: void
void CacheEngine::start() {
    if (config_.promotion_async()) {
        promotions_.start(config_.promotion_workers());
    }
    if (config_.warmer_preload_on_start()) {
        warmer_.preload_hot(config_.warmer_preload_limit());
    }
    log_info("CacheEngine", "ready: db=" + config_.durable_db_path() +
                            " hash_width=" + std::to_string(normalizer_.hash_width()) +
                            " ttl_classes=" + std::to_string(policy_.classes().size()) +
                            " promotion_workers=" + (config_.promotion_async()
                                                     ? std::to_string(config_.promotion_workers())
                                                     : std::string("sync")));
}

void CacheEngine::shutdown() {
    promotions_.wait_idle();
    promotions_.stop_and_join();
}


std::unique_ptr<CacheEngine> CacheEngine::in_memory(const ConfigManager& config) {
    std::string err;
    SqliteHandle db = Requirements::openCacheDb(":memory:", config.durable_timeout_ms(), &err);
    if (!db) throw std::runtime_error("in-memory cache db: " + err);
    return std::unique_ptr<CacheEngine>(new CacheEngine(config, std::move(db)));
}
