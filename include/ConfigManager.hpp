// include/ConfigManager.hpp
#pragma once
#include "Logger.hpp"
#include "TTLPolicy.hpp"

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

class ConfigManager {
public:
    explicit ConfigManager() = default;

    // Missing keys keep their defaults; any invalid value fails the whole load.
    bool loadFromFile(const std::string& config_path);
    bool loadFromJson(const nlohmann::json& j);

    const std::string& durable_db_path() const { return durable_db_path_; }
    std::uint64_t durable_timeout_ms() const { return durable_timeout_ms_; }
    std::uint64_t durable_capacity_bytes() const { return durable_capacity_bytes_; }
    std::uint64_t volatile_ceiling_seconds() const { return volatile_ceiling_sec_; }
    std::uint64_t volatile_capacity_bytes() const { return volatile_capacity_bytes_; }
    const std::string& key_prefix() const { return key_prefix_; }
    std::size_t key_hash_width() const { return key_hash_width_; }
    double hit_rate_floor() const { return hit_rate_floor_; }
    std::uint64_t hit_rate_warn_interval() const { return hit_rate_warn_interval_; }

    bool promotion_async() const { return promotion_async_; }
    std::size_t promotion_workers() const { return promotion_workers_; }

    std::size_t warmer_batch_size() const { return warmer_batch_size_; }
    std::uint64_t warmer_batch_delay_ms() const { return warmer_batch_delay_ms_; }
    std::size_t warmer_max_concurrency() const { return warmer_max_concurrency_; }
    bool warmer_preload_on_start() const { return warmer_preload_on_start_; }
    std::size_t warmer_preload_limit() const { return warmer_preload_limit_; }

    const std::string& log_path() const { return log_path_; }
    LogLevel log_level() const { return log_level_; }

    // Default table plus ttl_policy overrides, with the configured ceiling.
    const TTLPolicy& ttl_policy() const { return policy_; }

    void set_durable_db_path(const std::string& p) { durable_db_path_ = p; }

    static std::uint64_t parse_size_kb_mb(const std::string& s);
    // "45s", "30m", "6h", "7d" (or a bare number of seconds) -> seconds
    static std::uint64_t parse_duration(const std::string& s);

private:
    bool loadPolicy(const nlohmann::json& j, TTLPolicy& policy);

    std::string   durable_db_path_ = "cache/propcache.sqlite";
    std::uint64_t durable_timeout_ms_ = 5000;
    std::uint64_t durable_capacity_bytes_ = 256ULL * 1024ULL * 1024ULL;
    std::uint64_t volatile_ceiling_sec_ = TTLPolicy::kDefaultVolatileCeiling;
    std::uint64_t volatile_capacity_bytes_ = 64ULL * 1024ULL * 1024ULL;
    std::string   key_prefix_;
    std::size_t   key_hash_width_ = 8;
    double        hit_rate_floor_ = 0.5;
    std::uint64_t hit_rate_warn_interval_ = 100;

    bool          promotion_async_ = true;
    std::size_t   promotion_workers_ = 2;

    std::size_t   warmer_batch_size_ = 5;
    std::uint64_t warmer_batch_delay_ms_ = 500;
    std::size_t   warmer_max_concurrency_ = 5;
    bool          warmer_preload_on_start_ = false;
    std::size_t   warmer_preload_limit_ = 1000;

    std::string   log_path_ = "logs/propcache.log";
    LogLevel      log_level_ = LogLevel::Info;

    TTLPolicy     policy_ = TTLPolicy::defaults();
};
