// === include/DurableTier.hpp ===
#pragma once
#include "CacheTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct DurableRecord {
    std::string key;
    std::string cache_class;
    nlohmann::json normalized_params;
    nlohmann::json payload;
    nlohmann::json metadata;
    int64_t  created_at_ms{0};
    int64_t  last_access_ms{0};
    int64_t  expires_at_ms{0};
    uint64_t ttl_seconds{0};
    uint64_t access_count{1};
    double   unit_cost{0.0};
    double   cost_saved{0.0};   // unit_cost * (access_count - 1)
};

struct DurableWrite {
    std::string key;
    std::string cache_class;
    nlohmann::json normalized_params;
    nlohmann::json payload;
    uint64_t ttl_seconds{0};
    double   unit_cost{0.0};
    nlohmann::json metadata = nlohmann::json::object();
};

// Persistent, queryable tier; authoritative for durable-eligible classes.
// Same fault contract as VolatileTier: status + err, or a thrown std::exception.
class DurableTier {
public:
    virtual ~DurableTier() = default;

    // Hit bumps access_count / last_access / cost_saved before returning the record.
    virtual TierStatus find_by_params(const std::string& key,
                                      const nlohmann::json& normalized_params,
                                      DurableRecord& out,
                                      std::string* err = nullptr) = 0;

    virtual bool upsert(const DurableWrite& w, DurableRecord* out = nullptr,
                        std::string* err = nullptr) = 0;

    // Case-insensitive regex over keys. nullopt on fault.
    virtual std::optional<size_t> delete_matching(const std::string& pattern,
                                                  std::string* err = nullptr) = 0;

    virtual bool delete_key(const std::string& key, std::string* err = nullptr) = 0;
    virtual std::optional<size_t> purge_expired(std::string* err = nullptr) = 0;

    // Live records ordered by access_count DESC, last_access DESC.
    virtual std::vector<DurableRecord> top_accessed(size_t limit, std::string* err = nullptr) = 0;
};
