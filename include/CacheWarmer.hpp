// === include/CacheWarmer.hpp ===
#pragma once
#include "TierManager.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class WarmStatus : uint8_t { Warmed = 0, AlreadyCached, Error, NoFetchFunction };
const char* to_string(WarmStatus s);

struct WarmItem {
    nlohmann::json params;
    std::string key;          // empty if the params could not be normalized
    WarmStatus status{WarmStatus::Error};
    std::string error;
};

struct WarmOptions {
    size_t batch_size{5};
    std::chrono::milliseconds batch_delay{500};
    size_t max_concurrency{5};
    // Applied to every set(); metadata.warmed is always added.
    SetOptions set;
};

struct WarmReport {
    size_t total{0};
    size_t warmed{0};
    size_t already_cached{0};
    size_t errors{0};
    size_t no_fetch{0};
    std::vector<WarmItem> items;   // same order as the input list

    nlohmann::json to_json() const;
};

// Batch driver over TierManager get/set. Batches run one after another with a
// fixed delay between them; items inside a batch run on their own threads,
// at most max_concurrency fetching at once. One failing item never aborts
// its batch.
class CacheWarmer {
public:
    explicit CacheWarmer(TierManager& manager, WarmOptions defaults = {});

    WarmReport warm(const std::string& type,
                    const std::vector<nlohmann::json>& params_list,
                    const FetchFunction& fetch);
    WarmReport warm(const std::string& type,
                    const std::vector<nlohmann::json>& params_list,
                    const FetchFunction& fetch,
                    const WarmOptions& options);

    // Copy the most accessed live durable records into the volatile tier.
    // Returns how many were written.
    size_t preload_hot(size_t limit);

    const WarmOptions& defaults() const { return defaults_; }

private:
    void warm_one(const std::string& type, const FetchFunction& fetch,
                  const WarmOptions& options, WarmItem& item);

    TierManager& manager_;
    WarmOptions defaults_;
};
