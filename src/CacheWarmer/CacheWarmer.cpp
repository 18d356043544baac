// === src/CacheWarmer/CacheWarmer.cpp ===
#include "CacheWarmer.hpp"
#include "Logger.hpp"
#include "SimpleSemaphore.hpp"

#include <algorithm>
#include <exception>
#include <thread>

using nlohmann::json;

const char* to_string(WarmStatus s) {
    switch (s) {
        case WarmStatus::Warmed:          return "warmed";
        case WarmStatus::AlreadyCached:   return "already_cached";
        case WarmStatus::NoFetchFunction: return "no_fetch_function";
        default:                          return "error";
    }
}

json WarmReport::to_json() const {
    json out = {
        {"total", total},
        {"warmed", warmed},
        {"already_cached", already_cached},
        {"errors", errors},
        {"no_fetch", no_fetch},
    };
    json arr = json::array();
    for (const auto& it : items) {
        json j = {{"key", it.key}, {"status", ::to_string(it.status)}};
        if (!it.error.empty()) j["error"] = it.error;
        arr.push_back(std::move(j));
    }
    out["items"] = std::move(arr);
    return out;
}


CacheWarmer::CacheWarmer(TierManager& manager, WarmOptions defaults)
    : manager_(manager), defaults_(std::move(defaults)) {}

WarmReport CacheWarmer::warm(const std::string& type,
                             const std::vector<json>& params_list,
                             const FetchFunction& fetch) {
    return warm(type, params_list, fetch, defaults_);
}


// Desc: warm params_list in sequential batches
// In: const std::string& type, const std::vector<json>& params_list, const FetchFunction& fetch, const WarmOptions& options
// Out: WarmReport
WarmReport CacheWarmer::warm(const std::string& type,
                             const std::vector<json>& params_list,
                             const FetchFunction& fetch,
                             const WarmOptions& options) {
    WarmReport report;
    report.total = params_list.size();
    report.items.resize(params_list.size());
    if (params_list.empty()) return report;

    const size_t batch = std::max<size_t>(options.batch_size, 1);
    SimpleSemaphore sem(static_cast<int>(std::max<size_t>(options.max_concurrency, 1)));

    log_info("CacheWarmer", "warming " + std::to_string(params_list.size()) + " " + type +
                            " entries in batches of " + std::to_string(batch));

    for (size_t start = 0; start < params_list.size(); start += batch) {
        const size_t end = std::min(start + batch, params_list.size());

        std::vector<std::thread> workers;
        workers.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            report.items[i].params = params_list[i];
            WarmItem* item = &report.items[i];
            workers.emplace_back([this, &type, &fetch, &options, &sem, item]() {
                SimpleSemaphore::Permit permit(sem);
                warm_one(type, fetch, options, *item);
            });
        }
        for (auto& th : workers) th.join();

        if (end < params_list.size() && options.batch_delay.count() > 0) {
            std::this_thread::sleep_for(options.batch_delay);
        }
    }

    for (const auto& it : report.items) {
        switch (it.status) {
            case WarmStatus::Warmed:          ++report.warmed; break;
            case WarmStatus::AlreadyCached:   ++report.already_cached; break;
            case WarmStatus::NoFetchFunction: ++report.no_fetch; break;
            case WarmStatus::Error:           ++report.errors; break;
        }
    }

    log_info("CacheWarmer", "[warm] " + type + " total=" + std::to_string(report.total) +
                            " warmed=" + std::to_string(report.warmed) +
                            " already_cached=" + std::to_string(report.already_cached) +
                            " errors=" + std::to_string(report.errors));
    return report;
}


// Desc: process one item: cached check, fetch, set with warmed metadata
// In: const std::string& type, const FetchFunction& fetch, const WarmOptions& options, WarmItem& item
// Out: void (outcome written to item)
void CacheWarmer::warm_one(const std::string& type, const FetchFunction& fetch,
                           const WarmOptions& options, WarmItem& item) {
    try {
        GetOptions gopts;
        gopts.key = options.set.key;
        GetResult existing = manager_.get(type, item.params, gopts);
        item.key = existing.key;
        if (existing.cached) {
            item.status = WarmStatus::AlreadyCached;
            return;
        }
        if (!fetch) {
            item.status = WarmStatus::NoFetchFunction;
            return;
        }

        json data = fetch(item.params);

        SetOptions sopts = options.set;
        if (!sopts.metadata.is_object()) sopts.metadata = json::object();
        sopts.metadata["warmed"] = true;
        manager_.set(type, item.params, data, sopts);
        item.status = WarmStatus::Warmed;
    } catch (const std::exception& e) {
        item.status = WarmStatus::Error;
        item.error = e.what();
        log_warn("CacheWarmer", "warm failed for " + (item.key.empty() ? type : item.key) + ": " + e.what());
    } catch (...) {
        item.status = WarmStatus::Error;
        item.error = "unknown error";
        log_warn("CacheWarmer", "warm failed for " + (item.key.empty() ? type : item.key) + ": unknown error");
    }
}


// Desc: copy hot durable records into the volatile tier (synchronous)
// In: size_t limit
// Out: size_t (records written)
size_t CacheWarmer::preload_hot(size_t limit) {
    if (limit == 0) return 0;
    std::string err;
    std::vector<DurableRecord> rows;
    try {
        rows = manager_.durable_tier().top_accessed(limit, &err);
    } catch (const std::exception& e) {
        err = e.what();
    }
    if (!err.empty()) {
        log_warn("CacheWarmer", "preload: " + err);
    }

    size_t loaded = 0;
    for (const auto& rec : rows) {
        if (manager_.promote(rec, false)) ++loaded;
    }
    log_info("CacheWarmer", "[preload] " + std::to_string(loaded) + "/" + std::to_string(rows.size()) +
                            " hot durable entries copied to volatile");
    return loaded;
}
