// === src/InvalidationManager/InvalidationManager.cpp ===
#include "InvalidationManager.hpp"
#include "Logger.hpp"
#include "PatternMatcherHS.hpp"

#include <exception>
#include <optional>

namespace {
    const char* kTag = "InvalidationManager";
}


// Desc: delete durable entries whose key matches pattern (caseless)
// In: const std::string& pattern, const InvalidationOptions& options
// Out: InvalidationResult
InvalidationResult InvalidationManager::invalidate(const std::string& pattern,
                                                   const InvalidationOptions& options) {
    InvalidationResult res;
    res.pattern = options.syntax == PatternSyntax::Glob ? PatternMatcherHS::globToRegex(pattern)
                                                        : pattern;

    if (options.include_volatile) {
        res.volatile_supported = false;
        log_warn(kTag, "volatile pattern invalidation is not supported; entries matching '" +
                       pattern + "' expire by TTL");
    }

    if (!options.include_durable) return res;
    if (pattern.empty()) {
        res.errors.push_back("empty pattern");
        return res;
    }

    std::string err;
    std::optional<size_t> deleted;
    try {
        deleted = manager_.durable_tier().delete_matching(res.pattern, &err);
    } catch (const std::exception& e) {
        err = e.what();
    }
    if (!deleted) {
        res.errors.push_back(err.empty() ? std::string("durable delete failed") : err);
        log_warn(kTag, "invalidate '" + pattern + "' failed: " + res.errors.back());
        return res;
    }

    res.durable_deleted = *deleted;
    log_info(kTag, "[invalidate] pattern='" + pattern + "' durable_deleted=" + std::to_string(*deleted));
    return res;
}

bool InvalidationManager::invalidate_key(const std::string& type, const nlohmann::json& params,
                                         const KeyOptions& options) {
    GeneratedKey gk = manager_.make_key(type, params, options);

    bool ok = true;
    std::string err;
    try {
        if (!manager_.volatile_tier().del(gk.key, &err)) ok = false;
    } catch (const std::exception& e) {
        err = e.what();
        ok = false;
    }
    if (!ok) log_warn(kTag, "volatile delete failed for " + gk.key + ": " + err);

    err.clear();
    bool durable_ok = false;
    try {
        durable_ok = manager_.durable_tier().delete_key(gk.key, &err);
    } catch (const std::exception& e) {
        err = e.what();
    }
    if (!durable_ok) {
        log_warn(kTag, "durable delete failed for " + gk.key + ": " + err);
        ok = false;
    }
    return ok;
}

size_t InvalidationManager::purge_expired() {
    std::string err;
    std::optional<size_t> n;
    try {
        n = manager_.durable_tier().purge_expired(&err);
    } catch (const std::exception& e) {
        err = e.what();
    }
    if (!n) {
        log_warn(kTag, "purge_expired failed: " + err);
        return 0;
    }
    if (*n > 0) log_info(kTag, "[purge] removed " + std::to_string(*n) + " expired durable entries");
    return *n;
}
