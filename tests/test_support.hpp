// === tests/test_support.hpp ===
#pragma once
#include "DurableTier.hpp"
#include "MemoryVolatileTier.hpp"
#include "requirements.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <gtest/gtest.h>

namespace testsupport {

inline SqliteHandle open_memory_db() {
    std::string err;
    SqliteHandle db = Requirements::openCacheDb(":memory:", 5000, &err);
    if (!db) throw std::runtime_error("cannot open in-memory db: " + err);
    return db;
}

// Unique scratch directory under the system temp dir.
inline std::string make_temp_dir() {
    const char* base = std::getenv("TMPDIR");
    std::string tmpl = std::string(base && *base ? base : "/tmp") + "/propcache_test_XXXXXX";
    char* made = ::mkdtemp(&tmpl[0]);
    if (!made) throw std::runtime_error("mkdtemp failed");
    return tmpl;
}

// Volatile tier whose reads/writes can be made to fail or throw.
class FlakyVolatileTier : public VolatileTier {
public:
    TierStatus get(const std::string& key, std::string& out, std::string* err) override {
        reads++;
        if (throw_on_get) throw std::runtime_error("volatile connection reset");
        if (fail_get) { if (err) *err = "volatile unavailable"; return TierStatus::Fault; }
        return inner.get(key, out, err);
    }
    bool set(const std::string& key, const std::string& bytes, uint64_t ttl, std::string* err) override {
        writes++;
        if (throw_on_set) throw std::runtime_error("volatile write refused");
        return inner.set(key, bytes, ttl, err);
    }
    bool del(const std::string& key, std::string* err) override {
        deletes++;
        return inner.del(key, err);
    }

    MemoryVolatileTier inner;
    std::atomic<bool> fail_get{false};
    std::atomic<bool> throw_on_get{false};
    std::atomic<bool> throw_on_set{false};
    std::atomic<int> reads{0};
    std::atomic<int> writes{0};
    std::atomic<int> deletes{0};
};

// Durable tier that always faults; used to check degradation to a miss.
class BrokenDurableTier : public DurableTier {
public:
    TierStatus find_by_params(const std::string&, const nlohmann::json&, DurableRecord&,
                              std::string* err) override {
        finds++;
        if (throw_instead) throw std::runtime_error("durable connection lost");
        if (err) *err = "durable unavailable";
        return TierStatus::Fault;
    }
    bool upsert(const DurableWrite&, DurableRecord*, std::string* err) override {
        upserts++;
        if (throw_instead) throw std::runtime_error("durable connection lost");
        if (err) *err = "durable unavailable";
        return false;
    }
    std::optional<size_t> delete_matching(const std::string&, std::string* err) override {
        if (err) *err = "durable unavailable";
        return std::nullopt;
    }
    bool delete_key(const std::string&, std::string* err) override {
        if (err) *err = "durable unavailable";
        return false;
    }
    std::optional<size_t> purge_expired(std::string* err) override {
        if (err) *err = "durable unavailable";
        return std::nullopt;
    }
    std::vector<DurableRecord> top_accessed(size_t, std::string* err) override {
        if (err) *err = "durable unavailable";
        return {};
    }

    bool throw_instead{false};
    std::atomic<int> finds{0};
    std::atomic<int> upserts{0};
};

inline void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace testsupport
