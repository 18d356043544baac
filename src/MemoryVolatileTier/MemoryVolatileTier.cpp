// === src/MemoryVolatileTier/MemoryVolatileTier.cpp ===
#include "MemoryVolatileTier.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <mutex>
#include <vector>


// Desc: read a live entry under the shared lock; an expired one is erased
// In: const std::string& key, std::string& out
// Out: TierStatus (Hit/Miss)
TierStatus MemoryVolatileTier::get(const std::string& key, std::string& out, std::string* err) {
    (void)err;
    const int64_t now = now_epoch_ms();
    {
        std::shared_lock<std::shared_mutex> rlk(mu_);
        auto it = map_.find(key);
        if (it == map_.end()) return TierStatus::Miss;

        Entry& e = it->second;
        if (e.expires_at_ms > now) {
            e.hit_count.fetch_add(1, std::memory_order_relaxed);
            e.last_access_ms.store(now, std::memory_order_relaxed);
            out = e.bytes;
            return TierStatus::Hit;
        }
    }

    std::unique_lock<std::shared_mutex> wlk(mu_);
    auto it = map_.find(key);
    // re-check: a writer may have replaced it since the shared lock was dropped
    if (it != map_.end() && it->second.expires_at_ms <= now) {
        used_bytes_ -= entry_bytes(it->first, it->second);
        map_.erase(it);
    }
    return TierStatus::Miss;
}


// Desc: insert/replace entry; evicts LRU rows while over the byte budget
// In: const std::string& key, const std::string& bytes, uint64_t ttl_seconds
// Out: bool (false if ttl is zero or the value alone exceeds the budget)
bool MemoryVolatileTier::set(const std::string& key, const std::string& bytes, uint64_t ttl_seconds,
                             std::string* err) {
    if (ttl_seconds == 0) {
        if (err) *err = "ttl must be > 0";
        return false;
    }
    Entry ent{};
    ent.bytes = bytes;
    const int64_t now = now_epoch_ms();
    ent.expires_at_ms = now + static_cast<int64_t>(ttl_seconds) * 1000LL;
    ent.last_access_ms.store(now, std::memory_order_relaxed);

    const uint64_t incoming = entry_bytes(key, ent);
    if (incoming > max_bytes_) {
        if (err) *err = "value of " + std::to_string(bytes.size()) + " bytes exceeds volatile capacity";
        return false;
    }

    // replacing an existing key frees its bytes first
    del(key, nullptr);

    while (!check_capacity(incoming)) {
        if (erase_expired() > 0) continue;
        #ifdef DEBUG
        log_debug("MemoryVolatileTier", "capacity reached, evicting least recently used entries");
        #endif
        // ~1% of entries per round, at least one
        evict_lru(std::max<size_t>(1, size() / 100));
    }

    std::unique_lock<std::shared_mutex> wlk(mu_);
    auto it = map_.find(key);
    if (it != map_.end()) {
        // another writer got in between; last writer wins
        used_bytes_ -= entry_bytes(it->first, it->second);
        it->second = std::move(ent);
        used_bytes_ += entry_bytes(key, it->second);
    } else {
        used_bytes_ += incoming;
        map_.emplace(key, std::move(ent));
    }
    return true;
}

bool MemoryVolatileTier::del(const std::string& key, std::string* err) {
    (void)err;
    std::unique_lock<std::shared_mutex> wlk(mu_);
    auto it = map_.find(key);
    if (it != map_.end()) {
        used_bytes_ -= entry_bytes(it->first, it->second);
        map_.erase(it);
    }
    return true;
}

size_t MemoryVolatileTier::erase_expired() {
    const int64_t now = now_epoch_ms();
    std::unique_lock<std::shared_mutex> wlk(mu_);
    size_t removed = 0;
    for (auto it = map_.begin(); it != map_.end();) {
        if (it->second.expires_at_ms <= now) {
            used_bytes_ -= entry_bytes(it->first, it->second);
            it = map_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}


// ---------------------------
// LRU (oldest by last_access)
// ---------------------------
void MemoryVolatileTier::evict_lru(size_t max_rows_to_evict) {
    if (max_rows_to_evict == 0) return;
    struct Row { std::string key; int64_t last_ts; };
    std::vector<Row> rows;
    {
        std::shared_lock<std::shared_mutex> rlk(mu_);
        rows.reserve(map_.size());
        for (const auto& kv : map_) {
            rows.push_back(Row{ kv.first, kv.second.last_access_ms.load(std::memory_order_relaxed) });
        }
    }
    if (rows.empty()) return;
    const size_t n = std::min(max_rows_to_evict, rows.size());
    std::partial_sort(rows.begin(), rows.begin() + static_cast<std::ptrdiff_t>(n), rows.end(),
                      [](const Row& a, const Row& b){ return a.last_ts < b.last_ts; });
    rows.resize(n);
    {
        std::unique_lock<std::shared_mutex> wlk(mu_);
        for (const auto& r : rows) {
            auto it = map_.find(r.key);
            if (it == map_.end()) continue;
            used_bytes_ -= entry_bytes(it->first, it->second);
            map_.erase(it);
        }
    }
}

bool MemoryVolatileTier::check_capacity(uint64_t incoming) const {
    std::shared_lock<std::shared_mutex> rlk(mu_);
    return used_bytes_ + incoming <= max_bytes_ || map_.empty();
}

size_t MemoryVolatileTier::size() const {
    std::shared_lock<std::shared_mutex> rlk(mu_);
    return map_.size();
}

uint64_t MemoryVolatileTier::bytes_used() const {
    std::shared_lock<std::shared_mutex> rlk(mu_);
    return used_bytes_;
}

bool MemoryVolatileTier::contains(const std::string& key) const {
    return ttl_remaining_ms(key) >= 0;
}

int64_t MemoryVolatileTier::ttl_remaining_ms(const std::string& key) const {
    std::shared_lock<std::shared_mutex> rlk(mu_);
    auto it = map_.find(key);
    if (it == map_.end()) return -1;
    const int64_t left = it->second.expires_at_ms - now_epoch_ms();
    return left > 0 ? left : -1;
}
