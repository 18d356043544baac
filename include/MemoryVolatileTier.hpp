// === include/MemoryVolatileTier.hpp ===
#pragma once
#include "VolatileTier.hpp"
#include <atomic>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

// In-process volatile tier: hash map with per-entry deadlines and a byte
// budget enforced by LRU eviction.
class MemoryVolatileTier : public VolatileTier {
public:
    struct Entry {
        std::string bytes;
        int64_t expires_at_ms{0};
        // bumped by readers holding only the shared lock
        std::atomic<int64_t> last_access_ms{0};
        std::atomic<uint64_t> hit_count{0};

        Entry() = default;
        Entry(Entry&& o) noexcept
            : bytes(std::move(o.bytes)),
              expires_at_ms(o.expires_at_ms),
              last_access_ms(o.last_access_ms.load(std::memory_order_relaxed)),
              hit_count(o.hit_count.load(std::memory_order_relaxed)) {}
        Entry& operator=(Entry&& o) noexcept {
            bytes = std::move(o.bytes);
            expires_at_ms = o.expires_at_ms;
            last_access_ms.store(o.last_access_ms.load(std::memory_order_relaxed), std::memory_order_relaxed);
            hit_count.store(o.hit_count.load(std::memory_order_relaxed), std::memory_order_relaxed);
            return *this;
        }
    };

    explicit MemoryVolatileTier(uint64_t max_bytes = 64ULL * 1024ULL * 1024ULL)
        : max_bytes_(max_bytes) {}

    TierStatus get(const std::string& key, std::string& out, std::string* err = nullptr) override;
    bool set(const std::string& key, const std::string& bytes, uint64_t ttl_seconds,
             std::string* err = nullptr) override;
    bool del(const std::string& key, std::string* err = nullptr) override;

    // Drop expired entries; returns how many were removed.
    size_t erase_expired();
    void evict_lru(size_t max_rows_to_evict);

    size_t size() const;
    uint64_t bytes_used() const;
    bool contains(const std::string& key) const;
    // Remaining TTL in milliseconds, -1 if absent/expired.
    int64_t ttl_remaining_ms(const std::string& key) const;

private:
    static uint64_t entry_bytes(const std::string& key, const Entry& e) {
        return static_cast<uint64_t>(key.size() + e.bytes.size() + sizeof(Entry));
    }
    bool check_capacity(uint64_t incoming) const;

    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, Entry> map_;
    uint64_t used_bytes_{0};
    uint64_t max_bytes_;
};
