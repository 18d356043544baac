// === include/VolatileTier.hpp ===
#pragma once
#include "CacheTypes.hpp"
#include <cstdint>
#include <string>

// Fast, best-effort tier. Values are opaque bytes; TTL expiry is the tier's job.
// Implementations must be safe to call from many threads. They may report a
// fault either through the return value (+ err) or by throwing std::exception;
// TierManager absorbs both.
class VolatileTier {
public:
    virtual ~VolatileTier() = default;

    virtual TierStatus get(const std::string& key, std::string& out, std::string* err = nullptr) = 0;
    virtual bool set(const std::string& key, const std::string& bytes, uint64_t ttl_seconds,
                     std::string* err = nullptr) = 0;
    virtual bool del(const std::string& key, std::string* err = nullptr) = 0;
};
