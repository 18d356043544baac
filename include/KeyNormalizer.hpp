// === include/KeyNormalizer.hpp ===
#pragma once
#include "CacheTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

// Typed key: [prefix:]type:hash[:user:<id>][:t:<hourBucket>]
struct CacheKey {
    std::string prefix;
    std::string type;
    std::string hash;
    std::string user_id;                 // empty = not user scoped
    std::optional<int64_t> hour_bucket;  // empty = no time partition

    std::string str() const;
    bool operator==(const CacheKey& o) const noexcept;
};

struct GeneratedKey {
    CacheKey parts;
    std::string key;
    nlohmann::json normalized_params;
    std::string hash;
};

// Canonicalizes request parameters into a stable key.
//
// Equal inputs after normalization always map to the same key. Different
// inputs collide only with probability ~ n^2 / 2^(4*hash_width+1); the hash is
// a truncated SHA-256 and is NOT collision-free. The durable tier stores the
// normalized params next to the key, so a collision there reads as a miss.
class KeyNormalizer {
public:
    static constexpr size_t kDefaultHashWidth = 8;
    static constexpr size_t kMaxDepth = 32;

    explicit KeyNormalizer(size_t hash_width = kDefaultHashWidth);

    GeneratedKey generate_key(const std::string& type,
                              const nlohmann::json& params,
                              const KeyOptions& options = {}) const;

    // Throws NormalizationError on malformed input.
    nlohmann::json normalize(const nlohmann::json& params) const;

    static std::string sha256_hex(const std::string& data);
    static int64_t hour_bucket(int64_t epoch_ms);

    size_t hash_width() const { return hash_width_; }

private:
    nlohmann::json normalize_value(const nlohmann::json& v, size_t depth) const;
    nlohmann::json normalize_object(const nlohmann::json& obj, size_t depth) const;
    static void validate_type(const std::string& type);

    size_t hash_width_;
};
