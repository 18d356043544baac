// === src/KeyNormalizer/KeyNormalizer.cpp ===
#include "KeyNormalizer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <openssl/evp.h>

using nlohmann::json;

// Desc: trim leading and trailing spaces inplace
// In: std::string& t
// Out: void
static inline void trim_inplace(std::string& t) {
    t.erase(t.begin(), std::find_if(t.begin(), t.end(), [](unsigned char c){ return !std::isspace(c); }));
    t.erase(std::find_if(t.rbegin(), t.rend(), [](unsigned char c){ return !std::isspace(c); }).base(), t.end());
}

static inline std::string toLower(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string CacheKey::str() const {
    std::string out;
    out.reserve(prefix.size() + type.size() + hash.size() + user_id.size() + 32);
    if (!prefix.empty()) { out += prefix; out += ':'; }
    out += type;
    out += ':';
    out += hash;
    if (!user_id.empty()) { out += ":user:"; out += user_id; }
    if (hour_bucket) { out += ":t:"; out += std::to_string(*hour_bucket); }
    return out;
}

bool CacheKey::operator==(const CacheKey& o) const noexcept {
    return prefix == o.prefix && type == o.type && hash == o.hash &&
           user_id == o.user_id && hour_bucket == o.hour_bucket;
}


KeyNormalizer::KeyNormalizer(size_t hash_width)
    : hash_width_(std::min<size_t>(std::max<size_t>(hash_width, 4), 64)) {}


// Desc: hex SHA-256 of data (OpenSSL EVP)
// In: const std::string& data
// Out: std::string (64 hex chars)
std::string KeyNormalizer::sha256_hex(const std::string& data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_Digest(data.data(), data.size(), out, &out_len, EVP_sha256(), nullptr) != 1) {
        throw NormalizationError("sha256 digest failed");
    }
    static const char* hex = "0123456789abcdef";
    std::string h(static_cast<size_t>(out_len) * 2, '0');
    for (unsigned int i = 0; i < out_len; i++) {
        h[2*i]   = hex[(out[i]>>4) & 0xF];
        h[2*i+1] = hex[out[i] & 0xF];
    }
    return h;
}

int64_t KeyNormalizer::hour_bucket(int64_t epoch_ms) {
    constexpr int64_t kHourMs = 60LL * 60LL * 1000LL;
    // floor, also for pre-epoch values
    int64_t q = epoch_ms / kHourMs;
    if (epoch_ms % kHourMs != 0 && epoch_ms < 0) --q;
    return q;
}

void KeyNormalizer::validate_type(const std::string& type) {
    if (type.empty()) {
        throw NormalizationError("cache type must be non-empty");
    }
    for (unsigned char c : type) {
        if (c == ':' || std::isspace(c)) {
            throw NormalizationError("cache type contains ':' or whitespace: '" + type + "'");
        }
    }
}

// prefix and user id share the key's ':' separator
static void check_key_segment(const char* what, const std::string& s) {
    for (unsigned char c : s) {
        if (c == ':' || std::isspace(c)) {
            throw NormalizationError(std::string(what) + " contains ':' or whitespace: '" + s + "'");
        }
    }
}



// Desc: normalize one value; returns null for values that should be dropped
// In: const json& v, size_t depth
// Out: json
json KeyNormalizer::normalize_value(const json& v, size_t depth) const {
    if (depth > kMaxDepth) {
        throw NormalizationError("params nested deeper than " + std::to_string(kMaxDepth));
    }
    switch (v.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            return nullptr;

        case json::value_t::string: {
            std::string s = v.get<std::string>();
            trim_inplace(s);
            if (s.empty()) return nullptr;
            return toLower(std::move(s));
        }

        case json::value_t::number_float: {
            const double d = v.get<double>();
            if (!std::isfinite(d)) {
                throw NormalizationError("non-finite number in params");
            }
            // 300000.0 and 300000 describe the same request
            if (std::floor(d) == d &&
                d >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
                d <  static_cast<double>(std::numeric_limits<int64_t>::max())) {
                return static_cast<int64_t>(d);
            }
            return d;
        }

        case json::value_t::array: {
            json out = json::array();
            for (const auto& el : v) {
                json n = normalize_value(el, depth + 1);
                if (!n.is_null()) out.push_back(std::move(n));
            }
            std::sort(out.begin(), out.end());
            return out;
        }

        case json::value_t::object:
            return normalize_object(v, depth + 1);

        case json::value_t::binary:
            throw NormalizationError("binary values are not accepted in params");

        default:
            // bool, integers
            return v;
    }
}

json KeyNormalizer::normalize_object(const json& obj, size_t depth) const {
    json out = json::object();   // std::map backed: keys come out sorted
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        json n = normalize_value(it.value(), depth);
        if (n.is_null()) continue;
        out[it.key()] = std::move(n);
    }
    return out;
}

json KeyNormalizer::normalize(const json& params) const {
    if (params.is_null()) return json::object();
    if (!params.is_object()) {
        throw NormalizationError(std::string("params must be an object, got ") + params.type_name());
    }
    return normalize_object(params, 0);
}


// Desc: build canonical key, normalized params and truncated hash
// In: const std::string& type, const json& params, const KeyOptions& options
// Out: GeneratedKey; throws NormalizationError
GeneratedKey KeyNormalizer::generate_key(const std::string& type,
                                         const json& params,
                                         const KeyOptions& options) const {
    validate_type(type);
    check_key_segment("key prefix", options.prefix);
    if (options.user_specific) check_key_segment("user id", options.user_id);

    GeneratedKey g;
    g.normalized_params = normalize(params);

    const std::string canonical = g.normalized_params.dump();
    g.hash = sha256_hex(canonical).substr(0, hash_width_);

    g.parts.prefix = options.prefix;
    g.parts.type   = type;
    g.parts.hash   = g.hash;
    if (options.user_specific && !options.user_id.empty()) {
        g.parts.user_id = options.user_id;
    }
    if (options.include_timestamp) {
        g.parts.hour_bucket = hour_bucket(options.now_ms ? *options.now_ms : now_epoch_ms());
    }
    g.key = g.parts.str();
    return g;
}
