// === include/CacheTypes.hpp ===
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

using SteadyClock = std::chrono::steady_clock;
using SystemClock = std::chrono::system_clock;

// Malformed request descriptor. The only error the engine lets reach a caller
// of get()/set().
class NormalizationError : public std::invalid_argument {
public:
    explicit NormalizationError(const std::string& what)
        : std::invalid_argument(what) {}
};

// Raised by a fetch function (or collected from one) in get_or_fetch / warm.
class UpstreamFetchError : public std::runtime_error {
public:
    explicit UpstreamFetchError(const std::string& what)
        : std::runtime_error(what) {}
};

enum class CacheSource : uint8_t { None = 0, Volatile, Durable, Upstream };
enum class Priority    : uint8_t { Low = 0, Normal, High };

// Outcome of a single tier read.
enum class TierStatus : uint8_t { Hit = 0, Miss, Fault };

const char* to_string(CacheSource s);
const char* to_string(Priority p);

// Desc: wall-clock milliseconds since epoch
inline int64_t now_epoch_ms() {
    return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        SystemClock::now().time_since_epoch()).count());
}

inline double elapsed_ms(SteadyClock::time_point t0) {
    return std::chrono::duration<double, std::milli>(SteadyClock::now() - t0).count();
}

struct KeyOptions {
    std::string prefix;
    bool user_specific{false};
    std::string user_id;
    bool include_timestamp{false};
    // Overrides "now" for the hour bucket; epoch milliseconds.
    std::optional<int64_t> now_ms;
};

struct GetOptions {
    KeyOptions key;
};

struct SetOptions {
    KeyOptions key;
    std::optional<uint64_t> ttl_seconds;
    Priority priority{Priority::Normal};
    std::optional<double> estimated_cost;
    nlohmann::json metadata = nlohmann::json::object();
};

struct GetResult {
    std::string key;
    std::optional<nlohmann::json> data;
    CacheSource source{CacheSource::None};
    bool cached{false};
    bool warmed{false};     // durable hit re-populated (or queued for) the volatile tier
    double latency_ms{0.0};
};

struct SetResult {
    std::string key;
    bool stored_volatile{false};
    bool stored_durable{false};
    uint64_t volatile_ttl{0};
    uint64_t durable_ttl{0};
    double latency_ms{0.0};
};
