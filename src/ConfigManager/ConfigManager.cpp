// === ConfigManager.cpp ===
#include "ConfigManager.hpp"

#include <fstream>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>
#include <stdexcept>
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


// Desc: parse size string (KB/MB/GB) into bytes
// In: const std::string& raw
// Out: std::uint64_t (bytes); throws on invalid input
std::uint64_t ConfigManager::parse_size_kb_mb(const std::string& raw) {
    std::string in = raw;
    trim_inplace(in);

    static const std::regex re(R"(^([0-9]+)\s*([kKmMgG][bB]?)$)");
    std::smatch m;
    if (!std::regex_match(in, m, re)) {
        throw std::runtime_error("invalid size (use KB/MB/GB): '" + raw + "'");
    }

    std::uint64_t n = 0;
    try {
        n = std::stoull(m[1].str());
    } catch (const std::exception&) {
        throw std::runtime_error("invalid number : '" + raw + "'");
    }

    std::string unit = m[2].str();
    for (auto& c : unit) c = (char)std::toupper((unsigned char)c);

    if (unit == "K" || unit == "KB") return n * 1024ULL;
    if (unit == "M" || unit == "MB") return n * 1024ULL * 1024ULL;
    if (unit == "G" || unit == "GB") return n * 1024ULL * 1024ULL * 1024ULL;
    throw std::runtime_error("unreachable unit");
}


// Desc: parse duration string into seconds
// In: const std::string& raw ("45s", "30m", "6h", "7d", "120")
// Out: std::uint64_t (seconds, > 0); throws on invalid input
std::uint64_t ConfigManager::parse_duration(const std::string& raw) {
    std::string in = raw;
    trim_inplace(in);

    static const std::regex re(R"(^([0-9]+)\s*([sSmMhHdD]?)$)");
    std::smatch m;
    if (!std::regex_match(in, m, re)) {
        throw std::runtime_error("invalid duration (use s/m/h/d): '" + raw + "'");
    }

    std::uint64_t n = 0;
    try {
        n = std::stoull(m[1].str());
    } catch (const std::exception&) {
        throw std::runtime_error("invalid number : '" + raw + "'");
    }
    if (n == 0) throw std::runtime_error("duration must be > 0: '" + raw + "'");

    const char unit = m[2].str().empty() ? 's' : (char)std::tolower((unsigned char)m[2].str()[0]);
    switch (unit) {
        case 's': return n;
        case 'm': return n * TTLPolicy::kMinute;
        case 'h': return n * TTLPolicy::kHour;
        case 'd': return n * TTLPolicy::kDay;
    }
    throw std::runtime_error("unreachable unit");
}


bool ConfigManager::loadFromFile(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cerr << "[ConfigManager] cannot open file: " << config_path << "\n";
        return false;
    }

    json j;
    try { file >> j; }
    catch (const std::exception& e) { std::cerr << "[ConfigManager] invalid JSON: " << e.what() << "\n"; return false; }

    return loadFromJson(j);
}


// Desc: read every known key from a JSON document; state changes only on success
// In: const json& j
// Out: bool (true on success)
bool ConfigManager::loadFromJson(const json& j) {
    if (!j.is_object()) {
        std::cerr << "[ConfigManager] config root must be an object\n";
        return false;
    }

    ConfigManager c;

    auto get_size = [&](const json& obj, const char* name, std::uint64_t& out) -> bool {
        if (!obj.contains(name)) return true;
        const auto& v = obj[name];
        if (v.is_number_integer() && v.get<std::int64_t>() > 0) { out = v.get<std::uint64_t>(); return true; }
        if (v.is_string()) {
            try { out = parse_size_kb_mb(v.get<std::string>()); }
            catch (const std::exception& e) { std::cerr << "[ConfigManager] '" << name << "': " << e.what() << "\n"; return false; }
            if (out == 0) { std::cerr << "[ConfigManager] '" << name << "' must be > 0\n"; return false; }
            return true;
        }
        std::cerr << "[ConfigManager] '" << name << "' must be like '512KB' or '64MB'\n";
        return false;
    };
    auto get_duration = [&](const json& obj, const char* name, std::uint64_t& out) -> bool {
        if (!obj.contains(name)) return true;
        const auto& v = obj[name];
        if (v.is_number_integer() && v.get<std::int64_t>() > 0) { out = v.get<std::uint64_t>(); return true; }
        if (v.is_string()) {
            try { out = parse_duration(v.get<std::string>()); return true; }
            catch (const std::exception& e) { std::cerr << "[ConfigManager] '" << name << "': " << e.what() << "\n"; return false; }
        }
        std::cerr << "[ConfigManager] '" << name << "' must be like '45s', '30m', '6h' or '7d'\n";
        return false;
    };
    auto get_count = [&](const json& obj, const char* name, std::uint64_t min_v, std::uint64_t& out) -> bool {
        if (!obj.contains(name)) return true;
        const auto& v = obj[name];
        if (!v.is_number_integer() || v.get<std::int64_t>() < 0 || v.get<std::uint64_t>() < min_v) {
            std::cerr << "[ConfigManager] '" << name << "' must be an integer >= " << min_v << "\n";
            return false;
        }
        out = v.get<std::uint64_t>();
        return true;
    };
    auto get_bool = [&](const json& obj, const char* name, bool& out) -> bool {
        if (!obj.contains(name)) return true;
        if (!obj[name].is_boolean()) { std::cerr << "[ConfigManager] '" << name << "' must be true/false\n"; return false; }
        out = obj[name].get<bool>();
        return true;
    };
    auto get_string = [&](const json& obj, const char* name, bool allow_empty, std::string& out) -> bool {
        if (!obj.contains(name)) return true;
        if (!obj[name].is_string()) { std::cerr << "[ConfigManager] '" << name << "' must be a string\n"; return false; }
        std::string s = obj[name].get<std::string>();
        trim_inplace(s);
        if (s.empty() && !allow_empty) { std::cerr << "[ConfigManager] '" << name << "' must be non-empty\n"; return false; }
        out = s;
        return true;
    };

    // durable tier
    if (!get_string(j, "durable_db_path", false, c.durable_db_path_)) return false;
    if (!get_count(j, "durable_timeout_ms", 1, c.durable_timeout_ms_)) return false;
    if (!get_size(j, "durable_capacity", c.durable_capacity_bytes_)) return false;

    // volatile tier
    if (!get_duration(j, "volatile_ceiling", c.volatile_ceiling_sec_)) return false;
    if (!get_size(j, "volatile_capacity", c.volatile_capacity_bytes_)) return false;

    // keys
    if (!get_string(j, "key_prefix", true, c.key_prefix_)) return false;
    if (c.key_prefix_.find_first_of(": \t") != std::string::npos) {
        std::cerr << "[ConfigManager] 'key_prefix' must not contain ':' or whitespace\n";
        return false;
    }
    std::uint64_t width = c.key_hash_width_;
    if (!get_count(j, "key_hash_width", 4, width)) return false;
    if (width > 64) { std::cerr << "[ConfigManager] 'key_hash_width' must be in [4, 64]\n"; return false; }
    c.key_hash_width_ = static_cast<std::size_t>(width);

    // stats
    if (j.contains("hit_rate_floor")) {
        const auto& v = j["hit_rate_floor"];
        if (!v.is_number() || v.get<double>() < 0.0 || v.get<double>() > 1.0) {
            std::cerr << "[ConfigManager] 'hit_rate_floor' must be a number in [0, 1]\n";
            return false;
        }
        c.hit_rate_floor_ = v.get<double>();
    }
    if (!get_count(j, "hit_rate_warn_interval", 1, c.hit_rate_warn_interval_)) return false;

    // promotion
    if (j.contains("promotion")) {
        const auto& p = j["promotion"];
        if (!p.is_object()) { std::cerr << "[ConfigManager] 'promotion' must be an object\n"; return false; }
        std::uint64_t workers = c.promotion_workers_;
        if (!get_bool(p, "async", c.promotion_async_)) return false;
        if (!get_count(p, "workers", 1, workers)) return false;
        c.promotion_workers_ = static_cast<std::size_t>(workers);
    }

    // warmer
    if (j.contains("warmer")) {
        const auto& w = j["warmer"];
        if (!w.is_object()) { std::cerr << "[ConfigManager] 'warmer' must be an object\n"; return false; }
        std::uint64_t batch = c.warmer_batch_size_, conc = c.warmer_max_concurrency_, limit = c.warmer_preload_limit_;
        if (!get_count(w, "batch_size", 1, batch)) return false;
        if (!get_count(w, "batch_delay_ms", 0, c.warmer_batch_delay_ms_)) return false;
        if (!get_count(w, "max_concurrency", 1, conc)) return false;
        if (!get_bool(w, "preload_on_start", c.warmer_preload_on_start_)) return false;
        if (!get_count(w, "preload_limit", 0, limit)) return false;
        c.warmer_batch_size_ = static_cast<std::size_t>(batch);
        c.warmer_max_concurrency_ = static_cast<std::size_t>(conc);
        c.warmer_preload_limit_ = static_cast<std::size_t>(limit);
    }

    // log
    if (j.contains("log")) {
        const auto& l = j["log"];
        if (!l.is_object()) { std::cerr << "[ConfigManager] 'log' must be an object\n"; return false; }
        if (!get_string(l, "path", false, c.log_path_)) return false;
        std::string level;
        if (!get_string(l, "level", false, level)) return false;
        if (!level.empty() && !parse_log_level(toLower(level), c.log_level_)) {
            std::cerr << "[ConfigManager] 'log.level' must be debug, info, warn or error\n";
            return false;
        }
    }

    // ttl policy
    c.policy_ = TTLPolicy::defaults(c.volatile_ceiling_sec_);
    if (j.contains("ttl_policy") && !c.loadPolicy(j["ttl_policy"], c.policy_)) return false;

    *this = std::move(c);
    return true;
}


// Desc: apply ttl_policy overrides; a row may set any subset of its fields
// In: const json& j, TTLPolicy& policy
// Out: bool (true on success)
bool ConfigManager::loadPolicy(const json& j, TTLPolicy& policy) {
    if (!j.is_object()) {
        std::cerr << "[ConfigManager] 'ttl_policy' must be an object of class -> rule\n";
        return false;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string cls = it.key();
        const json& row = it.value();
        if (!row.is_object()) {
            std::cerr << "[ConfigManager] ttl_policy." << cls << " must be an object\n";
            return false;
        }

        TTLRule rule = policy.rule_for(cls);
        const bool known = policy.has_rule(cls);
        const bool has_volatile = row.contains("volatile");
        const bool has_durable = row.contains("durable");
        if (!known && !has_durable) {
            std::cerr << "[ConfigManager] ttl_policy." << cls << ": new class needs 'durable'\n";
            return false;
        }

        try {
            if (has_durable) {
                const auto& v = row["durable"];
                rule.durable_seconds = v.is_string() ? parse_duration(v.get<std::string>())
                                                     : v.get<std::uint64_t>();
            }
            if (has_volatile) {
                const auto& v = row["volatile"];
                rule.volatile_seconds = v.is_string() ? parse_duration(v.get<std::string>())
                                                      : v.get<std::uint64_t>();
            } else if (!known || has_durable) {
                rule.volatile_seconds = std::min(rule.durable_seconds, 6 * TTLPolicy::kHour);
            }
            if (row.contains("durable_eligible")) {
                if (!row["durable_eligible"].is_boolean()) throw std::runtime_error("'durable_eligible' must be true/false");
                rule.durable_eligible = row["durable_eligible"].get<bool>();
            }
            if (row.contains("unit_cost")) {
                if (!row["unit_cost"].is_number()) throw std::runtime_error("'unit_cost' must be a number");
                rule.estimated_unit_cost = row["unit_cost"].get<double>();
            }
        } catch (const std::exception& e) {
            std::cerr << "[ConfigManager] ttl_policy." << cls << ": " << e.what() << "\n";
            return false;
        }

        std::string err;
        if (!policy.set_rule(cls, rule, &err)) {
            std::cerr << "[ConfigManager] ttl_policy: " << err << "\n";
            return false;
        }
    }
    return true;
}
