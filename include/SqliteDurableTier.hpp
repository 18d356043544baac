// === include/SqliteDurableTier.hpp ===
#pragma once
#include "DurableTier.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <sqlite3.h>

// Durable tier on one SQLite connection (schema from Requirements).
// Every operation runs under timeout_ms: waiting for the connection, SQLite
// busy waits and statement execution all count against it. Exceeding it is
// reported as a fault, never waited out.
class SqliteDurableTier : public DurableTier {
public:
    struct Options {
        uint64_t timeout_ms{5000};
        uint64_t max_bytes{256ULL * 1024ULL * 1024ULL};
        int evict_batch{100};
        double lfu_tau_seconds{3600.0};
    };

    explicit SqliteDurableTier(sqlite3* db) : SqliteDurableTier(db, Options{}) {}
    SqliteDurableTier(sqlite3* db, Options opts);

    TierStatus find_by_params(const std::string& key,
                              const nlohmann::json& normalized_params,
                              DurableRecord& out,
                              std::string* err = nullptr) override;
    bool upsert(const DurableWrite& w, DurableRecord* out = nullptr,
                std::string* err = nullptr) override;
    std::optional<size_t> delete_matching(const std::string& pattern,
                                          std::string* err = nullptr) override;
    bool delete_key(const std::string& key, std::string* err = nullptr) override;
    std::optional<size_t> purge_expired(std::string* err = nullptr) override;
    std::vector<DurableRecord> top_accessed(size_t limit, std::string* err = nullptr) override;

    // Row count, or -1 on fault. Mostly for tests and reports.
    int64_t count(std::string* err = nullptr);
    // Reads a row without touching its access counters.
    TierStatus peek(const std::string& key, DurableRecord& out, std::string* err = nullptr);

    void set_timeout_ms(uint64_t ms) { opts_.timeout_ms = ms; }
    const Options& options() const { return opts_; }

private:
    // RAII: connection lock + statement deadline (progress handler).
    class Session {
    public:
        Session(SqliteDurableTier& tier);
        ~Session();
        bool ok() const { return locked_; }
    private:
        SqliteDurableTier& tier_;
        bool locked_{false};
        std::chrono::steady_clock::time_point deadline_;
        static int on_progress(void* ctx);
    };

    TierStatus load_row(const std::string& key, DurableRecord& out, std::string* err);
    bool check_capacity();
    void evict_lfu(int max_rows_to_evict);
    std::string last_error(const char* what) const;

    sqlite3* db_{nullptr};
    Options opts_;
    std::timed_mutex mu_;
};
