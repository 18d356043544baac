// === src/SqliteDurableTier/SqliteDurableTier.cpp ===
#include "SqliteDurableTier.hpp"
#include "Logger.hpp"
#include "PatternMatcherHS.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

using nlohmann::json;

namespace {
    // finalize on scope exit
    struct Stmt {
        sqlite3_stmt* s{nullptr};
        ~Stmt() { if (s) (void)sqlite3_finalize(s); }
    };

    const char* kSelectCols =
        "cache_key, cache_class, params_json, payload_json, metadata_json, "
        "created_at_ms, last_access_ms, expires_at_ms, ttl_seconds, "
        "access_count, unit_cost, cost_saved";

    std::string column_text(sqlite3_stmt* st, int col) {
        const unsigned char* t = sqlite3_column_text(st, col);
        return t ? std::string(reinterpret_cast<const char*>(t)) : std::string();
    }

    // Desc: fill record from a row selected with kSelectCols
    // In: sqlite3_stmt* st, DurableRecord& r
    // Out: bool (false if any stored json is corrupted)
    bool read_record(sqlite3_stmt* st, DurableRecord& r) {
        r.key            = column_text(st, 0);
        r.cache_class    = column_text(st, 1);
        r.created_at_ms  = sqlite3_column_int64(st, 5);
        r.last_access_ms = sqlite3_column_int64(st, 6);
        r.expires_at_ms  = sqlite3_column_int64(st, 7);
        r.ttl_seconds    = static_cast<uint64_t>(sqlite3_column_int64(st, 8));
        r.access_count   = static_cast<uint64_t>(sqlite3_column_int64(st, 9));
        r.unit_cost      = sqlite3_column_double(st, 10);
        r.cost_saved     = sqlite3_column_double(st, 11);

        r.normalized_params = json::parse(column_text(st, 2), nullptr, false);
        r.payload           = json::parse(column_text(st, 3), nullptr, false);
        r.metadata          = json::parse(column_text(st, 4), nullptr, false);
        return !r.normalized_params.is_discarded() &&
               !r.payload.is_discarded() &&
               !r.metadata.is_discarded();
    }
}


SqliteDurableTier::SqliteDurableTier(sqlite3* db, Options opts)
    : db_(db), opts_(opts) {}


SqliteDurableTier::Session::Session(SqliteDurableTier& tier) : tier_(tier) {
    const auto budget = std::chrono::milliseconds(tier_.opts_.timeout_ms);
    deadline_ = std::chrono::steady_clock::now() + budget;
    if (!tier_.db_) return;
    if (!tier_.mu_.try_lock_for(budget)) return;
    locked_ = true;
    // whatever is left of the budget bounds busy waits and statement execution
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline_ - std::chrono::steady_clock::now()).count();
    sqlite3_busy_timeout(tier_.db_, static_cast<int>(std::max<long long>(left, 1)));
    sqlite3_progress_handler(tier_.db_, 1000, &Session::on_progress, this);
}

SqliteDurableTier::Session::~Session() {
    if (!locked_) return;
    sqlite3_progress_handler(tier_.db_, 0, nullptr, nullptr);
    tier_.mu_.unlock();
}

int SqliteDurableTier::Session::on_progress(void* ctx) {
    auto* self = static_cast<Session*>(ctx);
    // non-zero interrupts the running statement (SQLITE_INTERRUPT)
    return std::chrono::steady_clock::now() > self->deadline_ ? 1 : 0;
}

std::string SqliteDurableTier::last_error(const char* what) const {
    const int code = db_ ? sqlite3_errcode(db_) : SQLITE_MISUSE;
    std::string msg = std::string(what) + ": ";
    if (code == SQLITE_INTERRUPT || code == SQLITE_BUSY || code == SQLITE_LOCKED) {
        msg += "timeout after " + std::to_string(opts_.timeout_ms) + " ms";
    } else {
        msg += db_ ? sqlite3_errmsg(db_) : "no database handle";
    }
    return msg;
}


// Desc: look up key, verify params, bump access counters on hit
// In: const std::string& key, const json& normalized_params, DurableRecord& out
// Out: TierStatus (Hit/Miss/Fault)
TierStatus SqliteDurableTier::find_by_params(const std::string& key,
                                             const json& normalized_params,
                                             DurableRecord& out,
                                             std::string* err) {
    Session session(*this);
    if (!session.ok()) {
        if (err) *err = "find: durable tier busy, timeout after " + std::to_string(opts_.timeout_ms) + " ms";
        return TierStatus::Fault;
    }

    DurableRecord rec;
    TierStatus st = load_row(key, rec, err);
    if (st != TierStatus::Hit) return st;

    const int64_t now = now_epoch_ms();
    if (rec.expires_at_ms <= now) {
        Stmt del;
        if (sqlite3_prepare_v2(db_, "DELETE FROM cache_entries WHERE cache_key=?;", -1, &del.s, nullptr) == SQLITE_OK) {
            sqlite3_bind_text(del.s, 1, key.c_str(), -1, SQLITE_TRANSIENT);
            (void)sqlite3_step(del.s);
        }
        return TierStatus::Miss;
    }

    // a truncated-hash collision: same key, different request
    if (rec.normalized_params != normalized_params) {
        #ifdef DEBUG
        log_debug("SqliteDurableTier", "params mismatch for key " + key + ", treating as miss");
        #endif
        return TierStatus::Miss;
    }

    const char* upd =
        "UPDATE cache_entries "
        "SET access_count = access_count + 1, last_access_ms = ?, "
        "    cost_saved = unit_cost * access_count "
        "WHERE cache_key=?;";
    Stmt u;
    if (sqlite3_prepare_v2(db_, upd, -1, &u.s, nullptr) != SQLITE_OK) {
        if (err) *err = last_error("find: prepare update");
        return TierStatus::Fault;
    }
    sqlite3_bind_int64(u.s, 1, now);
    sqlite3_bind_text(u.s, 2, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(u.s) != SQLITE_DONE) {
        // the read already succeeded; counters are best effort
        log_warn("SqliteDurableTier", last_error("access counter update"));
    } else {
        rec.access_count += 1;
        rec.last_access_ms = now;
        rec.cost_saved = rec.unit_cost * static_cast<double>(rec.access_count - 1);
    }

    out = std::move(rec);
    return TierStatus::Hit;
}


// Desc: read one row (no counter update); deletes the row if its json is corrupted
// In: const std::string& key, DurableRecord& out
// Out: TierStatus
TierStatus SqliteDurableTier::load_row(const std::string& key, DurableRecord& out, std::string* err) {
    const std::string sql = std::string("SELECT ") + kSelectCols + " FROM cache_entries WHERE cache_key=?;";
    Stmt sel;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &sel.s, nullptr) != SQLITE_OK) {
        if (err) *err = last_error("select prepare");
        return TierStatus::Fault;
    }
    sqlite3_bind_text(sel.s, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(sel.s);
    if (rc == SQLITE_DONE) return TierStatus::Miss;
    if (rc != SQLITE_ROW) {
        if (err) *err = last_error("select step");
        return TierStatus::Fault;
    }

    if (!read_record(sel.s, out)) {
        sqlite3_finalize(sel.s);
        sel.s = nullptr;
        Stmt del;
        if (sqlite3_prepare_v2(db_, "DELETE FROM cache_entries WHERE cache_key=?;", -1, &del.s, nullptr) == SQLITE_OK) {
            sqlite3_bind_text(del.s, 1, key.c_str(), -1, SQLITE_TRANSIENT);
            (void)sqlite3_step(del.s);
        }
        if (err) *err = "corrupted durable row removed: " + key;
        return TierStatus::Fault;
    }
    return TierStatus::Hit;
}

TierStatus SqliteDurableTier::peek(const std::string& key, DurableRecord& out, std::string* err) {
    Session session(*this);
    if (!session.ok()) {
        if (err) *err = "peek: durable tier busy";
        return TierStatus::Fault;
    }
    return load_row(key, out, err);
}


// Desc: upsert a record; access_count and created_at survive overwrites of a live row
// In: const DurableWrite& w, DurableRecord* out
// Out: bool (true on success)
bool SqliteDurableTier::upsert(const DurableWrite& w, DurableRecord* out, std::string* err) {
    Session session(*this);
    if (!session.ok()) {
        if (err) *err = "upsert: durable tier busy, timeout after " + std::to_string(opts_.timeout_ms) + " ms";
        return false;
    }

    if (!check_capacity()) {
        log_warn("SqliteDurableTier", "[evict] durable capacity reached, removing least frequently used rows");
        evict_lfu(opts_.evict_batch);
    }

    const char* sql =
        "INSERT INTO cache_entries "
        "(cache_key, cache_class, params_json, payload_json, metadata_json, "
        " created_at_ms, last_access_ms, expires_at_ms, ttl_seconds, access_count, unit_cost, cost_saved) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, 1, ?, 0) "
        "ON CONFLICT(cache_key) DO UPDATE SET "
        // an expired row not yet purged starts over as a new entry
        "  created_at_ms  = CASE WHEN cache_entries.expires_at_ms <= excluded.last_access_ms "
        "                        THEN excluded.created_at_ms ELSE cache_entries.created_at_ms END, "
        "  access_count   = CASE WHEN cache_entries.expires_at_ms <= excluded.last_access_ms "
        "                        THEN 1 ELSE cache_entries.access_count END, "
        "  cost_saved     = CASE WHEN cache_entries.expires_at_ms <= excluded.last_access_ms "
        "                        THEN 0 ELSE excluded.unit_cost * (cache_entries.access_count - 1) END, "
        "  cache_class    = excluded.cache_class, "
        "  params_json    = excluded.params_json, "
        "  payload_json   = excluded.payload_json, "
        "  metadata_json  = excluded.metadata_json, "
        "  last_access_ms = excluded.last_access_ms, "
        "  expires_at_ms  = excluded.expires_at_ms, "
        "  ttl_seconds    = excluded.ttl_seconds, "
        "  unit_cost      = excluded.unit_cost;";

    Stmt st;
    if (sqlite3_prepare_v2(db_, sql, -1, &st.s, nullptr) != SQLITE_OK) {
        if (err) *err = last_error("upsert prepare");
        return false;
    }

    const int64_t now = now_epoch_ms();
    const std::string params  = w.normalized_params.dump();
    const std::string payload = w.payload.dump();
    const std::string meta    = w.metadata.is_null() ? std::string("{}") : w.metadata.dump();

    sqlite3_bind_text(st.s,   1, w.key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.s,   2, w.cache_class.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.s,   3, params.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.s,   4, payload.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.s,   5, meta.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(st.s,  6, now);
    sqlite3_bind_int64(st.s,  7, now);
    sqlite3_bind_int64(st.s,  8, now + static_cast<int64_t>(w.ttl_seconds) * 1000LL);
    sqlite3_bind_int64(st.s,  9, static_cast<sqlite3_int64>(w.ttl_seconds));
    sqlite3_bind_double(st.s, 10, w.unit_cost);

    if (sqlite3_step(st.s) != SQLITE_DONE) {
        if (err) *err = last_error("upsert step");
        return false;
    }

    if (out) {
        if (load_row(w.key, *out, err) != TierStatus::Hit) return false;
    }
    return true;
}


// Desc: delete rows whose key matches a caseless regex (Hyperscan)
// In: const std::string& pattern
// Out: std::optional<size_t> (deleted rows, nullopt on fault)
std::optional<size_t> SqliteDurableTier::delete_matching(const std::string& pattern, std::string* err) {
    PatternMatcherHS matcher;
    if (!matcher.build(pattern, err)) return std::nullopt;

    Session session(*this);
    if (!session.ok()) {
        if (err) *err = "delete_matching: durable tier busy";
        return std::nullopt;
    }

    std::vector<std::string> keys;
    {
        Stmt sel;
        if (sqlite3_prepare_v2(db_, "SELECT cache_key FROM cache_entries;", -1, &sel.s, nullptr) != SQLITE_OK) {
            if (err) *err = last_error("delete_matching select");
            return std::nullopt;
        }
        int rc;
        while ((rc = sqlite3_step(sel.s)) == SQLITE_ROW) {
            std::string k = column_text(sel.s, 0);
            if (matcher.matches(k)) keys.push_back(std::move(k));
        }
        if (rc != SQLITE_DONE) {
            if (err) *err = last_error("delete_matching scan");
            return std::nullopt;
        }
    }
    if (keys.empty()) return size_t{0};

    // Delete in a transaction
    if (sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        if (err) *err = last_error("delete_matching begin");
        return std::nullopt;
    }
    size_t deleted = 0;
    bool failed = false;
    {
        Stmt del;
        if (sqlite3_prepare_v2(db_, "DELETE FROM cache_entries WHERE cache_key=?;", -1, &del.s, nullptr) == SQLITE_OK) {
            for (const auto& k : keys) {
                sqlite3_bind_text(del.s, 1, k.c_str(), -1, SQLITE_TRANSIENT);
                if (sqlite3_step(del.s) != SQLITE_DONE) { failed = true; break; }
                deleted += static_cast<size_t>(sqlite3_changes(db_));
                (void)sqlite3_reset(del.s);
            }
        } else {
            failed = true;
        }
    }
    if (failed) {
        if (err) *err = last_error("delete_matching delete");
        (void)sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        return std::nullopt;
    }
    if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        if (err) *err = last_error("delete_matching commit");
        (void)sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        return std::nullopt;
    }
    return deleted;
}

bool SqliteDurableTier::delete_key(const std::string& key, std::string* err) {
    Session session(*this);
    if (!session.ok()) {
        if (err) *err = "delete_key: durable tier busy";
        return false;
    }
    Stmt del;
    if (sqlite3_prepare_v2(db_, "DELETE FROM cache_entries WHERE cache_key=?;", -1, &del.s, nullptr) != SQLITE_OK) {
        if (err) *err = last_error("delete_key prepare");
        return false;
    }
    sqlite3_bind_text(del.s, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(del.s) != SQLITE_DONE) {
        if (err) *err = last_error("delete_key step");
        return false;
    }
    return true;
}

std::optional<size_t> SqliteDurableTier::purge_expired(std::string* err) {
    Session session(*this);
    if (!session.ok()) {
        if (err) *err = "purge_expired: durable tier busy";
        return std::nullopt;
    }
    Stmt del;
    if (sqlite3_prepare_v2(db_, "DELETE FROM cache_entries WHERE expires_at_ms <= ?;", -1, &del.s, nullptr) != SQLITE_OK) {
        if (err) *err = last_error("purge prepare");
        return std::nullopt;
    }
    sqlite3_bind_int64(del.s, 1, now_epoch_ms());
    if (sqlite3_step(del.s) != SQLITE_DONE) {
        if (err) *err = last_error("purge step");
        return std::nullopt;
    }
    return static_cast<size_t>(sqlite3_changes(db_));
}

std::vector<DurableRecord> SqliteDurableTier::top_accessed(size_t limit, std::string* err) {
    std::vector<DurableRecord> rows;
    if (limit == 0) return rows;

    Session session(*this);
    if (!session.ok()) {
        if (err) *err = "top_accessed: durable tier busy";
        return rows;
    }
    const std::string sql = std::string("SELECT ") + kSelectCols +
        " FROM cache_entries WHERE expires_at_ms > ? "
        "ORDER BY access_count DESC, last_access_ms DESC LIMIT ?;";
    Stmt sel;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &sel.s, nullptr) != SQLITE_OK) {
        if (err) *err = last_error("top_accessed prepare");
        return rows;
    }
    sqlite3_bind_int64(sel.s, 1, now_epoch_ms());
    sqlite3_bind_int64(sel.s, 2, static_cast<sqlite3_int64>(limit));
    int rc;
    while ((rc = sqlite3_step(sel.s)) == SQLITE_ROW) {
        DurableRecord r;
        if (read_record(sel.s, r)) rows.push_back(std::move(r));
    }
    if (rc != SQLITE_DONE && err) *err = last_error("top_accessed step");
    return rows;
}

int64_t SqliteDurableTier::count(std::string* err) {
    Session session(*this);
    if (!session.ok()) {
        if (err) *err = "count: durable tier busy";
        return -1;
    }
    Stmt st;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM cache_entries;", -1, &st.s, nullptr) != SQLITE_OK ||
        sqlite3_step(st.s) != SQLITE_ROW) {
        if (err) *err = last_error("count");
        return -1;
    }
    return sqlite3_column_int64(st.s, 0);
}


// Desc: check live database size ((page_count - freelist_count) * page_size)
// In: (none)
// Out: bool (true if within limit)
bool SqliteDurableTier::check_capacity() {
    if (opts_.max_bytes == 0) return true;
    auto pragma_int = [&](const char* sql) -> int64_t {
        Stmt st;
        if (sqlite3_prepare_v2(db_, sql, -1, &st.s, nullptr) != SQLITE_OK) return 0;
        if (sqlite3_step(st.s) != SQLITE_ROW) return 0;
        return sqlite3_column_int64(st.s, 0);
    };
    const int64_t pages = pragma_int("PRAGMA page_count;");
    const int64_t free_pages = pragma_int("PRAGMA freelist_count;");
    const int64_t page_size = pragma_int("PRAGMA page_size;");
    const uint64_t live_bytes = static_cast<uint64_t>(std::max<int64_t>(pages - free_pages, 0) * page_size);
    return live_bytes < opts_.max_bytes;
}


// ----------------------------------------------------
// LFU with age-decay: score = hits / (1 + age / tau)
// tie-breaker: older first (last_access ASC)
// ----------------------------------------------------
void SqliteDurableTier::evict_lfu(int max_rows_to_evict) {
    if (!db_ || max_rows_to_evict <= 0) return;

    const int64_t now_ms = now_epoch_ms();
    const char* sel_sql =
        "SELECT cache_key FROM cache_entries "
        "ORDER BY (CAST(access_count AS REAL) / (1.0 + "
        "         (MAX(?1 - last_access_ms, 0) / 1000.0 / ?2))) ASC, "
        "         last_access_ms ASC "
        "LIMIT ?3;";

    std::vector<std::string> keys;
    {
        Stmt sel;
        if (sqlite3_prepare_v2(db_, sel_sql, -1, &sel.s, nullptr) != SQLITE_OK) return;
        sqlite3_bind_int64(sel.s, 1, now_ms);                   // ?1 = now
        sqlite3_bind_double(sel.s, 2, opts_.lfu_tau_seconds);   // ?2 = tau
        sqlite3_bind_int(sel.s, 3, max_rows_to_evict);          // ?3 = LIMIT
        while (sqlite3_step(sel.s) == SQLITE_ROW) {
            keys.push_back(column_text(sel.s, 0));
        }
    }
    if (keys.empty()) return;

    if (sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        log_warn("SqliteDurableTier", last_error("evict begin"));
        return;
    }
    {
        Stmt del;
        if (sqlite3_prepare_v2(db_, "DELETE FROM cache_entries WHERE cache_key=?;", -1, &del.s, nullptr) == SQLITE_OK) {
            for (const auto& k : keys) {
                sqlite3_bind_text(del.s, 1, k.c_str(), -1, SQLITE_TRANSIENT);
                (void)sqlite3_step(del.s);
                (void)sqlite3_reset(del.s);
            }
        }
    }
    if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        log_warn("SqliteDurableTier", last_error("evict commit"));
        (void)sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
}
