// requirements.cpp
#include "requirements.hpp"
#include "CacheTypes.hpp"
#include "Logger.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <ctime>


// Create tables query
static const char* kSchemaSQL = R"SQL(
CREATE TABLE IF NOT EXISTS cache_entries (
  cache_key       TEXT PRIMARY KEY,
  cache_class     TEXT NOT NULL,
  params_json     TEXT NOT NULL,
  payload_json    TEXT NOT NULL,
  metadata_json   TEXT NOT NULL DEFAULT '{}',
  created_at_ms   INTEGER NOT NULL,
  last_access_ms  INTEGER NOT NULL,
  expires_at_ms   INTEGER NOT NULL,
  ttl_seconds     INTEGER NOT NULL,
  access_count    INTEGER NOT NULL DEFAULT 1,
  unit_cost       REAL NOT NULL DEFAULT 0,
  cost_saved      REAL NOT NULL DEFAULT 0
);

CREATE INDEX IF NOT EXISTS idx_cache_expires ON cache_entries(expires_at_ms);
CREATE INDEX IF NOT EXISTS idx_cache_class ON cache_entries(cache_class);
CREATE INDEX IF NOT EXISTS idx_cache_access ON cache_entries(access_count);

CREATE TABLE IF NOT EXISTS meta (
  key   TEXT PRIMARY KEY,
  value TEXT NOT NULL
);

INSERT OR IGNORE INTO meta(key, value) VALUES ('schema_version','1');
)SQL";



// Desc: append a timestamped line to config log file
// In: const std::string& msg
// Out: void
void Requirements::fileLog(const std::string& msg) {
    int fd = ::open("logs/config.log", O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd == -1) return;
    time_t now = ::time(nullptr);
    char buf[64];
    ctime_r(&now, buf);
    buf[std::strlen(buf) - 1] = '\0';
    std::string line = "[" + std::string(buf) + "] " + msg + "\n";
    ssize_t _wr = ::write(fd, line.c_str(), line.size());
    (void)_wr;
    ::close(fd);
}

// Desc: create directory if missing and record status
// In: const std::string& path, StartupResult& out
// Out: void
void Requirements::ensureDir(const std::string& path, StartupResult& out) {
    if (path.empty() || path == ".") return;
    if (::mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
        out.logs.push_back("[ensureDir] failed: " + path + " (" + std::string(::strerror(errno)) + ")");
        return;
    }
    out.logs.push_back("[ensureDir] ok: " + path);
}

// Desc: load JSON config into StartupResult::config
// In: const std::string& config_path, StartupResult& out
// Out: bool (true on success)
bool Requirements::loadConfig(const std::string& config_path, StartupResult& out) {
    if (!out.config.loadFromFile(config_path)) {
        out.error = "[config] failed to load " + config_path;
        out.logs.push_back(out.error);
        return false;
    }
    out.logs.push_back(std::string("[config] loaded: ") + config_path);
    return true;
}

// Desc: validate cross-field config limits
// In: const ConfigManager& cfg, StartupResult& out
// Out: bool (true if valid)
bool Requirements::validateConfig(const ConfigManager& cfg, StartupResult& out) {
    const uint64_t MIN_BYTES = 64 * 1024ULL;                        // 64KB
    const uint64_t MAX_BYTES = 1024ULL * 1024ULL * 1024ULL * 1024ULL; // 1TB

    if (cfg.volatile_capacity_bytes() < MIN_BYTES || cfg.durable_capacity_bytes() < MIN_BYTES) {
        out.error = "[config] capacity too small (<64KB)";
        out.logs.push_back(out.error);
        return false;
    }
    if (cfg.volatile_capacity_bytes() > MAX_BYTES || cfg.durable_capacity_bytes() > MAX_BYTES) {
        out.error = "[config] capacity too large (>1TB)";
        out.logs.push_back(out.error);
        return false;
    }
    if (cfg.durable_db_path().empty()) {
        out.error = "[config] durable_db_path is empty";
        out.logs.push_back(out.error);
        return false;
    }
    out.logs.push_back("[config] durable_db_path: " + cfg.durable_db_path());
    out.logs.push_back("[config] durable_capacity: " + std::to_string(cfg.durable_capacity_bytes()) + " bytes");
    out.logs.push_back("[config] volatile_capacity: " + std::to_string(cfg.volatile_capacity_bytes()) + " bytes");
    out.logs.push_back("[config] volatile_ceiling: " + std::to_string(cfg.volatile_ceiling_seconds()) + " s");
    out.logs.push_back("[config] ttl classes: " + std::to_string(cfg.ttl_policy().classes().size()));
    out.logs.push_back("[config] validation ok");
    return true;
}


// Desc: open/init SQLite cache DB and apply schema
// In: const std::string& db_path, std::uint64_t busy_timeout_ms, std::string* err
// Out: SqliteHandle (empty on failure)
SqliteHandle Requirements::openCacheDb(const std::string& db_path,
                                       std::uint64_t busy_timeout_ms,
                                       std::string* err) {
    SqliteHandle db{nullptr, [](sqlite3* p){ if (p) sqlite3_close(p); }};

    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(db_path.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        if (err) *err = std::string("sqlite open failed: ") + (raw ? sqlite3_errmsg(raw) : "unknown");
        if (raw) sqlite3_close(raw);
        return db;
    }
    db.reset(raw);

    sqlite3_busy_timeout(raw, static_cast<int>(busy_timeout_ms));
    if (db_path != ":memory:") {
        sqlite3_exec(raw, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        sqlite3_wal_autocheckpoint(raw, 512);
    }
    sqlite3_exec(raw, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    char* e = nullptr;
    rc = sqlite3_exec(raw, kSchemaSQL, nullptr, nullptr, &e);
    if (rc != SQLITE_OK) {
        if (err) *err = std::string("schema exec failed: ") + (e ? e : "");
        if (e) sqlite3_free(e);
        db.reset();
    }
    return db;
}

bool Requirements::initCacheDb(StartupResult& out) {
    std::string err;
    out.db = openCacheDb(out.config.durable_db_path(), out.config.durable_timeout_ms(), &err);
    if (!out.db) {
        out.error = "[cache] " + err;
        out.logs.push_back(out.error);
        return false;
    }
    out.logs.push_back("[cache] schema ok (tables/indexes)");
    return true;
}


// Desc: delete durable rows that expired while the process was down
// In: StartupResult& out
// Out: void
void Requirements::purgeExpired(StartupResult& out) {
    sqlite3* db = out.db.get();
    if (!db) return;
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM cache_entries WHERE expires_at_ms <= ?;", -1, &st, nullptr) != SQLITE_OK) {
        out.logs.push_back(std::string("[cache] purge prepare failed: ") + sqlite3_errmsg(db));
        return;
    }
    sqlite3_bind_int64(st, 1, now_epoch_ms());
    if (sqlite3_step(st) == SQLITE_DONE) {
        out.logs.push_back("[cache] purged expired rows: " + std::to_string(sqlite3_changes(db)));
    } else {
        out.logs.push_back(std::string("[cache] purge failed: ") + sqlite3_errmsg(db));
    }
    sqlite3_finalize(st);
}

StartupResult Requirements::finish(StartupResult res) {
    for (auto& l : res.logs) fileLog(l);
    return res;
}


StartupResult Requirements::run(const std::string& config_path) {
    StartupResult res;
    ensureDir("logs", res);
    if (!loadConfig(config_path, res)) return finish(std::move(res));
    for (auto& l : res.logs) fileLog(l);
    return run(res.config);
}


// Desc: orchestrate startup: dirs, validation, DB, expired sweep; log results
// In: const ConfigManager& config
// Out: StartupResult
StartupResult Requirements::run(const ConfigManager& config) {
    StartupResult res;
    res.config = config;

    // 1) dirs
    ensureDir("logs", res);
    const std::string& db_path = res.config.durable_db_path();
    const auto slash = db_path.rfind('/');
    if (db_path != ":memory:" && slash != std::string::npos && slash > 0) {
        ensureDir(db_path.substr(0, slash), res);
    }
    const auto log_slash = res.config.log_path().rfind('/');
    if (log_slash != std::string::npos && log_slash > 0) {
        ensureDir(res.config.log_path().substr(0, log_slash), res);
    }

    // 2) validate
    if (!validateConfig(res.config, res)) return finish(std::move(res));

    // 3) logger
    if (log_init(res.config.log_path(), res.config.log_level())) {
        res.logs.push_back("[log] writing to " + res.config.log_path());
    } else {
        res.logs.push_back("[log] file logging unavailable, stderr only");
    }

    // 4) DB init + schema
    if (!initCacheDb(res)) return finish(std::move(res));

    // 5) expired rows
    purgeExpired(res);

    res.ok = true;
    return finish(std::move(res));
}
