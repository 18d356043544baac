// requirements.hpp
#pragma once
#include "ConfigManager.hpp"
#include <memory>
#include <string>
#include <vector>
#include <sqlite3.h>

using SqliteHandle = std::unique_ptr<sqlite3, void(*)(sqlite3*)>;

struct StartupResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> logs;
    ConfigManager config;
    SqliteHandle db{nullptr, [](sqlite3* p){ if (p) sqlite3_close(p); }};
};

class Requirements {
public:
    // dirs, config load + validation, durable DB open + schema, expired sweep
    static StartupResult run(const std::string& config_path);
    // Same, from an already loaded config (db path taken from it).
    static StartupResult run(const ConfigManager& config);

    // Open (or create) a cache database and apply the schema.
    // ":memory:" gives a private in-memory database.
    static SqliteHandle openCacheDb(const std::string& db_path,
                                    std::uint64_t busy_timeout_ms,
                                    std::string* err = nullptr);

private:
    static void ensureDir(const std::string& path, StartupResult& out);
    static void fileLog(const std::string& msg);
    static bool loadConfig(const std::string& config_path,
                           StartupResult& out);
    static bool validateConfig(const ConfigManager& cfg,
                               StartupResult& out);
    static bool initCacheDb(StartupResult& out);
    static void purgeExpired(StartupResult& out);
    static StartupResult finish(StartupResult res);
};
