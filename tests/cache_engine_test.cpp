#include "CacheEngine.hpp"
#include "test_support.hpp"

#include <fstream>
#include <stdexcept>
#include <gtest/gtest.h>

using nlohmann::json;

namespace {

std::string write_config(const std::string& dir, const json& j) {
    const std::string path = dir + "/propcache.json";
    std::ofstream out(path);
    out << j.dump(2);
    return path;
}

json file_config(const std::string& dir, bool preload) {
    return json{
        {"durable_db_path", dir + "/db/propcache.sqlite"},
        {"key_prefix", "pc"},
        {"warmer", {{"preload_on_start", preload}, {"preload_limit", 10}, {"batch_delay_ms", 0}}},
        {"log", {{"path", dir + "/log/propcache.log"}, {"level", "warn"}}},
    };
}

} // namespace

TEST(CacheEngine, InMemoryRoundTrip) {
    auto engine = CacheEngine::in_memory();
    const json params{{"address", "1 Main St"}, {"zip", "77002"}};

    EXPECT_FALSE(engine->get("address", params).cached);
    const SetResult s = engine->set("address", params, json{{"lat", 29.75}});
    EXPECT_TRUE(s.stored_volatile);
    EXPECT_TRUE(s.stored_durable);

    const GetResult g = engine->get("address", params);
    ASSERT_TRUE(g.cached);
    EXPECT_EQ(g.source, CacheSource::Volatile);
    EXPECT_EQ(g.key, s.key);

    const json stats = engine->get_stats().to_json();
    EXPECT_EQ(stats["total_requests"], 2);
    EXPECT_EQ(stats["volatile_hits"], 1);
    EXPECT_EQ(stats["writes"], 1);
    EXPECT_DOUBLE_EQ(stats["hit_rate"].get<double>(), 0.5);
}

TEST(CacheEngine, DurableHitIsPromoted) {
    auto engine = CacheEngine::in_memory();
    const json params{{"id", 9}};
    const std::string key = engine->set("details", params, json{{"beds", 4}}).key;
    engine->volatile_tier().del(key);

    const GetResult first = engine->get("details", params);
    ASSERT_TRUE(first.cached);
    EXPECT_EQ(first.source, CacheSource::Durable);
    engine->wait_for_promotions();
    EXPECT_EQ(engine->get("details", params).source, CacheSource::Volatile);
}

TEST(CacheEngine, FacadeForwardsWarmAndInvalidate) {
    ConfigManager cfg;
    ASSERT_TRUE(cfg.loadFromJson(json{{"warmer", {{"batch_delay_ms", 0}}}}));
    auto engine = CacheEngine::in_memory(cfg);

    std::vector<json> params{json{{"city", "austin"}}, json{{"city", "dallas"}}};
    const WarmReport r = engine->warm("discovery", params, [](const json& p) { return json{{"c", p["city"]}}; });
    EXPECT_EQ(r.warmed, 2u);

    InvalidationOptions o;
    o.syntax = PatternSyntax::Glob;
    EXPECT_EQ(engine->invalidate("discovery:*", o).durable_deleted, 2u);
    EXPECT_EQ(engine->durable_tier().count(), 0);
    EXPECT_EQ(engine->purge_expired(), 0u);
}

TEST(CacheEngine, GetOrFetchCachesUpstreamResult) {
    auto engine = CacheEngine::in_memory();
    int calls = 0;
    FetchFunction fetch = [&calls](const json&) { ++calls; return json{{"price", 410000}}; };
    const json params{{"zpid", "2077"}};

    EXPECT_EQ(engine->get_or_fetch("property_basic", params, fetch).source, CacheSource::Upstream);
    EXPECT_EQ(engine->get_or_fetch("property_basic", params, fetch).source, CacheSource::Volatile);
    EXPECT_EQ(calls, 1);
}

TEST(CacheEngine, FailedStartupIsRejected) {
    StartupResult bad;
    bad.error = "config missing";
    EXPECT_THROW(CacheEngine engine(bad), std::invalid_argument);

    const std::string dir = testsupport::make_temp_dir();
    StartupResult missing = Requirements::run(dir + "/nope.json");
    EXPECT_FALSE(missing.ok);
    EXPECT_FALSE(missing.error.empty());
    EXPECT_THROW(CacheEngine engine(missing), std::invalid_argument);
}

TEST(CacheEngine, StartsFromConfigFileAndPreloadsHotEntries) {
    const std::string dir = testsupport::make_temp_dir();
    const json params{{"zip", "78701"}};
    std::string key;

    {
        StartupResult startup = Requirements::run(write_config(dir, file_config(dir, false)));
        ASSERT_TRUE(startup.ok) << startup.error;
        CacheEngine engine(startup);
        EXPECT_EQ(engine.config().key_prefix(), "pc");
        key = engine.set("address", params, json{{"lat", 30.27}}).key;
        EXPECT_EQ(key.rfind("pc:address:", 0), 0u);
    }

    StartupResult startup = Requirements::run(write_config(dir, file_config(dir, true)));
    ASSERT_TRUE(startup.ok) << startup.error;
    EXPECT_TRUE(startup.db);   // owned by startup until the engine takes it
    CacheEngine engine(startup);
    EXPECT_FALSE(startup.db);
    EXPECT_TRUE(engine.volatile_tier().contains(key));

    const GetResult g = engine.get("address", params);
    ASSERT_TRUE(g.cached);
    EXPECT_EQ(g.source, CacheSource::Volatile);
    EXPECT_EQ((*g.data)["lat"], 30.27);
}
