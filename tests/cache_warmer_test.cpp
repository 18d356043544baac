#include "CacheWarmer.hpp"
#include "SqliteDurableTier.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>

using nlohmann::json;

namespace {

class CacheWarmerTest : public ::testing::Test {
protected:
    void SetUp() override { queue.start(2); }
    void TearDown() override { queue.stop_and_join(); }

    static std::vector<json> cities(int n) {
        std::vector<json> out;
        for (int i = 0; i < n; ++i) out.push_back(json{{"city", "city-" + std::to_string(i)}});
        return out;
    }

    WarmOptions fast() const {
        WarmOptions o;
        o.batch_size = 5;
        o.batch_delay = std::chrono::milliseconds(20);
        return o;
    }

    SqliteHandle db = testsupport::open_memory_db();
    MemoryVolatileTier vol;
    SqliteDurableTier dur{db.get()};
    TTLPolicy policy = TTLPolicy::defaults();
    StatsCollector stats;
    KeyNormalizer kn;
    PromotionQueue queue;
    TierManager tm{vol, dur, policy, stats, kn, TierManagerOptions{}, &queue};
    CacheWarmer warmer{tm};
};

} // namespace

TEST_F(CacheWarmerTest, FetchesOnlyWhatIsMissing) {
    const auto params = cities(10);
    for (int i = 0; i < 6; ++i) tm.set("discovery", params[i], json{{"cached", i}});

    std::atomic<int> fetches{0};
    FetchFunction fetch = [&fetches](const json& p) {
        fetches++;
        return json{{"fresh", p["city"]}};
    };

    const WarmReport r = warmer.warm("discovery", params, fetch, fast());
    EXPECT_EQ(fetches.load(), 4);
    EXPECT_EQ(r.total, 10u);
    EXPECT_EQ(r.warmed, 4u);
    EXPECT_EQ(r.already_cached, 6u);
    EXPECT_EQ(r.errors, 0u);
    ASSERT_EQ(r.items.size(), 10u);
    EXPECT_EQ(r.items[0].status, WarmStatus::AlreadyCached);
    EXPECT_EQ(r.items[9].status, WarmStatus::Warmed);

    const GetResult g = tm.get("discovery", params[8]);
    ASSERT_TRUE(g.cached);
    EXPECT_EQ((*g.data)["fresh"], "city-8");

    DurableRecord rec;
    ASSERT_EQ(dur.peek(g.key, rec), TierStatus::Hit);
    EXPECT_EQ(rec.metadata["warmed"], true);
}

TEST_F(CacheWarmerTest, FailingItemsDoNotAbortTheBatch) {
    FetchFunction fetch = [](const json& p) -> json {
        if (p["city"] == "city-2") throw UpstreamFetchError("rate limited");
        return json{{"ok", true}};
    };
    const WarmReport r = warmer.warm("discovery", cities(5), fetch, fast());
    EXPECT_EQ(r.warmed, 4u);
    EXPECT_EQ(r.errors, 1u);
    EXPECT_EQ(r.items[2].status, WarmStatus::Error);
    EXPECT_NE(r.items[2].error.find("rate limited"), std::string::npos);
}

TEST_F(CacheWarmerTest, MalformedParamsAreReportedAsErrors) {
    std::vector<json> params = cities(2);
    params.push_back(json::array({1, 2}));
    const WarmReport r = warmer.warm("discovery", params, [](const json&) { return json(1); }, fast());
    EXPECT_EQ(r.warmed, 2u);
    EXPECT_EQ(r.errors, 1u);
}

TEST_F(CacheWarmerTest, MissingFetchFunctionIsReported) {
    const WarmReport r = warmer.warm("discovery", cities(3), FetchFunction{}, fast());
    EXPECT_EQ(r.no_fetch, 3u);
    EXPECT_EQ(r.warmed, 0u);
    EXPECT_EQ(r.to_json()["items"][0]["status"], "no_fetch_function");
}

TEST_F(CacheWarmerTest, BatchesAreSeparatedByDelay) {
    WarmOptions o = fast();
    o.batch_size = 2;
    o.batch_delay = std::chrono::milliseconds(100);
    const auto t0 = std::chrono::steady_clock::now();
    const WarmReport r = warmer.warm("discovery", cities(6), [](const json&) { return json(1); }, o);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    EXPECT_EQ(r.warmed, 6u);
    EXPECT_GE(ms, 200);   // two gaps between three batches
}

TEST_F(CacheWarmerTest, ConcurrencyIsBounded) {
    WarmOptions o = fast();
    o.batch_size = 8;
    o.max_concurrency = 2;
    std::atomic<int> inside{0}, peak{0};
    FetchFunction fetch = [&](const json&) {
        const int now = ++inside;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
        testsupport::sleep_ms(30);
        --inside;
        return json(1);
    };
    const WarmReport r = warmer.warm("discovery", cities(8), fetch, o);
    EXPECT_EQ(r.warmed, 8u);
    EXPECT_LE(peak.load(), 2);
}

TEST_F(CacheWarmerTest, PreloadCopiesHotDurableRecords) {
    const auto params = cities(3);
    std::vector<std::string> keys;
    for (const auto& p : params) keys.push_back(tm.set("address", p, json{{"v", p["city"]}}).key);
    for (const auto& k : keys) vol.del(k);

    EXPECT_EQ(warmer.preload_hot(2), 2u);
    size_t present = 0;
    for (const auto& k : keys) present += vol.contains(k) ? 1 : 0;
    EXPECT_EQ(present, 2u);
    EXPECT_EQ(warmer.preload_hot(0), 0u);
}

TEST_F(CacheWarmerTest, NonStandardThrowIsAnItemError) {
    FetchFunction fetch = [](const json& p) -> json {
        if (p["city"] == "city-1") throw 7;
        return json(1);
    };
    const WarmReport r = warmer.warm("discovery", cities(3), fetch, fast());
    EXPECT_EQ(r.warmed, 2u);
    EXPECT_EQ(r.errors, 1u);
    EXPECT_EQ(r.items[1].status, WarmStatus::Error);
    EXPECT_EQ(r.items[1].error, "unknown error");
}
