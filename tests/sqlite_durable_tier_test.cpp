#include "SqliteDurableTier.hpp"
#include "test_support.hpp"

#include <chrono>
#include <gtest/gtest.h>

using nlohmann::json;

namespace {

DurableWrite make_write(const std::string& key, const json& params, const json& payload,
                        uint64_t ttl = 3600, double cost = 0.05) {
    DurableWrite w;
    w.key = key;
    w.cache_class = key.substr(0, key.find(':'));
    w.normalized_params = params;
    w.payload = payload;
    w.ttl_seconds = ttl;
    w.unit_cost = cost;
    w.metadata = json{{"cache_class", w.cache_class}};
    return w;
}

class SqliteDurableTierTest : public ::testing::Test {
protected:
    SqliteHandle db = testsupport::open_memory_db();
    SqliteDurableTier tier{db.get()};
    const json params = json{{"city", "houston"}};
};

} // namespace

TEST_F(SqliteDurableTierTest, UpsertThenFind) {
    DurableRecord stored;
    std::string err;
    ASSERT_TRUE(tier.upsert(make_write("address:abcd1234", params, json{{"price", 250000}}), &stored, &err)) << err;
    EXPECT_EQ(stored.access_count, 1u);
    EXPECT_DOUBLE_EQ(stored.cost_saved, 0.0);

    DurableRecord rec;
    ASSERT_EQ(tier.find_by_params("address:abcd1234", params, rec, &err), TierStatus::Hit) << err;
    EXPECT_EQ(rec.payload, (json{{"price", 250000}}));
    EXPECT_EQ(rec.cache_class, "address");
    EXPECT_EQ(rec.access_count, 2u);
    EXPECT_NEAR(rec.cost_saved, 0.05, 1e-9);
    EXPECT_EQ(rec.metadata["cache_class"], "address");
}

TEST_F(SqliteDurableTierTest, AccessCountGrowsAndSurvivesOverwrite) {
    ASSERT_TRUE(tier.upsert(make_write("details:k1", params, json{{"v", 1}})));
    DurableRecord rec;
    for (int i = 0; i < 3; ++i) ASSERT_EQ(tier.find_by_params("details:k1", params, rec), TierStatus::Hit);
    EXPECT_EQ(rec.access_count, 4u);
    const int64_t created = rec.created_at_ms;

    DurableRecord after;
    ASSERT_TRUE(tier.upsert(make_write("details:k1", params, json{{"v", 2}}, 3600, 0.01), &after));
    EXPECT_EQ(after.access_count, 4u);
    EXPECT_EQ(after.created_at_ms, created);
    EXPECT_EQ(after.payload, (json{{"v", 2}}));
    EXPECT_NEAR(after.cost_saved, 0.03, 1e-9);
}

TEST_F(SqliteDurableTierTest, DifferentParamsUnderSameKeyIsAMiss) {
    ASSERT_TRUE(tier.upsert(make_write("discovery:ffff0000", params, json{{"v", 1}})));
    DurableRecord rec;
    EXPECT_EQ(tier.find_by_params("discovery:ffff0000", json{{"city", "dallas"}}, rec), TierStatus::Miss);
    // the stored row is untouched
    ASSERT_EQ(tier.peek("discovery:ffff0000", rec), TierStatus::Hit);
    EXPECT_EQ(rec.access_count, 1u);
}

TEST_F(SqliteDurableTierTest, ExpiredRowIsAMissAndRemoved) {
    ASSERT_TRUE(tier.upsert(make_write("discovery:e1", params, json{{"v", 1}}, 1)));
    testsupport::sleep_ms(1200);
    DurableRecord rec;
    EXPECT_EQ(tier.find_by_params("discovery:e1", params, rec), TierStatus::Miss);
    EXPECT_EQ(tier.count(), 0);
}

TEST_F(SqliteDurableTierTest, RewriteAfterExpiryStartsFresh) {
    ASSERT_TRUE(tier.upsert(make_write("address:r1", params, json{{"v", 1}}, 1)));
    DurableRecord rec;
    for (int i = 0; i < 3; ++i) ASSERT_EQ(tier.find_by_params("address:r1", params, rec), TierStatus::Hit);
    EXPECT_EQ(rec.access_count, 4u);
    testsupport::sleep_ms(1100);

    DurableRecord fresh;
    ASSERT_TRUE(tier.upsert(make_write("address:r1", params, json{{"v", 2}}), &fresh));
    EXPECT_EQ(fresh.access_count, 1u);
    EXPECT_DOUBLE_EQ(fresh.cost_saved, 0.0);
    EXPECT_GT(fresh.created_at_ms, rec.created_at_ms + 1000);
    EXPECT_EQ(fresh.payload, (json{{"v", 2}}));
}

TEST_F(SqliteDurableTierTest, CorruptedPayloadFaultsAndIsRemoved) {
    ASSERT_TRUE(tier.upsert(make_write("details:bad", params, json{{"v", 1}})));
    ASSERT_EQ(sqlite3_exec(db.get(),
              "UPDATE cache_entries SET payload_json='{not json' WHERE cache_key='details:bad';",
              nullptr, nullptr, nullptr), SQLITE_OK);

    DurableRecord rec;
    std::string err;
    EXPECT_EQ(tier.find_by_params("details:bad", params, rec, &err), TierStatus::Fault);
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(tier.count(), 0);
}

TEST_F(SqliteDurableTierTest, DeleteMatchingIsCaseInsensitiveRegex) {
    ASSERT_TRUE(tier.upsert(make_write("discovery:aaaa", params, 1)));
    ASSERT_TRUE(tier.upsert(make_write("discovery:bbbb", params, 2)));
    ASSERT_TRUE(tier.upsert(make_write("details:cccc", params, 3)));

    std::string err;
    auto n = tier.delete_matching("^DISCOVERY:", &err);
    ASSERT_TRUE(n.has_value()) << err;
    EXPECT_EQ(*n, 2u);
    EXPECT_EQ(tier.count(), 1);

    n = tier.delete_matching("^nothing-here", &err);
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(*n, 0u);
}

TEST_F(SqliteDurableTierTest, DeleteMatchingRejectsBadPattern) {
    std::string err;
    EXPECT_FALSE(tier.delete_matching("(unclosed", &err).has_value());
    EXPECT_FALSE(err.empty());
}

TEST_F(SqliteDurableTierTest, DeleteKeyAndPurgeExpired) {
    ASSERT_TRUE(tier.upsert(make_write("details:k1", params, 1)));
    ASSERT_TRUE(tier.upsert(make_write("details:k2", params, 2, 1)));
    ASSERT_TRUE(tier.upsert(make_write("details:k3", params, 3, 1)));

    EXPECT_TRUE(tier.delete_key("details:k1"));
    EXPECT_TRUE(tier.delete_key("details:missing"));
    testsupport::sleep_ms(1200);
    auto n = tier.purge_expired();
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(*n, 2u);
    EXPECT_EQ(tier.count(), 0);
}

TEST_F(SqliteDurableTierTest, TopAccessedOrdersByAccessCount) {
    ASSERT_TRUE(tier.upsert(make_write("details:cold", params, 1)));
    ASSERT_TRUE(tier.upsert(make_write("details:warm", params, 2)));
    ASSERT_TRUE(tier.upsert(make_write("details:hot", params, 3)));
    DurableRecord rec;
    for (int i = 0; i < 5; ++i) tier.find_by_params("details:hot", params, rec);
    for (int i = 0; i < 2; ++i) tier.find_by_params("details:warm", params, rec);

    const auto top = tier.top_accessed(2);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].key, "details:hot");
    EXPECT_EQ(top[1].key, "details:warm");
    EXPECT_TRUE(tier.top_accessed(0).empty());
}

TEST(SqliteDurableTierCapacity, EvictsLeastFrequentlyUsedRows) {
    SqliteHandle db = testsupport::open_memory_db();
    SqliteDurableTier::Options opts;
    opts.max_bytes = 96 * 1024;
    opts.evict_batch = 5;
    SqliteDurableTier tier(db.get(), opts);

    const json params = json{{"id", 1}};
    ASSERT_TRUE(tier.upsert(make_write("details:hot", params, json{{"blob", std::string(2000, 'h')}})));
    DurableRecord rec;
    for (int i = 0; i < 10; ++i) ASSERT_EQ(tier.find_by_params("details:hot", params, rec), TierStatus::Hit);

    const int rows = 120;
    for (int i = 0; i < rows; ++i) {
        ASSERT_TRUE(tier.upsert(make_write("details:r" + std::to_string(i), params,
                                           json{{"blob", std::string(2000, 'x')}})));
    }
    EXPECT_LT(tier.count(), rows + 1);
    EXPECT_EQ(tier.peek("details:hot", rec), TierStatus::Hit);
}

TEST(SqliteDurableTierTimeout, BusyDatabaseFaultsWithinTimeout) {
    const std::string dir = testsupport::make_temp_dir();
    const std::string path = dir + "/busy.sqlite";

    std::string err;
    SqliteHandle db = Requirements::openCacheDb(path, 5000, &err);
    ASSERT_TRUE(db) << err;
    // rollback journal so an exclusive lock also blocks readers
    ASSERT_EQ(sqlite3_exec(db.get(), "PRAGMA journal_mode=DELETE;", nullptr, nullptr, nullptr), SQLITE_OK);

    SqliteDurableTier::Options opts;
    opts.timeout_ms = 200;
    SqliteDurableTier tier(db.get(), opts);
    const json params = json{{"id", 7}};
    ASSERT_TRUE(tier.upsert(make_write("details:k", params, 1)));

    sqlite3* other = nullptr;
    ASSERT_EQ(sqlite3_open_v2(path.c_str(), &other, SQLITE_OPEN_READWRITE, nullptr), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(other, "BEGIN EXCLUSIVE;", nullptr, nullptr, nullptr), SQLITE_OK);

    const auto t0 = std::chrono::steady_clock::now();
    DurableRecord rec;
    EXPECT_EQ(tier.find_by_params("details:k", params, rec, &err), TierStatus::Fault);
    EXPECT_NE(err.find("timeout"), std::string::npos) << err;
    EXPECT_FALSE(tier.upsert(make_write("details:k2", params, 2), nullptr, &err));
    const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    EXPECT_LT(waited, 2000);

    sqlite3_exec(other, "ROLLBACK;", nullptr, nullptr, nullptr);
    sqlite3_close(other);

    EXPECT_EQ(tier.find_by_params("details:k", params, rec, &err), TierStatus::Hit) << err;
}
