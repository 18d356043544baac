#include "KeyNormalizer.hpp"

#include <cctype>
#include <cmath>
#include <random>
#include <set>
#include <gtest/gtest.h>

using nlohmann::json;

TEST(KeyNormalizer, CaseAndKeyOrderDoNotChangeTheKey) {
    KeyNormalizer kn;
    const auto a = kn.generate_key("discovery", json{{"city", "Houston"}, {"maxPrice", 300000}});
    const auto b = kn.generate_key("discovery", json{{"maxPrice", 300000}, {"city", "HOUSTON"}});
    EXPECT_EQ(a.key, b.key);
    EXPECT_EQ(a.hash, b.hash);
    EXPECT_EQ(a.normalized_params, b.normalized_params);
    EXPECT_EQ(a.normalized_params, (json{{"city", "houston"}, {"maxPrice", 300000}}));
}

TEST(KeyNormalizer, KeyLayoutIsTypeColonHash) {
    KeyNormalizer kn;
    const auto g = kn.generate_key("details", json{{"id", 42}});
    ASSERT_EQ(g.hash.size(), 8u);
    EXPECT_EQ(g.key, "details:" + g.hash);
    for (char c : g.hash) EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c))) << g.hash;
    EXPECT_EQ(g.hash, KeyNormalizer::sha256_hex(g.normalized_params.dump()).substr(0, 8));
}

TEST(KeyNormalizer, WhitespaceAndEmptyValuesAreNormalizedAway) {
    KeyNormalizer kn;
    const auto a = kn.generate_key("discovery", json{{"city", "  Austin "}, {"zip", ""}, {"beds", nullptr}});
    const auto b = kn.generate_key("discovery", json{{"city", "austin"}});
    EXPECT_EQ(a.key, b.key);
    EXPECT_EQ(a.normalized_params, (json{{"city", "austin"}}));
}

TEST(KeyNormalizer, ArraysAreSortedAndNestedObjectsNormalized) {
    KeyNormalizer kn;
    const auto a = kn.generate_key("discovery",
        json{{"types", {"Condo", "house", nullptr}}, {"filter", {{"b", 2}, {"a", " X "}}}});
    const auto b = kn.generate_key("discovery",
        json{{"filter", {{"a", "x"}, {"b", 2}}}, {"types", {"HOUSE", "condo"}}});
    EXPECT_EQ(a.key, b.key);
    EXPECT_EQ(a.normalized_params["types"], (json{"condo", "house"}));
}

TEST(KeyNormalizer, IntegralFloatsMatchIntegers) {
    KeyNormalizer kn;
    EXPECT_EQ(kn.generate_key("discovery", json{{"maxPrice", 300000.0}}).key,
              kn.generate_key("discovery", json{{"maxPrice", 300000}}).key);
    EXPECT_NE(kn.generate_key("discovery", json{{"maxPrice", 300000.5}}).key,
              kn.generate_key("discovery", json{{"maxPrice", 300000}}).key);
}

TEST(KeyNormalizer, DifferentValuesGiveDifferentKeys) {
    KeyNormalizer kn;
    EXPECT_NE(kn.generate_key("discovery", json{{"city", "houston"}}).key,
              kn.generate_key("discovery", json{{"city", "dallas"}}).key);
    EXPECT_NE(kn.generate_key("discovery", json{{"city", "houston"}}).key,
              kn.generate_key("details", json{{"city", "houston"}}).key);
    EXPECT_NE(kn.generate_key("discovery", json{{"active", true}}).key,
              kn.generate_key("discovery", json{{"active", false}}).key);
}

TEST(KeyNormalizer, NullParamsActLikeEmptyObject) {
    KeyNormalizer kn;
    EXPECT_EQ(kn.generate_key("rate_limits", nullptr).key,
              kn.generate_key("rate_limits", json::object()).key);
}

TEST(KeyNormalizer, PrefixUserAndHourSegments) {
    KeyNormalizer kn;
    KeyOptions o;
    o.prefix = "pc";
    o.user_specific = true;
    o.user_id = "u17";
    o.include_timestamp = true;
    o.now_ms = 5LL * 3600LL * 1000LL + 1234;

    const auto g = kn.generate_key("user_preferences", json{{"view", "map"}}, o);
    EXPECT_EQ(g.key, "pc:user_preferences:" + g.hash + ":user:u17:t:5");
    EXPECT_EQ(g.parts.str(), g.key);
    ASSERT_TRUE(g.parts.hour_bucket.has_value());
    EXPECT_EQ(*g.parts.hour_bucket, 5);
}

TEST(KeyNormalizer, UserSegmentNeedsAnId) {
    KeyNormalizer kn;
    KeyOptions o;
    o.user_specific = true;
    const auto g = kn.generate_key("user_preferences", json{{"view", "map"}}, o);
    EXPECT_EQ(g.key.find(":user:"), std::string::npos);
}

TEST(KeyNormalizer, PrefixAndUserIdCannotContainSeparators) {
    KeyNormalizer kn;
    const json params{{"view", "map"}};
    KeyOptions o;
    o.user_specific = true;
    o.user_id = "a:t:5";
    EXPECT_THROW(kn.generate_key("user_preferences", params, o), NormalizationError);
    o.user_id = "a b";
    EXPECT_THROW(kn.generate_key("user_preferences", params, o), NormalizationError);

    KeyOptions p;
    p.prefix = "pc:v1";
    EXPECT_THROW(kn.generate_key("user_preferences", params, p), NormalizationError);
    p.prefix = " pc";
    EXPECT_THROW(kn.generate_key("user_preferences", params, p), NormalizationError);
}

TEST(KeyNormalizer, HourBucketFloors) {
    EXPECT_EQ(KeyNormalizer::hour_bucket(0), 0);
    EXPECT_EQ(KeyNormalizer::hour_bucket(3599999), 0);
    EXPECT_EQ(KeyNormalizer::hour_bucket(3600000), 1);
    EXPECT_EQ(KeyNormalizer::hour_bucket(-1), -1);
}

TEST(KeyNormalizer, HashWidthIsConfigurableAndClamped) {
    EXPECT_EQ(KeyNormalizer(16).generate_key("details", json{{"id", 1}}).hash.size(), 16u);
    EXPECT_EQ(KeyNormalizer(1).hash_width(), 4u);
    EXPECT_EQ(KeyNormalizer(500).hash_width(), 64u);
}

TEST(KeyNormalizer, RejectsMalformedInput) {
    KeyNormalizer kn;
    EXPECT_THROW(kn.generate_key("", json::object()), NormalizationError);
    EXPECT_THROW(kn.generate_key("dis:covery", json::object()), NormalizationError);
    EXPECT_THROW(kn.generate_key("dis covery", json::object()), NormalizationError);
    EXPECT_THROW(kn.generate_key("discovery", json::array({1, 2})), NormalizationError);
    EXPECT_THROW(kn.generate_key("discovery", json("houston")), NormalizationError);
    EXPECT_THROW(kn.generate_key("discovery", json{{"x", std::nan("")}}), NormalizationError);
    EXPECT_THROW(kn.generate_key("discovery", json{{"x", INFINITY}}), NormalizationError);
}

TEST(KeyNormalizer, RejectsExcessiveNesting) {
    KeyNormalizer kn;
    json deep = 1;
    for (int i = 0; i < 40; ++i) deep = json{{"n", deep}};
    EXPECT_THROW(kn.generate_key("discovery", deep), NormalizationError);

    json ok = 1;
    for (int i = 0; i < 10; ++i) ok = json{{"n", ok}};
    EXPECT_NO_THROW(kn.generate_key("discovery", ok));
}

TEST(KeyNormalizer, NoCollisionsOverRandomizedSample) {
    KeyNormalizer kn(16);
    std::mt19937 rng(1234567u);
    std::uniform_int_distribution<int> price(50000, 2000000);
    const char* cities[] = {"houston", "dallas", "austin", "el paso", "waco"};

    std::set<std::string> keys;
    const int n = 20000;
    for (int i = 0; i < n; ++i) {
        json p = {{"id", i}, {"city", cities[i % 5]}, {"maxPrice", price(rng)}};
        keys.insert(kn.generate_key("discovery", p).key);
    }
    EXPECT_EQ(keys.size(), static_cast<size_t>(n));
}

TEST(KeyNormalizer, DefaultWidthSmallSampleHasNoCollisions) {
    KeyNormalizer kn;
    std::set<std::string> keys;
    for (int i = 0; i < 1000; ++i) {
        keys.insert(kn.generate_key("address", json{{"line1", std::to_string(i) + " main st"}}).key);
    }
    EXPECT_EQ(keys.size(), 1000u);
}
