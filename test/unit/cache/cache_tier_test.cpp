#include <gtest/gtest.h>
#include "tiercache/cache/cache_tier.h"
#include "tiercache/core/error.h"
#include <chrono>

namespace tiercache {
namespace cache {
namespace test {

using namespace std::chrono_literals;

class CacheTierTest : public ::testing::Test {
protected:
    core::TimePoint t0_ = core::TimePoint{} + 1h;

    CacheItem make_item(const std::string& key, size_t size = 8, uint64_t access_count = 1) {
        CacheItem item;
        item.key = key;
        item.value = core::Value(1.0);
        item.size = size;
        item.access_count = access_count;
        item.create_time = t0_;
        item.last_access_time = t0_;
        return item;
    }
};

TEST_F(CacheTierTest, InsertFindTake) {
    CacheTier tier("L1", 3);
    tier.insert(make_item("a"));

    ASSERT_NE(tier.find("a"), nullptr);
    EXPECT_EQ(tier.find("a")->key, "a");
    EXPECT_EQ(tier.find("b"), nullptr);
    EXPECT_TRUE(tier.contains("a"));

    auto taken = tier.take("a");
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(taken->key, "a");
    EXPECT_TRUE(tier.empty());
    EXPECT_FALSE(tier.take("a").has_value());
}

TEST_F(CacheTierTest, CapacityIsEnforced) {
    CacheTier tier("L1", 2);
    tier.insert(make_item("a"));
    tier.insert(make_item("b"));

    EXPECT_TRUE(tier.is_full());
    EXPECT_THROW(tier.insert(make_item("c")), core::InvalidArgumentError);
    EXPECT_EQ(tier.size(), 2u);
}

TEST_F(CacheTierTest, DuplicateKeyIsRejected) {
    CacheTier tier("L2", 4);
    tier.insert(make_item("a"));
    EXPECT_THROW(tier.insert(make_item("a")), core::InvalidArgumentError);
}

TEST_F(CacheTierTest, ZeroCapacityIsRejected) {
    EXPECT_THROW(CacheTier("L3", 0), core::InvalidArgumentError);
}

TEST_F(CacheTierTest, KeysKeepInsertionOrder) {
    CacheTier tier("L3", 5);
    tier.insert(make_item("c"));
    tier.insert(make_item("a"));
    tier.insert(make_item("b"));
    tier.erase("a");
    tier.insert(make_item("a"));

    EXPECT_EQ(tier.keys(), (std::vector<std::string>{"c", "b", "a"}));
}

TEST_F(CacheTierTest, EvictionPrefersLowFrequency) {
    CacheTier tier("L1", 3);
    tier.insert(make_item("busy", 8, 10));
    tier.insert(make_item("idle", 8, 1));

    auto victim = tier.find_eviction_candidate(t0_ + 1000ms, 1000000.0);
    ASSERT_TRUE(victim.has_value());
    EXPECT_EQ(*victim, "idle");
}

TEST_F(CacheTierTest, EvictionPrefersLeastRecentlyUsed) {
    CacheTier tier("L1", 3);
    tier.insert(make_item("stale"));
    tier.insert(make_item("fresh"));
    tier.find("fresh")->last_access_time = t0_ + 5000ms;

    auto victim = tier.find_eviction_candidate(t0_ + 5000ms, 1000000.0);
    ASSERT_TRUE(victim.has_value());
    EXPECT_EQ(*victim, "stale");
}

TEST_F(CacheTierTest, EvictionTieGoesToOldestInsertion) {
    CacheTier tier("L1", 3);
    tier.insert(make_item("first"));
    tier.insert(make_item("second"));
    tier.insert(make_item("third"));

    auto victim = tier.find_eviction_candidate(t0_, 1000000.0);
    ASSERT_TRUE(victim.has_value());
    EXPECT_EQ(*victim, "first");
}

TEST_F(CacheTierTest, EvictionCandidateOfEmptyTier) {
    CacheTier tier("L1", 3);
    EXPECT_FALSE(tier.find_eviction_candidate(t0_, 1000000.0).has_value());
}

TEST_F(CacheTierTest, EvictionScoreFormula) {
    CacheItem item = make_item("k", 8, 4);
    // age 2000ms, idle 500ms
    item.last_access_time = t0_ + 1500ms;
    EXPECT_DOUBLE_EQ(eviction_score(item, t0_ + 2000ms, 1000000.0), 4.0 / 2000.0 * 1000000.0 - 500.0);

    // age below 1ms is clamped to 1
    CacheItem young = make_item("y", 8, 1);
    EXPECT_DOUBLE_EQ(eviction_score(young, t0_, 1000000.0), 1000000.0);
}

TEST_F(CacheTierTest, ExpiredIdleAndTaggedKeys) {
    CacheTier tier("L2", 5);
    CacheItem short_lived = make_item("short");
    short_lived.ttl = 10ms;
    CacheItem tagged = make_item("tagged");
    tagged.tags = {"route"};
    tagged.last_access_time = t0_ + 40000ms;
    tier.insert(short_lived);
    tier.insert(tagged);
    tier.insert(make_item("plain"));

    EXPECT_EQ(tier.expired_keys(t0_ + 10ms), std::vector<std::string>{});
    EXPECT_EQ(tier.expired_keys(t0_ + 11ms), std::vector<std::string>{"short"});
    EXPECT_EQ(tier.idle_keys(t0_ + 45000ms, 30000ms), (std::vector<std::string>{"short", "plain"}));
    EXPECT_EQ(tier.tagged_keys("route"), std::vector<std::string>{"tagged"});
}

TEST_F(CacheTierTest, MemoryUsageSumsItemSizes) {
    CacheTier tier("L1", 5);
    tier.insert(make_item("a", 10));
    tier.insert(make_item("b", 32));
    EXPECT_EQ(tier.memory_usage(), 42u);

    tier.clear();
    EXPECT_EQ(tier.memory_usage(), 0u);
    EXPECT_EQ(tier.size(), 0u);
}

} // namespace test
} // namespace cache
} // namespace tiercache
