#include <gtest/gtest.h>
#include "tiercache/cache/weak_reference_manager.h"
#include "tiercache/core/error.h"
#include <string>
#include <vector>

namespace tiercache {
namespace cache {
namespace test {

class WeakReferenceManagerTest : public ::testing::Test {
protected:
    static core::Value make_object(int id) {
        return core::Value(core::ValueObject{{"id", core::Value(id)}});
    }
};

TEST_F(WeakReferenceManagerTest, GetWhileTargetAlive) {
    WeakReferenceManager manager;
    core::Value target = make_object(1);
    manager.create_ref("k", target);

    auto found = manager.get_ref("k");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, target);
    EXPECT_FALSE(manager.get_ref("other").has_value());
}

TEST_F(WeakReferenceManagerTest, CollectedTargetReadsAsAbsent) {
    WeakReferenceManager manager;
    {
        core::Value target = make_object(1);
        manager.create_ref("k", target);
    }
    EXPECT_EQ(manager.size(), 1u);

    EXPECT_FALSE(manager.get_ref("k").has_value());
    EXPECT_EQ(manager.size(), 0u);
}

TEST_F(WeakReferenceManagerTest, ManagerDoesNotKeepTargetsAlive) {
    WeakReferenceManager manager;
    core::Value target = make_object(1);
    manager.create_ref("k", target);
    EXPECT_EQ(target.use_count(), 1);
}

TEST_F(WeakReferenceManagerTest, ReplacesExistingRef) {
    WeakReferenceManager manager;
    core::Value first = make_object(1);
    core::Value second = make_object(2);
    manager.create_ref("k", first);
    manager.create_ref("k", second);

    EXPECT_EQ(manager.size(), 1u);
    EXPECT_EQ(*manager.get_ref("k"), second);
}

TEST_F(WeakReferenceManagerTest, RejectsPrimitiveTargets) {
    WeakReferenceManager manager;
    EXPECT_THROW(manager.create_ref("k", core::Value(1)), core::InvalidArgumentError);
    EXPECT_THROW(manager.create_ref("k", core::Value("s")), core::InvalidArgumentError);
    EXPECT_EQ(manager.size(), 0u);
}

TEST_F(WeakReferenceManagerTest, RemoveRef) {
    WeakReferenceManager manager;
    core::Value target = make_object(1);
    manager.create_ref("k", target);

    EXPECT_TRUE(manager.remove_ref("k"));
    EXPECT_FALSE(manager.remove_ref("k"));
    EXPECT_FALSE(manager.get_ref("k").has_value());
}

TEST_F(WeakReferenceManagerTest, StatsCountLiveRefsAndMetadataSize) {
    WeakReferenceManager manager;
    core::Value live = make_object(1);
    manager.create_ref("live", live, WeakRefMetadata{100, "object"});
    manager.create_ref("no-meta", live);
    {
        core::Value dead = make_object(2);
        manager.create_ref("dead", dead, WeakRefMetadata{50, "object"});
    }

    auto stats = manager.get_stats();
    EXPECT_EQ(stats.count, 2u);
    EXPECT_EQ(stats.total_size, 100u);
}

TEST_F(WeakReferenceManagerTest, SweepDropsDeadRefs) {
    WeakReferenceManager manager;
    core::Value live = make_object(1);
    manager.create_ref("live", live);
    {
        core::Value dead = make_object(2);
        manager.create_ref("dead1", dead);
        manager.create_ref("dead2", dead);
    }

    EXPECT_EQ(manager.sweep(), 2u);
    EXPECT_EQ(manager.size(), 1u);
    EXPECT_EQ(manager.sweep(), 0u);
}

TEST_F(WeakReferenceManagerTest, CreateSweepsAboveThreshold) {
    WeakRefConfig config;
    config.sweep_threshold = 3;
    WeakReferenceManager manager(config);
    {
        std::vector<core::Value> temporaries;
        for (int i = 0; i < 4; ++i) {
            temporaries.push_back(make_object(i));
            manager.create_ref("tmp" + std::to_string(i), temporaries.back());
        }
    }
    EXPECT_EQ(manager.size(), 4u);

    core::Value kept = make_object(99);
    manager.create_ref("kept", kept);
    EXPECT_EQ(manager.size(), 1u);
}

TEST_F(WeakReferenceManagerTest, MaxRefsDropsOldest) {
    WeakRefConfig config;
    config.max_refs = 3;
    WeakReferenceManager manager(config);

    std::vector<core::Value> targets;
    for (int i = 0; i < 4; ++i) {
        targets.push_back(make_object(i));
    }
    for (int i = 0; i < 4; ++i) {
        manager.create_ref("k" + std::to_string(i), targets[i]);
    }

    EXPECT_EQ(manager.size(), 3u);
    EXPECT_FALSE(manager.get_ref("k0").has_value());
    EXPECT_TRUE(manager.get_ref("k1").has_value());
    EXPECT_TRUE(manager.get_ref("k3").has_value());
}

TEST_F(WeakReferenceManagerTest, FullTableSweepsDeadBeforeDroppingLive) {
    WeakRefConfig config;
    config.max_refs = 2;
    WeakReferenceManager manager(config);

    core::Value live = make_object(1);
    core::Value fresh = make_object(3);
    manager.create_ref("live", live);
    {
        core::Value dead = make_object(2);
        manager.create_ref("dead", dead);
    }
    manager.create_ref("fresh", fresh);

    EXPECT_EQ(manager.size(), 2u);
    EXPECT_TRUE(manager.get_ref("live").has_value());
    EXPECT_TRUE(manager.get_ref("fresh").has_value());
    EXPECT_FALSE(manager.get_ref("dead").has_value());
}

TEST_F(WeakReferenceManagerTest, Clear) {
    WeakReferenceManager manager;
    core::Value target = make_object(1);
    manager.create_ref("a", target);
    manager.create_ref("b", target);

    manager.clear();
    EXPECT_EQ(manager.size(), 0u);
    EXPECT_EQ(manager.get_stats().count, 0u);
}

TEST_F(WeakReferenceManagerTest, RejectsZeroMaxRefs) {
    WeakRefConfig config;
    config.max_refs = 0;
    EXPECT_THROW(WeakReferenceManager{config}, core::ConfigurationError);
}

} // namespace test
} // namespace cache
} // namespace tiercache
