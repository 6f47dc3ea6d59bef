#ifndef LATTICE_TESTING
#define LATTICE_TESTING
#endif
#include <gtest/gtest.h>
#include "ClusterDetector.h"
#include "EventSystem.h"
#include "LatticeTestHooks.h"

using Hooks = LatticeTestHooks;

TEST(Clusters, ChainOfThreeFormsOneCluster) {
    // 0-1 and 1-2 are linked, 0-2 is too far apart but joins through 1
    std::vector<LatticeEntity> entities{
        Hooks::make_entity(1, 0.0, 0.0),
        Hooks::make_entity(2, 50.0, 0.0),
        Hooks::make_entity(3, 100.0, 0.0),
    };
    ClusterDetector detector;
    const auto clusters = detector.detect(entities);

    ASSERT_EQ(clusters.size(), 1u);
    EXPECT_EQ(clusters[0].id, 0);
    EXPECT_EQ(clusters[0].members.size(), 3u);
    EXPECT_NEAR(clusters[0].centroid.x(), 50.0, 1e-12);
    EXPECT_NEAR(clusters[0].centroid.y(), 0.0, 1e-12);
    for (const auto& e : entities) EXPECT_EQ(e.cluster_id, 0);
}

TEST(Clusters, PairsAreNotMaterialised) {
    std::vector<LatticeEntity> entities{
        Hooks::make_entity(1, 0.0, 0.0),
        Hooks::make_entity(2, 20.0, 0.0),
        Hooks::make_entity(3, 400.0, 400.0),
    };
    entities[2].cluster_id = 9;   // stale id from a previous frame
    ClusterDetector detector;
    EXPECT_TRUE(detector.detect(entities).empty());
    for (const auto& e : entities) EXPECT_EQ(e.cluster_id, -1);
}

TEST(Clusters, LinkThresholds) {
    ClusterDetector detector;
    const auto a = Hooks::make_entity(1, 0.0, 0.0, 0.0, 40.0);

    EXPECT_TRUE(detector.linked(a, Hooks::make_entity(2, 79.9, 0.0)));
    EXPECT_FALSE(detector.linked(a, Hooks::make_entity(2, 80.0, 0.0)));

    // |sin(1.0)| ~ 0.84 is out of phase; |sin(0.4)| ~ 0.39 is in phase
    EXPECT_FALSE(detector.linked(a, Hooks::make_entity(2, 10.0, 0.0, 1.0)));
    EXPECT_TRUE(detector.linked(a, Hooks::make_entity(2, 10.0, 0.0, 0.4)));
    // Anti-phase has |sin| ~ 0 and still links
    EXPECT_TRUE(detector.linked(a, Hooks::make_entity(2, 10.0, 0.0, TWO_PI / 2.0)));

    EXPECT_FALSE(detector.linked(a, Hooks::make_entity(2, 10.0, 0.0, 0.0, 25.0)));
    EXPECT_TRUE(detector.linked(a, Hooks::make_entity(2, 10.0, 0.0, 0.0, 30.0)));
}

TEST(Clusters, ZeroFrequencyDoesNotDivideByZero) {
    ClusterDetector detector;
    const auto a = Hooks::make_entity(1, 0.0, 0.0, 0.0, 0.0);
    const auto b = Hooks::make_entity(2, 1.0, 0.0, 0.0, 0.0);
    EXPECT_FALSE(detector.linked(a, b));
}

TEST(Clusters, IdsFollowDiscoveryOrder) {
    std::vector<LatticeEntity> entities;
    // Far group first in collection order
    for (int i = 0; i < 3; ++i) entities.push_back(Hooks::make_entity(10 + i, 300.0 + i * 10.0, 300.0));
    for (int i = 0; i < 4; ++i) entities.push_back(Hooks::make_entity(20 + i, -300.0, -300.0 + i * 10.0));

    ClusterDetector detector;
    const auto clusters = detector.detect(entities);
    ASSERT_EQ(clusters.size(), 2u);
    EXPECT_EQ(clusters[0].members.size(), 3u);
    EXPECT_EQ(clusters[1].members.size(), 4u);
    EXPECT_EQ(entities[0].cluster_id, 0);
    EXPECT_EQ(entities[6].cluster_id, 1);
}

TEST(Clusters, CustomConfigRaisesMinimumSize) {
    ClusterDetector::Config cfg;
    cfg.min_cluster_size = 4;
    ClusterDetector detector(cfg);
    std::vector<LatticeEntity> entities{
        Hooks::make_entity(1, 0.0, 0.0),
        Hooks::make_entity(2, 10.0, 0.0),
        Hooks::make_entity(3, 20.0, 0.0),
    };
    EXPECT_TRUE(detector.detect(entities).empty());
}

TEST(Clusters, EmptyInput) {
    std::vector<LatticeEntity> entities;
    ClusterDetector detector;
    EXPECT_TRUE(detector.detect(entities).empty());
}

TEST(Clusters, DetectionIsIdempotentWithoutAdvance) {
    EventBus bus;
    auto engine = Hooks::make_engine(bus, 31337);
    engine->initialize(300, 3);
    for (int i = 0; i < 3; ++i) engine->step(0.016);

    const auto first = Hooks::partition(*engine);
    Hooks::run_cluster_detection(*engine);
    const auto second = Hooks::partition(*engine);
    EXPECT_EQ(first, second);

    // Every entity sits in at most one cluster
    std::vector<EntityId> seen;
    for (const auto& members : second) seen.insert(seen.end(), members.begin(), members.end());
    std::sort(seen.begin(), seen.end());
    EXPECT_EQ(std::adjacent_find(seen.begin(), seen.end()), seen.end());
}

TEST(Clusters, PartitionIndependentOfCollectionOrder) {
    EventBus bus;
    auto engine = Hooks::make_engine(bus, 4242);
    engine->initialize(250, 2);
    engine->step(0.016);
    Hooks::run_cluster_detection(*engine);
    const auto forward = Hooks::partition(*engine);

    auto& arena = Hooks::entities(*engine);
    std::reverse(arena.begin(), arena.end());
    Hooks::run_cluster_detection(*engine);
    EXPECT_EQ(Hooks::partition(*engine), forward);
}
