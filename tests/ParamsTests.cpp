#include <gtest/gtest.h>
#include "LatticeParams.h"
#include "FrameClock.h"
#include <cmath>
#include <limits>
#include <thread>

TEST(Params, DefaultsMatchNominalPhysics) {
    PhysicsParams p;
    EXPECT_DOUBLE_EQ(p.gravity, 1.0);
    EXPECT_DOUBLE_EQ(p.friction, 0.99);
    EXPECT_DOUBLE_EQ(p.elasticity, 0.8);
    EXPECT_DOUBLE_EQ(p.time_dilation, 1.0);
    EXPECT_DOUBLE_EQ(p.field_strength, 1.0);
}

TEST(Params, MergeAppliesOnlyKnownKeys) {
    PhysicsParams p;
    const auto result = p.merge({{"elasticity", 0.3}, {"field_strength", 2.5}, {"viscosity", 4.0}});
    EXPECT_EQ(result.applied, 2u);
    EXPECT_EQ(result.ignored, 1u);
    ASSERT_EQ(result.ignored_keys.size(), 1u);
    EXPECT_EQ(result.ignored_keys[0], "viscosity");
    EXPECT_DOUBLE_EQ(p.elasticity, 0.3);
    EXPECT_DOUBLE_EQ(p.field_strength, 2.5);
    EXPECT_DOUBLE_EQ(p.gravity, 1.0);

    const auto empty = p.merge({});
    EXPECT_EQ(empty.applied, 0u);
    EXPECT_EQ(empty.ignored, 0u);
}

TEST(Params, MergeRejectsNonFiniteValues) {
    PhysicsParams p;
    const auto result = p.merge({{"friction", std::numeric_limits<double>::quiet_NaN()},
                                 {"field_strength", std::numeric_limits<double>::infinity()}});
    EXPECT_EQ(result.applied, 0u);
    EXPECT_EQ(result.ignored, 2u);
    EXPECT_EQ(result.ignored_keys.size(), 2u);
    EXPECT_DOUBLE_EQ(p.friction, 0.99);
    EXPECT_DOUBLE_EQ(p.field_strength, 1.0);
}

TEST(Params, MergeClampsIntoFieldRanges) {
    PhysicsParams p;
    EXPECT_EQ(p.merge({{"friction", 1.5}, {"elasticity", -1.0}, {"time_dilation", -2.0},
                       {"field_strength", -0.5}, {"gravity", -4.0}}).applied, 5u);
    EXPECT_DOUBLE_EQ(p.friction, 1.0);
    EXPECT_DOUBLE_EQ(p.elasticity, 0.0);
    EXPECT_DOUBLE_EQ(p.time_dilation, 0.0);
    EXPECT_DOUBLE_EQ(p.field_strength, 0.0);
    // Negative gravity is legal; it only disables centre attraction
    EXPECT_DOUBLE_EQ(p.gravity, -4.0);

    p.merge({{"friction", -0.1}});
    EXPECT_DOUBLE_EQ(p.friction, 0.0);
}

TEST(Params, AsMapKeepsDeclarationOrder) {
    PhysicsParams p;
    p.friction = 0.5;
    const auto map = p.as_map();
    ASSERT_EQ(map.size(), 5u);
    EXPECT_EQ(map[0].first, "gravity");
    EXPECT_EQ(map[1].first, "friction");
    EXPECT_DOUBLE_EQ(map[1].second, 0.5);
    EXPECT_EQ(map[2].first, "elasticity");
    EXPECT_EQ(map[3].first, "time_dilation");
    EXPECT_EQ(map[4].first, "field_strength");

    EXPECT_TRUE(PhysicsParams::is_known_key("time_dilation"));
    EXPECT_FALSE(PhysicsParams::is_known_key("Gravity"));
}

TEST(Modes, PointerModesRoundTripByName) {
    for (PointerMode mode : {PointerMode::Push, PointerMode::Pull, PointerMode::Vortex, PointerMode::Wave}) {
        PointerMode parsed = PointerMode::Push;
        ASSERT_TRUE(parse_pointer_mode(pointer_mode_name(mode), parsed));
        EXPECT_EQ(parsed, mode);
    }
    PointerMode untouched = PointerMode::Vortex;
    EXPECT_FALSE(parse_pointer_mode("PUSH", untouched));
    EXPECT_EQ(untouched, PointerMode::Vortex);
}

TEST(Modes, UnknownPointerModeYieldsInactiveInfluence) {
    const PointerInfluence ok = make_pointer_influence(3.0, 4.0, "pull", true);
    EXPECT_TRUE(ok.active);
    EXPECT_EQ(ok.mode, PointerMode::Pull);
    EXPECT_DOUBLE_EQ(ok.x, 3.0);

    EXPECT_FALSE(make_pointer_influence(3.0, 4.0, "tornado", true).active);
    EXPECT_FALSE(make_pointer_influence(3.0, 4.0, "wave", false).active);
}

TEST(Modes, VisualizationModeNames) {
    VisualizationMode mode = VisualizationMode::Consciousness;
    EXPECT_TRUE(parse_visualization_mode("frequency", mode));
    EXPECT_EQ(mode, VisualizationMode::Frequency);
    EXPECT_STREQ(visualization_mode_name(VisualizationMode::Attention), "attention");
    EXPECT_FALSE(parse_visualization_mode("", mode));
    EXPECT_EQ(mode, VisualizationMode::Frequency);
}

TEST(Clock, ReplayReturnsRequestedDelta) {
    ReplayFrameClock clock;
    EXPECT_DOUBLE_EQ(clock.elapsed(0.016), 0.016);
    EXPECT_DOUBLE_EQ(clock.elapsed(0.5), 0.5);
    EXPECT_DOUBLE_EQ(clock.now(), 0.516);

    EXPECT_DOUBLE_EQ(clock.elapsed(-1.0), 0.0);
    EXPECT_DOUBLE_EQ(clock.elapsed(std::nan("")), 0.0);
    EXPECT_DOUBLE_EQ(clock.now(), 0.516);

    ReplayFrameClock offset(10.0);
    EXPECT_DOUBLE_EQ(offset.now(), 10.0);
}

TEST(Clock, SteadyIgnoresRequestedDelta) {
    auto clock = make_steady_clock();
    clock->elapsed(0.0);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    const double dt = clock->elapsed(1000.0);
    EXPECT_GT(dt, 0.0);
    EXPECT_LT(dt, 1000.0);
    EXPECT_GE(clock->now(), dt);
}
