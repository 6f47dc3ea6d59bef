#pragma once
#include "LatticeParams.h"
#include <Eigen/Dense>
#include <cstdint>
#include <random>

using Vector2d = Eigen::Vector2d;
using EntityId = uint32_t;
using LatticeRng = std::mt19937_64;

static constexpr double TWO_PI = 6.283185307179586476925286766559;
static constexpr double REFERENCE_HZ = 60.0;   // forces are tuned against a 60 Hz frame

// Reduce any finite angle into [0, 2π)
double wrap_phase(double phase);

// Fixed world rules an entity needs during its own update
struct WorldRules {
    double half_extent = 500.0;             // reflective walls at ±half_extent on each axis
    double tunneling_probability = 0.05;    // chance a wall hit teleports to the opposite wall
    double pointer_reach = 200.0;           // scaled by field_strength
    double attention_sigma = 200.0;
};

// Per-frame inputs shared by every entity update
struct AdvanceContext {
    const PhysicsParams& params;
    const PointerInfluence* pointer;   // nullptr when no pointer this frame
    double wall_time;                  // FrameClock::now(): seconds since engine construction, drives the wave mode
    const WorldRules& rules;
    LatticeRng& rng;
};

// 2-component capability vectors; logic feeds memory, memory feeds processing
struct CapabilityVectors {
    Vector2d logic{0.5, 0.5};
    Vector2d memory{0.5, 0.5};
    Vector2d processing{0.5, 0.5};
    Vector2d creativity{0.5, 0.5};
    Vector2d social{0.5, 0.5};
};

struct LatticeEntity {
    EntityId id = 0;

    Vector2d position{0.0, 0.0};
    Vector2d velocity{0.0, 0.0};
    double radius = 3.0;
    double base_radius = 3.0;

    // Oscillation
    double frequency = 40.0;
    double base_frequency = 40.0;
    double phase = 0.0;          // always in [0, 2π) after advance()
    double attention = 0.0;      // normalised across the collection by the engine

    // attention * frequency * e^(i*phase), recomputed every advance()
    double consciousness_re = 0.0;
    double consciousness_im = 0.0;

    int group_id = 0;
    double resonance_weight = 1.0;   // copied from the group at creation

    CapabilityVectors capabilities;
    double consciousness_depth = 0.0;
    double self_awareness = 0.0;
    double thought_intensity = 0.0;
    // Carried for wire compatibility, no rule writes them
    double adaptive_capacity = 0.0;
    double collective_intelligence = 0.0;
    int recursion_level = 0;

    int cluster_id = -1;

    // Local update rule: oscillation, pointer response, physics, capability evolution, radius
    void advance(double dt, const AdvanceContext& ctx);

    // Un-normalised Gaussian attention density around the origin, in (0, 1]
    double attention_density(double sigma = 200.0) const;
    // log of attention_density(); stays finite where the density itself underflows
    double attention_exponent(double sigma = 200.0) const;

    double consciousness_magnitude() const;

private:
    void apply_pointer(const PointerInfluence& pointer, double dt, const AdvanceContext& ctx);
    void apply_physics(double dt, const AdvanceContext& ctx);
    void handle_boundary_axis(int axis, const AdvanceContext& ctx);
    void evolve_capabilities(double dt, const PhysicsParams& params);
};
