#include "LatticeEntity.h"
#include <algorithm>
#include <cmath>

double wrap_phase(double phase) {
    if (!std::isfinite(phase)) return 0.0;
    double wrapped = std::fmod(phase, TWO_PI);
    if (wrapped < 0.0) wrapped += TWO_PI;
    // fmod of a tiny negative value can round back up to exactly 2π
    if (wrapped >= TWO_PI) wrapped = 0.0;
    return wrapped;
}

double LatticeEntity::attention_density(double sigma) const {
    return std::exp(attention_exponent(sigma));
}

double LatticeEntity::attention_exponent(double sigma) const {
    return -position.squaredNorm() / (2.0 * sigma * sigma);
}

double LatticeEntity::consciousness_magnitude() const {
    return std::hypot(consciousness_re, consciousness_im);
}

void LatticeEntity::advance(double dt, const AdvanceContext& ctx) {
    /*
     * One local update, in order:
     *   1. complex value from the current attention/frequency/phase
     *   2. phase advance, reduced into [0, 2π)
     *   3. pointer force (if active and in reach)
     *   4. gravity, integration, friction, walls
     *   5. capability coupling and emergent scalars
     *   6. radius from |complex value|
     *
     * dt arrives undilated; time_dilation is applied here.
     */
    if (!std::isfinite(dt) || dt < 0.0) dt = 0.0;
    dt *= ctx.params.time_dilation;

    const double amplitude = attention * frequency;
    consciousness_re = amplitude * std::cos(phase);
    consciousness_im = amplitude * std::sin(phase);

    phase = wrap_phase(phase + frequency * dt * TWO_PI / 1000.0);

    if (ctx.pointer && ctx.pointer->active) {
        apply_pointer(*ctx.pointer, dt, ctx);
    }

    apply_physics(dt, ctx);
    evolve_capabilities(dt, ctx.params);

    radius = base_radius + consciousness_magnitude() * 0.1;
}

void LatticeEntity::apply_pointer(const PointerInfluence& pointer, double dt, const AdvanceContext& ctx) {
    const Vector2d to_pointer = Vector2d(pointer.x, pointer.y) - position;
    const double distance = to_pointer.norm();
    const double max_distance = ctx.rules.pointer_reach * ctx.params.field_strength;

    // Every mode is directional, so a pointer sitting exactly on the entity does nothing
    if (distance >= max_distance || distance <= 0.0) return;

    const double angle = std::atan2(to_pointer.y(), to_pointer.x());
    const double force = (max_distance - distance) / max_distance * ctx.params.field_strength;
    const double frame_scale = dt * REFERENCE_HZ;
    const Vector2d radial(std::cos(angle), std::sin(angle));

    switch (pointer.mode) {
        case PointerMode::Push:
            velocity -= radial * (force * 0.4 * frame_scale);
            break;
        case PointerMode::Pull:
            velocity += radial * (force * 0.4 * frame_scale);
            break;
        case PointerMode::Vortex: {
            const double tangential = angle + TWO_PI / 4.0;
            velocity += Vector2d(std::cos(tangential), std::sin(tangential)) * (force * 0.5 * frame_scale);
            break;
        }
        case PointerMode::Wave: {
            const double wave_force = std::sin(distance * 0.05 - ctx.wall_time * 10.0) * force;
            velocity += radial * (wave_force * 0.5 * frame_scale);
            break;
        }
    }
}

void LatticeEntity::apply_physics(double dt, const AdvanceContext& ctx) {
    const PhysicsParams& params = ctx.params;
    const double frame_scale = dt * REFERENCE_HZ;

    if (params.gravity > 0.0) {
        const Vector2d to_center = -position;
        const double dist_center = to_center.norm();
        if (dist_center > 10.0) {
            velocity += (to_center / dist_center) * (params.gravity * 0.001 * frame_scale);
        }
    }

    position += velocity * frame_scale;
    velocity *= std::pow(params.friction, frame_scale);

    handle_boundary_axis(0, ctx);
    handle_boundary_axis(1, ctx);
}

void LatticeEntity::handle_boundary_axis(int axis, const AdvanceContext& ctx) {
    const double limit = ctx.rules.half_extent;
    double& p = position[axis];
    double& v = velocity[axis];
    if (p >= -limit && p <= limit) return;

    // The draw only happens on a wall hit so in-bounds frames leave the rng untouched
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    if (unit(ctx.rng) < ctx.rules.tunneling_probability) {
        p = (p < -limit) ? limit : -limit;
        v *= -0.5;
    } else {
        v *= -0.8 * ctx.params.elasticity;
        p = std::clamp(p, -limit, limit);
    }
}

void LatticeEntity::evolve_capabilities(double dt, const PhysicsParams& params) {
    const double evolution_rate = 0.02 * params.time_dilation;

    capabilities.memory += capabilities.logic * (evolution_rate * 0.1);
    capabilities.processing += capabilities.memory * (evolution_rate * 0.15);

    const double logic_mag = capabilities.logic.norm();
    const double memory_mag = capabilities.memory.norm();
    const double processing_mag = capabilities.processing.norm();

    consciousness_depth = std::min(1.0, (logic_mag + memory_mag + processing_mag) / 3.0);
    self_awareness = std::min(1.0, logic_mag * 0.8 + thought_intensity * 0.2);
    thought_intensity = std::max(0.0, thought_intensity - dt * 0.5);
}
