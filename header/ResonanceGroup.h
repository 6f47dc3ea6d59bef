#pragma once
#include "LatticeEntity.h"
#include <vector>

// Circular region that modulates the frequency of entities currently inside it.
// Membership is a per-frame list of indices into the engine's entity arena; the group owns no entities.
class ResonanceGroup {
public:
    ResonanceGroup(int id, const Vector2d& center, double radius, double resonance_weight);

    // Strict inequality: an entity exactly on the boundary is outside
    bool contains(const LatticeEntity& entity) const;

    // Rebuild the membership view from the current entity positions
    void refresh_membership(const std::vector<LatticeEntity>& entities);

    // Refresh membership, then set frequency = base * (1 + weight * 0.2 * sin(time * 0.05)) for each member
    void modulate(std::vector<LatticeEntity>& entities, double time);

    // Multiplier applied to base frequency at the given simulation time
    double modulation_factor(double time) const;

    int id() const { return id_; }
    const Vector2d& center() const { return center_; }
    double radius() const { return radius_; }
    double resonance_weight() const { return resonance_weight_; }
    const std::vector<size_t>& members() const { return members_; }

private:
    int id_;
    Vector2d center_;
    double radius_;
    double resonance_weight_;
    std::vector<size_t> members_;
};

// Draw `count` strictly positive weights summing to 1 (Dirichlet with all alphas = 1)
std::vector<double> sample_resonance_weights(size_t count, LatticeRng& rng);
