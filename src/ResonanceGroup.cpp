#include "ResonanceGroup.h"
#include <algorithm>
#include <cmath>
#include <limits>

ResonanceGroup::ResonanceGroup(int id, const Vector2d& center, double radius, double resonance_weight)
    : id_(id), center_(center), radius_(radius), resonance_weight_(resonance_weight) {
}

bool ResonanceGroup::contains(const LatticeEntity& entity) const {
    return (entity.position - center_).norm() < radius_;
}

void ResonanceGroup::refresh_membership(const std::vector<LatticeEntity>& entities) {
    members_.clear();
    for (size_t i = 0; i < entities.size(); ++i) {
        if (contains(entities[i])) members_.push_back(i);
    }
}

double ResonanceGroup::modulation_factor(double time) const {
    return 1.0 + resonance_weight_ * 0.2 * std::sin(time * 0.05);
}

void ResonanceGroup::modulate(std::vector<LatticeEntity>& entities, double time) {
    refresh_membership(entities);
    const double factor = modulation_factor(time);
    for (size_t idx : members_) {
        entities[idx].frequency = entities[idx].base_frequency * factor;
    }
}

std::vector<double> sample_resonance_weights(size_t count, LatticeRng& rng) {
    std::vector<double> weights(count, 0.0);
    if (count == 0) return weights;

    // Normalised Gamma(1, 1) draws are Dirichlet(1, ..., 1)
    std::gamma_distribution<double> gamma(1.0, 1.0);
    double total = 0.0;
    for (auto& w : weights) {
        w = std::max(gamma(rng), std::numeric_limits<double>::min());
        total += w;
    }

    if (!(total > 0.0) || !std::isfinite(total)) {
        std::fill(weights.begin(), weights.end(), 1.0 / static_cast<double>(count));
        return weights;
    }
    for (auto& w : weights) w /= total;
    return weights;
}
