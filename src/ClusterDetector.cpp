#include "ClusterDetector.h"
#include <algorithm>
#include <cmath>

ClusterDetector::ClusterDetector(const Config& config)
    : config_(config) {
}

bool ClusterDetector::linked(const LatticeEntity& a, const LatticeEntity& b) const {
    const double link_sq = config_.link_distance * config_.link_distance;
    if ((a.position - b.position).squaredNorm() >= link_sq) return false;

    if (std::abs(std::sin(a.phase - b.phase)) >= config_.phase_tolerance) return false;

    const double lo = std::min(a.frequency, b.frequency);
    const double hi = std::max(std::max(a.frequency, b.frequency), config_.frequency_floor);
    return lo / hi > config_.frequency_ratio;
}

std::vector<LatticeCluster> ClusterDetector::detect(std::vector<LatticeEntity>& entities) {
    /*
     * Breadth-first flood from every unvisited entity in collection order.
     * The relation is symmetric, so the components (not their ids) are independent
     * of iteration order.
     *
     * INPUTS:  entity positions, phases, frequencies
     * OUTPUTS: cluster_id written on every entity; clusters of size >= min_cluster_size
     */
    const size_t n = entities.size();
    std::vector<LatticeCluster> clusters;

    for (auto& e : entities) e.cluster_id = -1;

    visited_.assign(n, 0);
    for (size_t seed = 0; seed < n; ++seed) {
        if (visited_[seed]) continue;

        component_.clear();
        queue_.clear();
        visited_[seed] = 1;
        component_.push_back(seed);
        queue_.push_back(seed);

        while (!queue_.empty()) {
            const size_t current = queue_.front();
            queue_.pop_front();
            for (size_t j = 0; j < n; ++j) {
                if (visited_[j]) continue;
                if (!linked(entities[current], entities[j])) continue;
                visited_[j] = 1;
                component_.push_back(j);
                queue_.push_back(j);
            }
        }

        if (component_.size() < config_.min_cluster_size) continue;

        LatticeCluster cluster;
        cluster.id = static_cast<int>(clusters.size());
        cluster.members = component_;
        Vector2d sum = Vector2d::Zero();
        for (size_t idx : component_) {
            sum += entities[idx].position;
            entities[idx].cluster_id = cluster.id;
        }
        cluster.centroid = sum / static_cast<double>(component_.size());
        clusters.push_back(std::move(cluster));
    }

    return clusters;
}
