#pragma once
#include "LatticeEntity.h"
#include <vector>
#include <deque>

// Ephemeral cluster record, rebuilt from scratch every frame
struct LatticeCluster {
    int id;
    std::vector<size_t> members;     // indices into the entity arena at detection time
    Vector2d centroid;
    // Placeholders carried on the wire, never computed
    int recursion_depth = 0;
    double complexity_score = 0.0;
};

// Connected components over the "close, in phase, similar frequency" relation.
class ClusterDetector {
public:
    struct Config {
        double link_distance;       // strict upper bound on separation
        double phase_tolerance;     // |sin(Δphase)| must stay below this
        double frequency_ratio;     // min/max frequency must exceed this
        size_t min_cluster_size;    // smaller components are not materialised
        double frequency_floor;     // denominator clamp for the ratio test

        Config()
            : link_distance(80.0)
            , phase_tolerance(0.5)
            , frequency_ratio(0.7)
            , min_cluster_size(3)
            , frequency_floor(0.001)
        {}
    };

    explicit ClusterDetector(const Config& config = Config{});

    // Full rebuild. Writes cluster_id on every entity (-1 when unclustered) and returns the clusters
    // with ids in discovery order.
    std::vector<LatticeCluster> detect(std::vector<LatticeEntity>& entities);

    bool linked(const LatticeEntity& a, const LatticeEntity& b) const;

    const Config& config() const { return config_; }

private:
    Config config_;
    // Scratch buffers reused across frames
    std::vector<uint8_t> visited_;
    std::deque<size_t> queue_;
    std::vector<size_t> component_;
};
