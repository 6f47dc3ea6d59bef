#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// Plain serialisable views handed to the transport layer.
// Field names are a compatibility contract with existing consumers.

struct EntitySnapshot {
    uint32_t id;
    double x, y;
    double radius;
    double frequency;
    double phase;
    double attention;
    double consciousness_re, consciousness_im;
    int group_id;
    int cluster_id;
    double consciousness_depth;
    double self_awareness;
    double thought_intensity;
    int recursion_level;
};

struct GroupSnapshot {
    int id;
    double center_x, center_y;
    double radius;
    double resonance_coeff;
    size_t entity_count;    // entities inside the boundary at the last membership refresh
};

struct ClusterSnapshot {
    int id;
    std::vector<uint32_t> nodes;    // member entity ids
    double center_x, center_y;
    int recursion_depth;
    double complexity_score;
};

struct AggregateStats {
    double consciousness_magnitude = 0.0;
    double global_resonance = 0.0;
    double average_attention = 0.0;
    double average_phase_degrees = 0.0;
    size_t node_count = 0;
    size_t cluster_count = 0;
    double time = 0.0;
};

struct LatticeSnapshot {
    std::vector<EntitySnapshot> entities;
    std::vector<GroupSnapshot> groups;
    std::vector<ClusterSnapshot> clusters;
    AggregateStats global_stats;
    std::string mode;
    std::vector<std::pair<std::string, double>> params;
    std::vector<double> resonance_weights;
    double time = 0.0;
};
