#pragma once
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Live physics parameters. Every field has a default so callers may send partial updates.
struct PhysicsParams {
    double gravity = 1.0;          // centre attraction, disabled when <= 0
    double friction = 0.99;        // per-60Hz-tick velocity retention
    double elasticity = 0.8;       // wall restitution and repulsion scale
    double time_dilation = 1.0;    // multiplies every entity's dt
    double field_strength = 1.0;   // pointer reach and force scale

    struct MergeResult {
        size_t applied = 0;
        size_t ignored = 0;
        std::vector<std::string> ignored_keys;
    };

    // Apply recognised keys from a partial map, clamped into each field's range
    // (friction in [0, 1], elasticity, time_dilation and field_strength >= 0).
    // Unknown keys and non-finite values are reported as ignored, never stored.
    MergeResult merge(const std::unordered_map<std::string, double>& partial);

    // Current values keyed by their wire names, in declaration order.
    std::vector<std::pair<std::string, double>> as_map() const;

    static bool is_known_key(const std::string& key);
};

enum class PointerMode { Push, Pull, Vortex, Wave };

bool parse_pointer_mode(const std::string& name, PointerMode& out);
const char* pointer_mode_name(PointerMode mode);

// External pointer (mouse/touch) influence applied during an entity update.
struct PointerInfluence {
    double x = 0.0;
    double y = 0.0;
    PointerMode mode = PointerMode::Push;
    bool active = false;
};

// Builds an influence from loosely typed input. An unrecognised mode yields an inactive influence.
PointerInfluence make_pointer_influence(double x, double y, const std::string& mode, bool active);

// Advisory rendering tag reported in snapshots.
enum class VisualizationMode { Consciousness, Attention, Frequency, Temporal, Multiverse };

bool parse_visualization_mode(const std::string& name, VisualizationMode& out);
const char* visualization_mode_name(VisualizationMode mode);
