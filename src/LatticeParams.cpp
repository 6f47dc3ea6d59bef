#include "LatticeParams.h"
#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

namespace {

struct ParamField {
    const char* name;
    double PhysicsParams::* member;
    double min_value;
    double max_value;
};

constexpr double kUnbounded = std::numeric_limits<double>::max();

// Declaration order doubles as snapshot order
constexpr std::array<ParamField, 5> kParamFields{{
    {"gravity",        &PhysicsParams::gravity,        -kUnbounded, kUnbounded},
    {"friction",       &PhysicsParams::friction,       0.0,         1.0},
    {"elasticity",     &PhysicsParams::elasticity,     0.0,         kUnbounded},
    {"time_dilation",  &PhysicsParams::time_dilation,  0.0,         kUnbounded},
    {"field_strength", &PhysicsParams::field_strength, 0.0,         kUnbounded},
}};

constexpr std::array<std::pair<const char*, PointerMode>, 4> kPointerModes{{
    {"push",   PointerMode::Push},
    {"pull",   PointerMode::Pull},
    {"vortex", PointerMode::Vortex},
    {"wave",   PointerMode::Wave},
}};

constexpr std::array<std::pair<const char*, VisualizationMode>, 5> kVisualizationModes{{
    {"consciousness", VisualizationMode::Consciousness},
    {"attention",     VisualizationMode::Attention},
    {"frequency",     VisualizationMode::Frequency},
    {"temporal",      VisualizationMode::Temporal},
    {"multiverse",    VisualizationMode::Multiverse},
}};

} // namespace

PhysicsParams::MergeResult PhysicsParams::merge(const std::unordered_map<std::string, double>& partial) {
    MergeResult result;
    for (const auto& [key, value] : partial) {
        bool matched = false;
        // NaN or infinity would poison every entity it touches, so it never reaches a field
        if (std::isfinite(value)) {
            for (const auto& field : kParamFields) {
                if (key == field.name) {
                    this->*(field.member) = std::clamp(value, field.min_value, field.max_value);
                    matched = true;
                    break;
                }
            }
        }
        if (matched) {
            ++result.applied;
        } else {
            ++result.ignored;
            result.ignored_keys.push_back(key);
        }
    }
    return result;
}

std::vector<std::pair<std::string, double>> PhysicsParams::as_map() const {
    std::vector<std::pair<std::string, double>> out;
    out.reserve(kParamFields.size());
    for (const auto& field : kParamFields) {
        out.emplace_back(field.name, this->*(field.member));
    }
    return out;
}

bool PhysicsParams::is_known_key(const std::string& key) {
    for (const auto& field : kParamFields) {
        if (key == field.name) return true;
    }
    return false;
}

bool parse_pointer_mode(const std::string& name, PointerMode& out) {
    for (const auto& [label, mode] : kPointerModes) {
        if (name == label) {
            out = mode;
            return true;
        }
    }
    return false;
}

const char* pointer_mode_name(PointerMode mode) {
    for (const auto& [label, m] : kPointerModes) {
        if (m == mode) return label;
    }
    return "push";
}

PointerInfluence make_pointer_influence(double x, double y, const std::string& mode, bool active) {
    PointerInfluence influence;
    influence.x = x;
    influence.y = y;
    influence.active = active && parse_pointer_mode(mode, influence.mode);
    return influence;
}

bool parse_visualization_mode(const std::string& name, VisualizationMode& out) {
    for (const auto& [label, mode] : kVisualizationModes) {
        if (name == label) {
            out = mode;
            return true;
        }
    }
    return false;
}

const char* visualization_mode_name(VisualizationMode mode) {
    for (const auto& [label, m] : kVisualizationModes) {
        if (m == mode) return label;
    }
    return "consciousness";
}
