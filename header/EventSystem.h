#pragma once
#include <vector>
#include <unordered_map>
#include <functional>
#include <string>
#include <cstdint>
#include <cstddef>

// Event system for decoupled communication between the engine and its collaborators
class EventBus {
public:
    using EventHandler = std::function<void(const void* data)>;

    template<typename T>
    void subscribe(const std::string& event_type, std::function<void(const T&)> handler) {
        handlers_[event_type].push_back([handler](const void* data) {
            handler(*static_cast<const T*>(data));
        });
    }

    template<typename T>
    void emit(const std::string& event_type, const T& data) {
        auto it = handlers_.find(event_type);
        if (it != handlers_.end()) {
            for (auto& handler : it->second) {
                handler(&data);
            }
        }
    }

    // For testing - check if event type has subscribers
    bool has_subscribers(const std::string& event_type) const {
        auto it = handlers_.find(event_type);
        return it != handlers_.end() && !it->second.empty();
    }

    size_t get_subscriber_count(const std::string& event_type) const {
        auto it = handlers_.find(event_type);
        return it != handlers_.end() ? it->second.size() : 0;
    }

private:
    std::unordered_map<std::string, std::vector<EventHandler>> handlers_;
};

// Lattice events
struct FrameAdvancedEvent {
    double frame_dt;        // clamped elapsed time actually integrated
    size_t node_count;
    size_t cluster_count;
    uint64_t frame_index;
    double time;
};

struct EntityAddedEvent {
    uint32_t id;
    double x, y;
    int group_id;
};

struct EntityRemovedEvent {
    uint32_t id;
    size_t remaining;
};

struct CollapseEvent {
    double x, y;
    size_t affected;
};

struct ParametersChangedEvent {
    size_t applied;
    size_t ignored;
};

struct LatticeResetEvent {
    size_t entity_count;
    size_t group_count;
    uint64_t seed;
};

struct ModeChangedEvent {
    const char* mode;
};

// Event type constants to avoid string typos
namespace Events {
    constexpr const char* FRAME_ADVANCED = "frame_advanced";
    constexpr const char* ENTITY_ADDED = "entity_added";
    constexpr const char* ENTITY_REMOVED = "entity_removed";
    constexpr const char* COLLAPSE_TRIGGERED = "collapse_triggered";
    constexpr const char* PARAMETERS_CHANGED = "parameters_changed";
    constexpr const char* LATTICE_RESET = "lattice_reset";
    constexpr const char* MODE_CHANGED = "mode_changed";
}
